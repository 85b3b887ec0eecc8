#pragma once

#include "themes.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace plotting {

    using json = nlohmann::json;

    // One declared indicator. Identity is the name exactly as given ("MA20").
    struct IndicatorRequest {
        std::string name;
        json params = json::object();
        bool enabled = true;
    };

    // Per-strategy, ordered collection of indicator requests plus the strategy's theme.
    // Not shared between strategies.
    class PlotConfigStore {
    public:
        // Last call wins
        void configureTheme(ThemeSpecifier theme);

        // Inserts, or replaces an existing request of the same name in place.
        void addIndicator(const std::string& name, bool enabled = true, const json& params = json::object());

        // No-op when absent
        void removeIndicator(const std::string& name);

        // Throws core::UnknownRequest when the name was never added
        void enableIndicator(const std::string& name, bool enabled = true);

        // Enabled requests in insertion order
        std::vector<IndicatorRequest> listEnabled() const;
        const std::vector<IndicatorRequest>& requests() const { return requests_; }

        const std::optional<ThemeSpecifier>& theme() const { return theme_; }

        // Applies a "plot" config block: "theme" and "indicators" [{name, enabled, params}].
        // Throws core::ConfigException naming the offending key.
        void applyJson(const json& plot_config);

    private:
        std::vector<IndicatorRequest>::iterator findRequest(const std::string& name);

        std::vector<IndicatorRequest> requests_;
        std::optional<ThemeSpecifier> theme_;
    };

} // namespace plotting
