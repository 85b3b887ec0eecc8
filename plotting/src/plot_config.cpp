#include "plot_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <iterator>
#include <utility>

namespace plotting {

    void PlotConfigStore::configureTheme(ThemeSpecifier theme) {
        theme_ = std::move(theme);
    }

    std::vector<IndicatorRequest>::iterator PlotConfigStore::findRequest(const std::string& name) {
        return std::find_if(requests_.begin(), requests_.end(),
                            [&name](const IndicatorRequest& request) { return request.name == name; });
    }

    void PlotConfigStore::addIndicator(const std::string& name, bool enabled, const json& params) {
        if (!params.is_object()) {
            throw core::InvalidParameter(name, "params", "parameters must be a JSON object");
        }
        auto it = findRequest(name);
        if (it != requests_.end()) {
            core::logging::getLogger()->debug("Replacing plot indicator '{}'", name);
            it->params = params;
            it->enabled = enabled;
            return;
        }
        core::logging::getLogger()->debug("Adding plot indicator '{}' (enabled={})", name, enabled);
        requests_.push_back(IndicatorRequest{name, params, enabled});
    }

    void PlotConfigStore::removeIndicator(const std::string& name) {
        auto it = findRequest(name);
        if (it != requests_.end()) {
            requests_.erase(it);
        }
    }

    void PlotConfigStore::enableIndicator(const std::string& name, bool enabled) {
        auto it = findRequest(name);
        if (it == requests_.end()) {
            throw core::UnknownRequest(name);
        }
        it->enabled = enabled;
    }

    std::vector<IndicatorRequest> PlotConfigStore::listEnabled() const {
        std::vector<IndicatorRequest> enabled;
        std::copy_if(requests_.begin(), requests_.end(), std::back_inserter(enabled),
                     [](const IndicatorRequest& request) { return request.enabled; });
        return enabled;
    }

    void PlotConfigStore::applyJson(const json& plot_config) {
        if (!plot_config.is_object()) {
            throw core::ConfigException("'plot' must be an object");
        }
        if (plot_config.contains("theme")) {
            configureTheme(themeSpecifierFromJson(plot_config.at("theme")));
        }
        if (!plot_config.contains("indicators")) {
            return;
        }
        const json& indicators = plot_config.at("indicators");
        if (!indicators.is_array()) {
            throw core::ConfigException("'plot.indicators' must be an array");
        }
        for (std::size_t i = 0; i < indicators.size(); ++i) {
            const json& entry = indicators[i];
            if (!entry.is_object() || !entry.contains("name") || !entry.at("name").is_string()) {
                throw core::ConfigException(fmt::format("'plot.indicators[{}].name' must be a string", i));
            }
            bool enabled = true;
            if (entry.contains("enabled")) {
                if (!entry.at("enabled").is_boolean()) {
                    throw core::ConfigException(fmt::format("'plot.indicators[{}].enabled' must be a boolean", i));
                }
                enabled = entry.at("enabled").get<bool>();
            }
            json params = entry.value("params", json::object());
            if (!params.is_object()) {
                throw core::ConfigException(fmt::format("'plot.indicators[{}].params' must be an object", i));
            }
            addIndicator(entry.at("name").get<std::string>(), enabled, params);
        }
    }

} // namespace plotting
