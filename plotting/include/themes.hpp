#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace plotting {

    using json = nlohmann::json;

    // Concrete styling consumed by the renderers. Every field is set.
    struct PlotTheme {
        std::string name = "light";
        std::string width = "100%";
        std::string height = "800px";

        std::string up_color = "#ec0000";
        std::string down_color = "#00da3c";
        std::string background_color = "#ffffff";
        std::string grid_color = "#e0e0e0";
        std::string text_color = "#000000";

        std::string buy_color = "#00da3c";
        std::string sell_color = "#ec0000";
        std::string buy_symbol = "triangle";
        std::string sell_symbol = "pin";

        std::map<std::string, std::string> ma_colors;          // Series label -> color
        std::map<std::string, std::string> indicator_colors;
    };

    // User-supplied overrides. Unset fields inherit from the light theme one field at a time;
    // map entries merge per key over the light theme's maps.
    struct CustomTheme {
        std::optional<std::string> name;
        std::optional<std::string> width;
        std::optional<std::string> height;
        std::optional<std::string> up_color;
        std::optional<std::string> down_color;
        std::optional<std::string> background_color;
        std::optional<std::string> grid_color;
        std::optional<std::string> text_color;
        std::optional<std::string> buy_color;
        std::optional<std::string> sell_color;
        std::optional<std::string> buy_symbol;
        std::optional<std::string> sell_symbol;
        std::map<std::string, std::string> ma_colors;
        std::map<std::string, std::string> indicator_colors;
    };

    // Either a built-in theme name ("light", "dark") or a custom theme
    using ThemeSpecifier = std::variant<std::string, CustomTheme>;

    class ThemeResolver {
    public:
        static PlotTheme light();
        static PlotTheme dark();

        // Throws core::UnknownTheme for a name outside the built-in set
        PlotTheme resolve(const ThemeSpecifier& specifier) const;
    };

    // Convenience wrapper around ThemeResolver{}.resolve()
    PlotTheme resolveTheme(const ThemeSpecifier& specifier);

    // A JSON string becomes a name, a JSON object a CustomTheme.
    // Throws core::ConfigException on other types, unknown keys or non-string values.
    ThemeSpecifier themeSpecifierFromJson(const json& value);

} // namespace plotting
