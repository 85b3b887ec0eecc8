#include "themes.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>

namespace plotting {

    namespace {

        std::map<std::string, std::string> defaultMaColors() {
            return {
                {"MA5", "#FF6B6B"},
                {"MA10", "#4ECDC4"},
                {"MA20", "#45B7D1"},
                {"MA30", "#96CEB4"},
                {"MA60", "#FFEAA7"},
                {"EMA12", "#DDA0DD"},
                {"EMA26", "#98D8C8"}
            };
        }

        std::map<std::string, std::string> defaultIndicatorColors() {
            return {
                {"MACD", "#FF6B6B"},
                {"MACD_signal", "#4ECDC4"},
                {"MACD_hist", "#45B7D1"},
                {"RSI", "#FF6B6B"},
                {"RSI_30", "#CCCCCC"},
                {"RSI_70", "#CCCCCC"},
                {"BOLL_upper", "#DDA0DD"},
                {"BOLL_middle", "#98D8C8"},
                {"BOLL_lower", "#DDA0DD"},
                {"KDJ_K", "#FF6B6B"},
                {"KDJ_D", "#4ECDC4"},
                {"KDJ_J", "#45B7D1"}
            };
        }

        void overlay(std::string& field, const std::optional<std::string>& value) {
            if (value) {
                field = *value;
            }
        }

        void overlay(std::map<std::string, std::string>& field, const std::map<std::string, std::string>& values) {
            for (const auto& entry : values) {
                field[entry.first] = entry.second;
            }
        }

        std::string stringField(const json& value, const std::string& key) {
            if (!value.is_string()) {
                throw core::ConfigException(fmt::format("Theme field '{}' must be a string, got {}", key, value.type_name()));
            }
            return value.get<std::string>();
        }

        std::map<std::string, std::string> colorMap(const json& value, const std::string& key) {
            if (!value.is_object()) {
                throw core::ConfigException(fmt::format("Theme field '{}' must be an object of label -> color", key));
            }
            std::map<std::string, std::string> colors;
            for (auto it = value.begin(); it != value.end(); ++it) {
                colors[it.key()] = stringField(it.value(), key + "." + it.key());
            }
            return colors;
        }

    } // end anonymous namespace

    PlotTheme ThemeResolver::light() {
        PlotTheme theme;
        theme.ma_colors = defaultMaColors();
        theme.indicator_colors = defaultIndicatorColors();
        return theme;
    }

    PlotTheme ThemeResolver::dark() {
        PlotTheme theme = light();
        theme.name = "dark";
        theme.background_color = "#1f1f1f";
        theme.grid_color = "#404040";
        theme.text_color = "#ffffff";
        return theme;
    }

    PlotTheme ThemeResolver::resolve(const ThemeSpecifier& specifier) const {
        if (const auto* name = std::get_if<std::string>(&specifier)) {
            const std::string key = core::utils::toLower(core::utils::trim(*name));
            if (key == "light") return light();
            if (key == "dark") return dark();
            core::logging::getLogger()->error("Theme '{}' is not a built-in theme", *name);
            throw core::UnknownTheme(*name);
        }

        const CustomTheme& custom = std::get<CustomTheme>(specifier);
        PlotTheme theme = light();
        theme.name = "custom";
        overlay(theme.name, custom.name);
        overlay(theme.width, custom.width);
        overlay(theme.height, custom.height);
        overlay(theme.up_color, custom.up_color);
        overlay(theme.down_color, custom.down_color);
        overlay(theme.background_color, custom.background_color);
        overlay(theme.grid_color, custom.grid_color);
        overlay(theme.text_color, custom.text_color);
        overlay(theme.buy_color, custom.buy_color);
        overlay(theme.sell_color, custom.sell_color);
        overlay(theme.buy_symbol, custom.buy_symbol);
        overlay(theme.sell_symbol, custom.sell_symbol);
        overlay(theme.ma_colors, custom.ma_colors);
        overlay(theme.indicator_colors, custom.indicator_colors);
        return theme;
    }

    PlotTheme resolveTheme(const ThemeSpecifier& specifier) {
        return ThemeResolver{}.resolve(specifier);
    }

    ThemeSpecifier themeSpecifierFromJson(const json& value) {
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (!value.is_object()) {
            throw core::ConfigException(fmt::format("'theme' must be a name or an object, got {}", value.type_name()));
        }

        CustomTheme custom;
        const std::map<std::string, std::optional<std::string>*> fields = {
            {"name", &custom.name},
            {"width", &custom.width},
            {"height", &custom.height},
            {"up_color", &custom.up_color},
            {"down_color", &custom.down_color},
            {"background_color", &custom.background_color},
            {"grid_color", &custom.grid_color},
            {"text_color", &custom.text_color},
            {"buy_color", &custom.buy_color},
            {"sell_color", &custom.sell_color},
            {"buy_symbol", &custom.buy_symbol},
            {"sell_symbol", &custom.sell_symbol}
        };
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it.key() == "ma_colors") {
                custom.ma_colors = colorMap(it.value(), it.key());
                continue;
            }
            if (it.key() == "indicator_colors") {
                custom.indicator_colors = colorMap(it.value(), it.key());
                continue;
            }
            auto field = fields.find(it.key());
            if (field == fields.end()) {
                throw core::ConfigException(fmt::format("Unknown theme field '{}'", it.key()));
            }
            *field->second = stringField(it.value(), it.key());
        }
        return custom;
    }

} // namespace plotting
