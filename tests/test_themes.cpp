#include <catch2/catch.hpp>

#include "exceptions.hpp"
#include "themes.hpp"

using namespace plotting;

TEST_CASE("Built-in themes", "[plotting][themes]") {
    SECTION("Light") {
        auto theme = resolveTheme(std::string("light"));
        REQUIRE(theme.name == "light");
        REQUIRE(theme.background_color == "#ffffff");
        REQUIRE(theme.up_color == "#ec0000");
        REQUIRE(theme.down_color == "#00da3c");
        REQUIRE(theme.ma_colors.at("MA20") == "#45B7D1");
    }

    SECTION("Dark differs only in background, grid and text") {
        auto light = ThemeResolver::light();
        auto dark = resolveTheme(std::string("Dark"));
        REQUIRE(dark.name == "dark");
        REQUIRE(dark.background_color == "#1f1f1f");
        REQUIRE(dark.text_color == "#ffffff");
        REQUIRE(dark.up_color == light.up_color);
        REQUIRE(dark.indicator_colors == light.indicator_colors);
    }

    SECTION("Unknown names throw UnknownTheme") {
        try {
            resolveTheme(std::string("solarized"));
            FAIL("expected UnknownTheme");
        } catch (const core::UnknownTheme& e) {
            REQUIRE(e.name() == "solarized");
        }
    }
}

TEST_CASE("Custom themes inherit from light field by field", "[plotting][themes]") {
    const auto light = ThemeResolver::light();

    SECTION("A single override leaves every other field at its light value") {
        CustomTheme custom;
        custom.up_color = "#123456";
        auto theme = resolveTheme(custom);
        REQUIRE(theme.up_color == "#123456");
        REQUIRE(theme.name == "custom");
        REQUIRE(theme.down_color == light.down_color);
        REQUIRE(theme.background_color == light.background_color);
        REQUIRE(theme.grid_color == light.grid_color);
        REQUIRE(theme.text_color == light.text_color);
        REQUIRE(theme.buy_symbol == light.buy_symbol);
        REQUIRE(theme.width == light.width);
        REQUIRE(theme.height == light.height);
        REQUIRE(theme.ma_colors == light.ma_colors);
        REQUIRE(theme.indicator_colors == light.indicator_colors);
    }

    SECTION("Color maps merge per key") {
        CustomTheme custom;
        custom.ma_colors = {{"MA20", "#000001"}, {"MA200", "#000002"}};
        auto theme = resolveTheme(custom);
        REQUIRE(theme.ma_colors.at("MA20") == "#000001");
        REQUIRE(theme.ma_colors.at("MA200") == "#000002");
        REQUIRE(theme.ma_colors.at("MA5") == light.ma_colors.at("MA5"));
    }
}

TEST_CASE("Theme specifiers from JSON", "[plotting][themes]") {
    SECTION("String is a name") {
        auto spec = themeSpecifierFromJson(json("dark"));
        REQUIRE(std::get<std::string>(spec) == "dark");
    }

    SECTION("Object is a custom theme") {
        auto spec = themeSpecifierFromJson(json{{"background_color", "#000000"}, {"ma_colors", {{"MA20", "#abcdef"}}}});
        const auto& custom = std::get<CustomTheme>(spec);
        REQUIRE(custom.background_color == std::string("#000000"));
        REQUIRE(custom.ma_colors.at("MA20") == "#abcdef");
        REQUIRE_FALSE(custom.up_color.has_value());
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(themeSpecifierFromJson(json(3)), core::ConfigException);
        REQUIRE_THROWS_AS(themeSpecifierFromJson(json{{"colour", "#fff"}}), core::ConfigException);
        REQUIRE_THROWS_AS(themeSpecifierFromJson(json{{"up_color", 5}}), core::ConfigException);
        REQUIRE_THROWS_AS(themeSpecifierFromJson(json{{"ma_colors", "red"}}), core::ConfigException);
    }
}
