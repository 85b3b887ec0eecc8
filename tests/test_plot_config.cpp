#include <catch2/catch.hpp>

#include "exceptions.hpp"
#include "plot_config.hpp"

#include <algorithm>
#include <iterator>

using namespace plotting;

namespace {

    std::vector<std::string> names(const std::vector<IndicatorRequest>& requests) {
        std::vector<std::string> result;
        std::transform(requests.begin(), requests.end(), std::back_inserter(result),
                       [](const IndicatorRequest& request) { return request.name; });
        return result;
    }

} // end anonymous namespace

TEST_CASE("PlotConfigStore keeps requests in insertion order", "[plotting][config]") {
    PlotConfigStore store;
    store.addIndicator("MA20");
    store.addIndicator("RSI", true, json{{"period", 14}});
    store.addIndicator("KDJ", false);

    SECTION("listEnabled skips disabled requests") {
        REQUIRE(names(store.listEnabled()) == std::vector<std::string>{"MA20", "RSI"});
        REQUIRE(store.requests().size() == 3);
    }

    SECTION("Re-adding replaces in place") {
        store.addIndicator("MA20", true, json{{"period", 30}});
        REQUIRE(names(store.listEnabled()) == std::vector<std::string>{"MA20", "RSI"});
        REQUIRE(store.listEnabled().front().params.at("period") == 30);
    }

    SECTION("Enable and disable") {
        store.enableIndicator("KDJ");
        store.enableIndicator("MA20", false);
        REQUIRE(names(store.listEnabled()) == std::vector<std::string>{"RSI", "KDJ"});
    }

    SECTION("Enabling an unknown request throws UnknownRequest") {
        REQUIRE_THROWS_AS(store.enableIndicator("MACD"), core::UnknownRequest);
    }

    SECTION("Removing an absent name is a no-op") {
        REQUIRE_NOTHROW(store.removeIndicator("MACD"));
        REQUIRE(store.requests().size() == 3);
    }

    SECTION("Params must be an object") {
        REQUIRE_THROWS_AS(store.addIndicator("EMA", true, json(5)), core::InvalidParameter);
    }
}

TEST_CASE("Add then remove leaves an empty store", "[plotting][config]") {
    PlotConfigStore store;
    store.addIndicator("BOLL");
    store.removeIndicator("BOLL");
    REQUIRE(store.listEnabled().empty());
    REQUIRE(store.requests().empty());
}

TEST_CASE("Theme configuration: last call wins", "[plotting][config]") {
    PlotConfigStore store;
    REQUIRE_FALSE(store.theme().has_value());
    store.configureTheme(std::string("dark"));
    CustomTheme custom;
    custom.up_color = "#111111";
    store.configureTheme(custom);
    REQUIRE(std::holds_alternative<CustomTheme>(*store.theme()));
}

TEST_CASE("PlotConfigStore::applyJson", "[plotting][config]") {
    PlotConfigStore store;
    store.addIndicator("MA20", true, json{{"period", 10}});

    SECTION("Applies theme and indicators, replacing existing entries") {
        store.applyJson(json::parse(R"({
            "theme": "dark",
            "renderer": "auto",
            "indicators": [
                {"name": "MA20", "enabled": true, "params": {"period": 20}},
                {"name": "RSI", "params": {"period": 14}},
                {"name": "KDJ", "enabled": false}
            ]
        })"));
        REQUIRE(std::get<std::string>(*store.theme()) == "dark");
        REQUIRE(store.requests().size() == 3);
        REQUIRE(store.requests()[0].params.at("period") == 20);
        REQUIRE(names(store.listEnabled()) == std::vector<std::string>{"MA20", "RSI"});
    }

    SECTION("Errors name the offending entry") {
        REQUIRE_THROWS_WITH(store.applyJson(json{{"indicators", json::array({json{{"enabled", true}}})}}),
                            Catch::Contains("indicators[0].name"));
        REQUIRE_THROWS_AS(store.applyJson(json{{"indicators", "MA20"}}), core::ConfigException);
        REQUIRE_THROWS_AS(store.applyJson(json{{"indicators", json::array({json{{"name", "RSI"}, {"enabled", "yes"}}})}}),
                          core::ConfigException);
        REQUIRE_THROWS_AS(store.applyJson(json::array()), core::ConfigException);
    }
}
