#include <catch2/catch.hpp>

#include "exceptions.hpp"
#include "indicator_calculator.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <numeric>

using namespace indicators;
using test_helpers::countNaN;

TEST_CASE("Moving averages", "[indicators][calculator]") {
    const auto registry = IndicatorRegistry::withBuiltins();
    IndicatorCalculator calculator(registry);
    const auto prices = test_helpers::sinePrices(100);
    const auto close = prices.column(core::PriceColumn::Close);

    SECTION("MA20 is the trailing mean with a 19-bar NaN prefix") {
        auto series = calculator.compute(prices, "MA20");
        REQUIRE(series.name == "MA20");
        REQUIRE(series.lines.size() == 1);
        const auto& values = series.lines.front().values;
        REQUIRE(values.size() == prices.size());
        REQUIRE(countNaN(values) == 19);
        REQUIRE(series.lines.front().label == "MA20");

        for (std::size_t i : {std::size_t{19}, std::size_t{50}, std::size_t{99}}) {
            const double mean = std::accumulate(close.begin() + static_cast<long>(i) - 19,
                                                close.begin() + static_cast<long>(i) + 1, 0.0) / 20.0;
            REQUIRE(values[i] == Approx(mean));
        }
    }

    SECTION("SMA(10) call form") {
        auto series = calculator.compute(prices, "SMA(10)");
        REQUIRE(countNaN(series.lines.front().values) == 9);
    }

    SECTION("Explicit params override the name") {
        auto series = calculator.compute(prices, "MA5", json{{"period", 30}});
        REQUIRE(countNaN(series.lines.front().values) == 29);
        REQUIRE(series.name == "MA5");
    }

    SECTION("EMA defined after its lookback") {
        auto values = calculator.compute(prices, "EMA12").lines.front().values;
        REQUIRE(countNaN(values) == 11);
        REQUIRE(std::isfinite(values.back()));
    }

    SECTION("Identical inputs give identical outputs") {
        auto first = calculator.compute(prices, "EMA20").lines.front().values;
        auto second = calculator.compute(prices, "EMA20").lines.front().values;
        for (std::size_t i = 19; i < first.size(); ++i) {
            REQUIRE(first[i] == second[i]);
        }
    }
}

TEST_CASE("Oscillators and bands", "[indicators][calculator]") {
    const auto registry = IndicatorRegistry::withBuiltins();
    IndicatorCalculator calculator(registry);
    const auto prices = test_helpers::sinePrices(100);

    SECTION("RSI leaves its first 14 values undefined and stays within 0..100") {
        const auto& values = calculator.compute(prices, "RSI").lines.front().values;
        REQUIRE(countNaN(values) == 14);
        for (std::size_t i = 14; i < values.size(); ++i) {
            REQUIRE(values[i] >= 0.0);
            REQUIRE(values[i] <= 100.0);
        }
    }

    SECTION("MACD histogram is macd minus signal") {
        auto series = calculator.compute(prices, "MACD");
        REQUIRE(series.lines.size() == 3);
        const auto& macd = series.line("MACD").values;
        const auto& signal = series.line("MACD_signal").values;
        const auto& hist = series.line("MACD_hist").values;
        REQUIRE(series.line("MACD_hist").plot_type == PlotType::Bar);
        std::size_t defined = 0;
        for (std::size_t i = 0; i < hist.size(); ++i) {
            if (std::isnan(hist[i])) continue;
            ++defined;
            REQUIRE(hist[i] == Approx(macd[i] - signal[i]).margin(1e-9));
        }
        REQUIRE(defined > 0);
    }

    SECTION("Bollinger bands collapse on constant prices") {
        const auto flat = test_helpers::constantPrices(40, 50.0);
        auto series = calculator.compute(flat, "BOLL");
        const auto& upper = series.line("BOLL_upper").values;
        const auto& middle = series.line("BOLL_middle").values;
        const auto& lower = series.line("BOLL_lower").values;
        REQUIRE(countNaN(middle) == 19);
        for (std::size_t i = 19; i < middle.size(); ++i) {
            REQUIRE(middle[i] == Approx(50.0));
            REQUIRE(upper[i] == Approx(middle[i]).margin(1e-6));
            REQUIRE(lower[i] == Approx(middle[i]).margin(1e-6));
        }
    }

    SECTION("Bollinger bands are ordered on moving prices") {
        auto series = calculator.compute(prices, "BOLL", json{{"period", 10}, {"std", 1.5}});
        const auto& upper = series.lines[0].values;
        const auto& middle = series.lines[1].values;
        const auto& lower = series.lines[2].values;
        for (std::size_t i = 9; i < middle.size(); ++i) {
            REQUIRE(upper[i] >= middle[i]);
            REQUIRE(middle[i] >= lower[i]);
        }
    }

    SECTION("KDJ J line is 3K - 2D") {
        auto series = calculator.compute(prices, "KDJ");
        const auto& k = series.line("KDJ_K").values;
        const auto& d = series.line("KDJ_D").values;
        const auto& j = series.line("KDJ_J").values;
        for (std::size_t i = 0; i < j.size(); ++i) {
            if (std::isnan(j[i])) continue;
            REQUIRE(j[i] == Approx(3.0 * k[i] - 2.0 * d[i]));
        }
        REQUIRE(std::isfinite(j.back()));
    }

    SECTION("STOCH smooths %K and %D over d_period") {
        auto defaults = calculator.compute(prices, "STOCH");
        REQUIRE(countNaN(defaults.line("STOCH_K").values) == 13 + 2 + 2);

        auto series = calculator.compute(prices, "STOCH", json{{"d_period", 5}});
        const auto& k = series.line("STOCH_K").values;
        const auto& d = series.line("STOCH_D").values;
        REQUIRE(countNaN(k) == 13 + 4 + 4);
        REQUIRE(countNaN(d) == 13 + 4 + 4);
        REQUIRE(k.back() >= 0.0);
        REQUIRE(k.back() <= 100.0);
    }

    SECTION("ATR and Williams %R") {
        const auto& atr = calculator.compute(prices, "ATR").lines.front().values;
        REQUIRE(countNaN(atr) == 14);
        REQUIRE(atr.back() > 0.0);

        const auto& willr = calculator.compute(prices, "WILLR").lines.front().values;
        REQUIRE(willr.back() <= 0.0);
        REQUIRE(willr.back() >= -100.0);
    }

    SECTION("VOL copies the volume column") {
        auto series = calculator.compute(prices, "VOL");
        REQUIRE(series.lines.front().label == "Volume");
        REQUIRE(series.lines.front().values[3] == Approx(static_cast<double>(prices[3].volume)));
    }
}

TEST_CASE("Calculator errors", "[indicators][calculator]") {
    const auto registry = IndicatorRegistry::withBuiltins();
    IndicatorCalculator calculator(registry);
    const auto prices = test_helpers::sinePrices(60);

    SECTION("Unknown indicator") {
        REQUIRE_THROWS_AS(calculator.compute(prices, "FOO"), core::UnknownIndicator);
        REQUIRE_THROWS_AS(calculator.compute(prices, "FOO20"), core::UnknownIndicator);
    }

    SECTION("Missing input column") {
        const auto close_only = test_helpers::sinePrices(60, {core::PriceColumn::Close});
        try {
            calculator.compute(close_only, "KDJ");
            FAIL("expected MissingInputColumn");
        } catch (const core::MissingInputColumn& e) {
            REQUIRE(e.name() == "KDJ");
            REQUIRE(e.column() == "High");
        }
        REQUIRE_NOTHROW(calculator.compute(close_only, "MA10"));
    }

    SECTION("Invalid parameter") {
        REQUIRE_THROWS_AS(calculator.compute(prices, "RSI", json{{"period", -3}}), core::InvalidParameter);
    }

    SECTION("Empty prices give empty output") {
        const core::PriceSeries empty;
        auto series = calculator.compute(empty, "MA20");
        REQUIRE(series.size() == 0);
    }

    SECTION("Full-name registration wins over name parsing") {
        auto custom_registry = IndicatorRegistry::withBuiltins();
        IndicatorDefinition definition = custom_registry.lookup("EMA");
        definition.name = "MA20";
        definition.default_params = {{"period", 3}};
        custom_registry.registerIndicator(definition);
        IndicatorCalculator custom_calculator(custom_registry);
        REQUIRE(countNaN(custom_calculator.compute(prices, "MA20").lines.front().values) == 2);
    }
}
