#include <catch2/catch.hpp>

#include "backtester.hpp"
#include "exceptions.hpp"
#include "strategy_factory.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <type_traits>

using namespace backtester;
using test_helpers::day;
namespace fs = std::filesystem;

namespace {

    // Buys `size` on the first bar and closes on the last
    class BuyAndHold : public StrategyBase {
    public:
        explicit BuyAndHold(long long size) : size_(size) {}

        std::string getName() const override { return "BuyAndHold"; }

        void init() override {
            addPlotIndicator("MA10");
            addPlotIndicator("RSI", false);
        }

        void next(std::size_t i) override {
            if (i == 0) {
                REQUIRE(buy(i, size_));
            } else if (i + 1 == data().size()) {
                REQUIRE(close(i));
            }
        }

    private:
        long long size_;
    };

    // Buys on `entry_bar` and never sells
    class HoldToEnd : public StrategyBase {
    public:
        explicit HoldToEnd(std::size_t entry_bar) : entry_bar_(entry_bar) {}

        std::string getName() const override { return "HoldToEnd"; }
        void init() override {}

        void next(std::size_t i) override {
            if (i == entry_bar_) {
                REQUIRE(buy(i, 10));
            }
        }

    private:
        std::size_t entry_bar_;
    };

    class BrokenIndicator : public StrategyBase {
    public:
        std::string getName() const override { return "Broken"; }
        void init() override { indicator("FOO"); }
    };

} // end anonymous namespace

TEST_CASE("Portfolio accounting", "[backtester][portfolio]") {
    Portfolio portfolio(10000.0, 0.01);

    SECTION("Buy cost and sell proceeds include commission") {
        REQUIRE(portfolio.buy(0, day(0), 100.0, 10));
        REQUIRE(portfolio.getCash() == Approx(10000.0 - 1000.0 * 1.01));
        REQUIRE(portfolio.getPosition() == 10);
        REQUIRE(portfolio.getAveragePrice() == Approx(100.0));

        REQUIRE(portfolio.buy(1, day(1), 110.0, 10));
        REQUIRE(portfolio.getAveragePrice() == Approx(105.0));

        REQUIRE(portfolio.sell(2, day(2), 120.0, 20));
        REQUIRE(portfolio.getPosition() == 0);
        REQUIRE(portfolio.getExecutions().size() == 3);

        REQUIRE(portfolio.getTradeLog().size() == 1);
        const auto& trade = portfolio.getTradeLog().front();
        REQUIRE(trade.entry_time == day(0));
        REQUIRE(trade.exit_time == day(2));
        REQUIRE(trade.quantity == 20);
        REQUIRE(trade.entry_price == Approx(105.0));
        REQUIRE(trade.exit_price == Approx(120.0));
        REQUIRE(trade.commission == Approx(10.0 + 11.0 + 24.0));
        REQUIRE(trade.pnl == Approx(2400.0 - 2100.0 - 45.0));
        REQUIRE(portfolio.getCash() == Approx(10000.0 + trade.pnl));
    }

    SECTION("Rejected orders change nothing") {
        REQUIRE_FALSE(portfolio.buy(0, day(0), 100.0, 100));    // 10100 > 10000
        REQUIRE_FALSE(portfolio.buy(0, day(0), 100.0, 0));
        REQUIRE_FALSE(portfolio.sell(0, day(0), 100.0, 1));     // Long-only
        REQUIRE(portfolio.getCash() == Approx(10000.0));
        REQUIRE(portfolio.getExecutions().empty());
    }

    SECTION("Equity curve keeps one point per timestamp") {
        portfolio.recordEquity(day(0), 100.0);
        REQUIRE(portfolio.buy(0, day(0), 100.0, 10));
        portfolio.recordEquity(day(0), 100.0);
        portfolio.recordEquity(day(1), 150.0);
        REQUIRE(portfolio.getEquityCurve().size() == 2);
        REQUIRE(portfolio.getEquityCurve()[1].equity == Approx(portfolio.getCash() + 1500.0));
    }

    SECTION("Open position is reported as a trade without an exit") {
        REQUIRE_FALSE(portfolio.getOpenTrade().has_value());
        REQUIRE(portfolio.buy(4, day(4), 100.0, 10));
        REQUIRE(portfolio.buy(5, day(5), 110.0, 10));
        REQUIRE(portfolio.getTradeLog().empty());

        const auto open_trade = portfolio.getOpenTrade();
        REQUIRE(open_trade.has_value());
        REQUIRE(open_trade->is_open);
        REQUIRE(open_trade->entry_time == day(4));
        REQUIRE(open_trade->entry_price == Approx(105.0));
        REQUIRE(open_trade->quantity == 20);

        REQUIRE(portfolio.sell(6, day(6), 120.0, 20));
        REQUIRE_FALSE(portfolio.getOpenTrade().has_value());
        REQUIRE_FALSE(portfolio.getTradeLog().front().is_open);
    }

    SECTION("Invalid construction") {
        REQUIRE_THROWS_AS(Portfolio(0.0, 0.0), core::BacktestException);
        REQUIRE_THROWS_AS(Portfolio(100.0, -0.1), core::BacktestException);
    }
}

TEST_CASE("Backtest engine metrics", "[backtester][engine]") {
    const auto registry = indicators::IndicatorRegistry::withBuiltins();
    const auto prices = test_helpers::tentPrices(60, 30);   // 100 -> 130 -> 101

    BacktestEngine engine(prices, std::make_unique<BuyAndHold>(10), registry, 10000.0, 0.002);
    REQUIRE_FALSE(engine.hasRun());
    REQUIRE_THROWS_AS(engine.plot(), core::BacktestException);

    const BacktestMetrics metrics = engine.run();
    const double final_cash = 10000.0 - 1000.0 * 1.002 + 1010.0 * 0.998;

    REQUIRE(engine.getPortfolio().getEquityCurve().size() == 60);
    REQUIRE(engine.getPortfolio().getCash() == Approx(final_cash));
    REQUIRE(metrics.executions == 2);
    REQUIRE(metrics.round_trip_trades == 1);
    REQUIRE(metrics.win_rate == Approx(1.0));
    REQUIRE(metrics.return_pct == Approx((final_cash / 9998.0 - 1.0) * 100.0));

    const double peak = 10000.0 - 1002.0 + 1300.0;
    REQUIRE(metrics.max_drawdown_pct == Approx((final_cash / peak - 1.0) * 100.0));
    REQUIRE(metrics.max_drawdown_pct < 0.0);
    REQUIRE(std::isfinite(metrics.sharpe_ratio));
    REQUIRE(std::isfinite(metrics.annualized_return_pct));

    REQUIRE_THROWS_AS(engine.run(), core::BacktestException);

    SECTION("Plotting uses the strategy's plot configuration") {
        const fs::path dir = fs::temp_directory_path() / "strategy_charts_tests" / "engine";
        fs::create_directories(dir);

        const fs::path auto_path = dir / "auto.html";
        fs::remove(auto_path);
        REQUIRE(engine.plot(auto_path.string()) == auto_path.string());
        REQUIRE(fs::exists(auto_path));

        const fs::path legacy_path = dir / "legacy.html";
        fs::remove(legacy_path);
        REQUIRE(engine.plot(legacy_path.string(), false, false) == legacy_path.string());
        REQUIRE(fs::exists(legacy_path));
    }

    SECTION("Plot configuration is per strategy") {
        auto& config = engine.getStrategy().plotConfig();
        REQUIRE(config.requests().size() == 2);
        REQUIRE(config.listEnabled().size() == 1);
    }
}

TEST_CASE("Position held at the end of a run is marked", "[backtester][engine]") {
    const auto registry = indicators::IndicatorRegistry::withBuiltins();
    const auto prices = test_helpers::sinePrices(40);

    BacktestEngine engine(prices, std::make_unique<HoldToEnd>(7), registry);
    engine.run();
    REQUIRE(engine.getMetrics().round_trip_trades == 0);
    REQUIRE(engine.getMetrics().executions == 1);

    const auto trades = engine.plotTrades();
    REQUIRE(trades.size() == 1);
    REQUIRE(trades.front().is_open);

    const auto document = engine.getPlotter().compose(prices, trades, engine.getPortfolio().getEquityCurve(),
                                                      engine.getStrategy().plotConfig());
    REQUIRE(document.markers.size() == 1);
    REQUIRE(document.markers.front().is_buy);
    REQUIRE(document.markers.front().bar_index == 7);
    REQUIRE(document.markers.front().price == Approx(prices[7].close));

    const fs::path dir = fs::temp_directory_path() / "strategy_charts_tests" / "engine";
    fs::create_directories(dir);
    const fs::path legacy_path = dir / "open_position_legacy.html";
    fs::remove(legacy_path);
    REQUIRE(engine.plot(legacy_path.string(), false, false) == legacy_path.string());
    REQUIRE(fs::exists(legacy_path));
}

TEST_CASE("Backtest engine construction errors", "[backtester][engine]") {
    const auto registry = indicators::IndicatorRegistry::withBuiltins();
    const auto prices = test_helpers::sinePrices(30);

    STATIC_REQUIRE_FALSE(std::is_copy_constructible<BacktestEngine>::value);
    STATIC_REQUIRE_FALSE(std::is_move_constructible<BacktestEngine>::value);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable<BacktestEngine>::value);
    STATIC_REQUIRE_FALSE(std::is_move_assignable<BacktestEngine>::value);

    REQUIRE_THROWS_AS(BacktestEngine(prices, nullptr, registry), core::BacktestException);
    REQUIRE_THROWS_AS(BacktestEngine(core::PriceSeries{}, std::make_unique<BuyAndHold>(1), registry),
                      core::BacktestException);
    REQUIRE_THROWS_AS(BacktestEngine(prices, std::make_unique<BrokenIndicator>(), registry), core::UnknownIndicator);
}

TEST_CASE("Strategy factory", "[backtester][factory]") {
    SECTION("Creates SMACross with defaults") {
        auto strategy = StrategyFactory::createStrategy(json{{"strategy", "SMACross"}});
        REQUIRE(strategy->getName() == "SMACross");
        auto* cross = dynamic_cast<SmaCrossStrategy*>(strategy.get());
        REQUIRE(cross != nullptr);
        REQUIRE(cross->fastPeriod() == 52);
        REQUIRE(cross->slowPeriod() == 104);
    }

    SECTION("Rejects bad configurations") {
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy(json{{"strategy", "Momentum"}}), core::ConfigException);
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy(json::object()), core::ConfigException);
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy("SMACross", json{{"n1", 30}, {"n2", 10}}), core::ConfigException);
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy("SMACross", json{{"n1", "ten"}}), core::ConfigException);
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy("SMACross", json{{"fraction", 1.5}}), core::ConfigException);
    }

    SECTION("SMACross trades the sine wave and declares its moving averages") {
        const auto registry = indicators::IndicatorRegistry::withBuiltins();
        auto strategy = StrategyFactory::createStrategy("SMACross",
            json{{"n1", 5}, {"n2", 15}, {"fraction", 0.5}, {"lot_size", 1}});
        BacktestEngine engine(test_helpers::sinePrices(200), std::move(strategy), registry, 100000.0, 0.002);
        const auto metrics = engine.run();

        REQUIRE(metrics.executions > 0);
        REQUIRE(metrics.round_trip_trades > 0);
        REQUIRE(engine.getPortfolio().getPosition() >= 0);

        const auto& requests = engine.getStrategy().plotConfig().requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[0].name == "EMA5");
        REQUIRE(requests[1].name == "EMA15");
    }

    REQUIRE(StrategyFactory::availableStrategies().count("SMACross") == 1);
}
