#pragma once

#include <memory>
#include <string>
#include <vector>

// Required project headers (use short paths)
#include "auto_plotter.hpp"
#include "datatypes.hpp"
#include "indicator_calculator.hpp"
#include "indicator_registry.hpp"
#include "portfolio.hpp"
#include "strategy_base.hpp"

namespace backtester {

    class BacktestEngine {
    public:
        // Attaches the strategy to the data and a fresh portfolio, then calls its init().
        // The registry must outlive the engine.
        BacktestEngine(core::PriceSeries data,
                       std::unique_ptr<StrategyBase> strategy,
                       const indicators::IndicatorRegistry& registry,
                       double cash = 10000.0,
                       double commission = 0.002);

        // The strategy holds pointers into this engine's data and calculator
        BacktestEngine(const BacktestEngine&) = delete;
        BacktestEngine& operator=(const BacktestEngine&) = delete;
        BacktestEngine(BacktestEngine&&) = delete;
        BacktestEngine& operator=(BacktestEngine&&) = delete;

        // Steps the strategy over every bar and returns the metrics.
        // Throws core::BacktestException if called twice.
        BacktestMetrics run();

        // Renders the last run. Composer path when use_auto_plotter is true, legacy
        // path otherwise. Empty filename = renderer default; empty title = strategy name.
        // Throws core::BacktestException if run() has not been called.
        std::string plot(const std::string& filename = "",
                         bool show = false,
                         bool use_auto_plotter = true,
                         const std::string& title = "");

        // Completed round trips followed by the position still open at the end, if any
        std::vector<core::Trade> plotTrades() const;

        bool hasRun() const { return has_run_; }
        const BacktestMetrics& getMetrics() const { return metrics_; }
        const Portfolio& getPortfolio() const { return *portfolio_; }
        const core::PriceSeries& getData() const { return data_; }
        StrategyBase& getStrategy() { return *strategy_; }
        plotting::AutoPlotter& getPlotter() { return plotter_; }

    private:
        void calculateMetrics();

        core::PriceSeries data_;
        std::unique_ptr<StrategyBase> strategy_;
        indicators::IndicatorCalculator calculator_;
        plotting::AutoPlotter plotter_;
        std::unique_ptr<Portfolio> portfolio_;
        BacktestMetrics metrics_;
        bool has_run_ = false;
    };

} // namespace backtester
