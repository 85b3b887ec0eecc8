#pragma once

#include <string>
#include <utility>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "indicator_calculator.hpp"
#include "plot_config.hpp"
#include "portfolio.hpp"

namespace backtester {

    using json = nlohmann::json;

    class BacktestEngine;

    // Base class for user strategies. init() runs once when the engine is built,
    // next(i) once per bar. Orders fill at the bar's close.
    class StrategyBase {
    public:
        virtual ~StrategyBase() = default;

        virtual std::string getName() const = 0;

        virtual void init() {}
        virtual void next(std::size_t i) { (void)i; }

        // --- Declarative plot configuration ---
        void configurePlot(plotting::ThemeSpecifier theme) { plot_config_.configureTheme(std::move(theme)); }
        void addPlotIndicator(const std::string& name, bool enabled = true, const json& params = json::object()) {
            plot_config_.addIndicator(name, enabled, params);
        }
        void removePlotIndicator(const std::string& name) { plot_config_.removeIndicator(name); }
        void enablePlotIndicator(const std::string& name, bool enabled = true) { plot_config_.enableIndicator(name, enabled); }

        plotting::PlotConfigStore& plotConfig() { return plot_config_; }
        const plotting::PlotConfigStore& plotConfig() const { return plot_config_; }

    protected:
        // --- Trading actions, long-only, filled at close of bar i ---
        bool buy(std::size_t i, long long size);
        bool sell(std::size_t i, long long size);
        bool close(std::size_t i);

        // --- State ---
        const core::PriceSeries& data() const;
        long long position() const;
        double cash() const;
        double equity(std::size_t i) const;     // Marked at close of bar i

        // Computes an indicator over the full price series (e.g. indicator("EMA", {{"period", 52}})).
        // Throws the same errors as indicators::IndicatorCalculator::compute.
        indicators::IndicatorSeries indicator(const std::string& name, const json& params = json::object()) const;

    private:
        friend class BacktestEngine;

        void attach(const core::PriceSeries& data, Portfolio& portfolio, const indicators::IndicatorCalculator& calculator);
        void step(std::size_t i);

        void requireAttached() const;

        const core::PriceSeries* data_ = nullptr;
        Portfolio* portfolio_ = nullptr;
        const indicators::IndicatorCalculator* calculator_ = nullptr;
        plotting::PlotConfigStore plot_config_;
    };

} // namespace backtester
