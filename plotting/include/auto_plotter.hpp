#pragma once

#include "chart_document.hpp"
#include "datatypes.hpp"
#include "indicator_calculator.hpp"
#include "indicator_registry.hpp"
#include "plot_config.hpp"
#include "themes.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace plotting {

    // Chart composer: computes every enabled indicator request, partitions the
    // results into overlay and sub-pane series, styles them and lays out the panes.
    // Any indicator failure aborts the whole composition.
    class AutoPlotter {
    public:
        explicit AutoPlotter(const indicators::IndicatorRegistry& registry);

        // Pairs a descriptor (see indicators::createCustomIndicator) with data computed
        // elsewhere. Used by the next compose()/plot() call only.
        AutoPlotter& addCustomIndicator(indicators::IndicatorDefinition definition,
                                        indicators::IndicatorSeries series);
        void clearCustomIndicators() { custom_indicators_.clear(); }
        std::size_t customIndicatorCount() const { return custom_indicators_.size(); }

        // Theme precedence: `theme` argument > config.theme() > "light".
        // Empty trades / equity mean "not supplied".
        ChartDocument compose(const core::PriceSeries& prices,
                              const std::vector<core::Trade>& trades,
                              const core::EquityCurve& equity,
                              const PlotConfigStore& config,
                              const std::optional<ThemeSpecifier>& theme = std::nullopt,
                              const std::string& title = "Backtest");

        // compose() + HTML output. An empty output_path means "<title>_backtest_result.html".
        // Returns the written path.
        std::string plot(const core::PriceSeries& prices,
                         const std::vector<core::Trade>& trades,
                         const core::EquityCurve& equity,
                         const PlotConfigStore& config,
                         const std::string& output_path = "",
                         bool show = false,
                         const std::string& title = "Backtest",
                         const std::optional<ThemeSpecifier>& theme = std::nullopt);

        static std::string defaultOutputPath(const std::string& title);

    private:
        indicators::IndicatorCalculator calculator_;
        std::vector<std::pair<indicators::IndicatorDefinition, indicators::IndicatorSeries>> custom_indicators_;
    };

    // Series color: per-output style color > definition color (single-output only) >
    // theme ma_colors[label] > theme indicator_colors[label] > "#FF6B6B"
    std::string resolveSeriesColor(const indicators::IndicatorDefinition& definition,
                                   const indicators::SeriesLine& line,
                                   std::size_t line_count,
                                   const PlotTheme& theme);

    // Sets top_pct / height_pct on every pane of the document
    void layoutPanes(ChartDocument& document);

    // Index of the bar whose timestamp equals `timestamp`, if any
    std::optional<std::size_t> findBarIndex(const core::PriceSeries& prices, const core::Timestamp& timestamp);

} // namespace plotting
