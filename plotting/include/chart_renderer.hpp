#pragma once

#include "auto_plotter.hpp"
#include "datatypes.hpp"
#include "plot_config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace plotting {

    // Turns backtest output into a chart file. Two implementations: the composer
    // path (indicators, themes) and the older fixed-layout path.
    class IChartRenderer {
    public:
        virtual ~IChartRenderer() = default;

        // Returns the path that was written. An empty output_path selects the
        // implementation's default file name.
        virtual std::string render(const core::PriceSeries& prices,
                                   const std::vector<core::Trade>& trades,
                                   const core::EquityCurve& equity,
                                   const std::string& title,
                                   const std::string& output_path,
                                   bool show) = 0;

        virtual std::string name() const = 0;
    };

    class AutoChartRenderer : public IChartRenderer {
    public:
        // Neither reference is owned; both must outlive the renderer
        AutoChartRenderer(AutoPlotter& plotter, const PlotConfigStore& config);

        std::string render(const core::PriceSeries& prices,
                           const std::vector<core::Trade>& trades,
                           const core::EquityCurve& equity,
                           const std::string& title,
                           const std::string& output_path,
                           bool show) override;

        std::string name() const override { return "auto"; }

    private:
        AutoPlotter& plotter_;
        const PlotConfigStore& config_;
    };

    // Candles, trade markers, volume and equity with fixed colors. Ignores indicator
    // configuration and themes.
    class LegacyChartRenderer : public IChartRenderer {
    public:
        static constexpr const char* kDefaultOutputPath = "backtest_result.html";

        std::string render(const core::PriceSeries& prices,
                           const std::vector<core::Trade>& trades,
                           const core::EquityCurve& equity,
                           const std::string& title,
                           const std::string& output_path,
                           bool show) override;

        std::string name() const override { return "legacy"; }

        // The ECharts option the legacy path writes (exposed for tests)
        json buildOption(const core::PriceSeries& prices,
                         const std::vector<core::Trade>& trades,
                         const core::EquityCurve& equity) const;
    };

    std::unique_ptr<IChartRenderer> makeRenderer(bool use_auto_plotter,
                                                 AutoPlotter& plotter,
                                                 const PlotConfigStore& config);

} // namespace plotting
