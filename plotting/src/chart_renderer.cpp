#include "chart_renderer.hpp"
#include "exceptions.hpp"
#include "html_chart_writer.hpp"
#include "logging.hpp"
#include "output_file.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <utility>

namespace plotting {

    namespace {

        const char* kLegacyUpColor = "#ec0000";
        const char* kLegacyDownColor = "#00da3c";
        const char* kLegacyEquityColor = "#FF6B6B";

        json axisPair(std::size_t index, const std::vector<std::string>& labels, bool show_labels) {
            return {{"type", "category"}, {"gridIndex", index}, {"data", labels},
                    {"axisLine", {{"onZero", false}}}, {"splitLine", {{"show", false}}},
                    {"axisLabel", {{"show", show_labels}}}};
        }

    } // end anonymous namespace

    AutoChartRenderer::AutoChartRenderer(AutoPlotter& plotter, const PlotConfigStore& config)
        : plotter_(plotter), config_(config) {}

    std::string AutoChartRenderer::render(const core::PriceSeries& prices,
                                          const std::vector<core::Trade>& trades,
                                          const core::EquityCurve& equity,
                                          const std::string& title,
                                          const std::string& output_path,
                                          bool show)
    {
        return plotter_.plot(prices, trades, equity, config_, output_path, show, title);
    }

    json LegacyChartRenderer::buildOption(const core::PriceSeries& prices,
                                          const std::vector<core::Trade>& trades,
                                          const core::EquityCurve& equity) const
    {
        std::vector<std::string> labels;
        json ohlc = json::array();
        for (const auto& candle : prices.candles()) {
            labels.push_back(core::utils::timestampToString(candle.timestamp));
            ohlc.push_back({candle.open, candle.close, candle.low, candle.high});
        }

        json points = json::array();
        for (const auto& trade : trades) {
            const bool is_long = trade.direction == core::TradeDirection::Long;
            const std::pair<core::Timestamp, double> legs[] = {{trade.entry_time, trade.entry_price},
                                                               {trade.exit_time, trade.exit_price}};
            const int leg_count = trade.is_open ? 1 : 2;
            for (int leg = 0; leg < leg_count; ++leg) {
                auto index = findBarIndex(prices, legs[leg].first);
                if (!index) continue;
                const bool is_buy = (leg == 0) == is_long;
                points.push_back({{"coord", {labels[*index], legs[leg].second}},
                                  {"value", is_buy ? "B" : "S"},
                                  {"symbol", is_buy ? "triangle" : "pin"}, {"symbolSize", 12},
                                  {"itemStyle", {{"color", is_buy ? kLegacyDownColor : kLegacyUpColor}}}});
            }
        }

        json volume = json::array();
        const bool has_volume = prices.hasColumn(core::PriceColumn::Volume);
        if (has_volume) {
            for (const auto& candle : prices.candles()) {
                volume.push_back({{"value", candle.volume},
                                  {"itemStyle", {{"color", candle.close > candle.open ? kLegacyUpColor : kLegacyDownColor}}}});
            }
        }

        json equity_values = json::array();
        for (std::size_t i = 0; i < prices.size(); ++i) {
            equity_values.push_back(nullptr);
        }
        for (const auto& point : equity) {
            auto index = findBarIndex(prices, point.timestamp);
            if (index && std::isfinite(point.equity)) {
                equity_values[*index] = point.equity;
            }
        }

        // Fixed layout: price on top, then volume, then equity
        json grids = json::array();
        json x_axes = json::array();
        json y_axes = json::array();
        json series = json::array();
        const bool has_equity = !equity.empty();
        const double main_height = 75.0 - (has_volume ? 15.0 : 0.0) - (has_equity ? 15.0 : 0.0);

        grids.push_back({{"left", "5%"}, {"right", "5%"}, {"top", "5%"}, {"height", fmt::format("{:.0f}%", main_height)}});
        x_axes.push_back(axisPair(0, labels, !has_volume && !has_equity));
        y_axes.push_back({{"scale", true}, {"gridIndex", 0}});
        json candlestick = {{"name", "Candles"}, {"type", "candlestick"}, {"xAxisIndex", 0}, {"yAxisIndex", 0},
                            {"data", ohlc},
                            {"itemStyle", {{"color", kLegacyUpColor}, {"color0", kLegacyDownColor},
                                           {"borderColor", kLegacyUpColor}, {"borderColor0", kLegacyDownColor}}}};
        if (!points.empty()) {
            candlestick["markPoint"] = {{"data", points}};
        }
        series.push_back(candlestick);

        double top = 5.0 + main_height + 5.0;
        std::size_t axis = 1;
        if (has_volume) {
            grids.push_back({{"left", "5%"}, {"right", "5%"}, {"top", fmt::format("{:.0f}%", top)}, {"height", "12%"}});
            x_axes.push_back(axisPair(axis, labels, !has_equity));
            y_axes.push_back({{"scale", true}, {"gridIndex", axis}, {"splitNumber", 3}});
            series.push_back({{"name", "Volume"}, {"type", "bar"}, {"xAxisIndex", axis}, {"yAxisIndex", axis}, {"data", volume}});
            top += 15.0;
            ++axis;
        }
        if (has_equity) {
            grids.push_back({{"left", "5%"}, {"right", "5%"}, {"top", fmt::format("{:.0f}%", top)}, {"height", "12%"}});
            x_axes.push_back(axisPair(axis, labels, true));
            y_axes.push_back({{"scale", true}, {"gridIndex", axis}, {"splitNumber", 3}});
            series.push_back({{"name", "Equity"}, {"type", "line"}, {"xAxisIndex", axis}, {"yAxisIndex", axis},
                              {"showSymbol", false}, {"connectNulls", true},
                              {"lineStyle", {{"width", 2}, {"color", kLegacyEquityColor}}}, {"data", equity_values}});
        }

        json option;
        option["animation"] = false;
        option["backgroundColor"] = "#ffffff";
        option["tooltip"] = {{"trigger", "axis"}, {"axisPointer", {{"type", "cross"}}}};
        option["axisPointer"] = {{"link", json::array({{{"xAxisIndex", "all"}}})}};
        option["grid"] = grids;
        option["xAxis"] = x_axes;
        option["yAxis"] = y_axes;
        option["series"] = series;
        return option;
    }

    std::string LegacyChartRenderer::render(const core::PriceSeries& prices,
                                            const std::vector<core::Trade>& trades,
                                            const core::EquityCurve& equity,
                                            const std::string& title,
                                            const std::string& output_path,
                                            bool show)
    {
        auto logger = core::logging::getLogger();
        if (prices.empty()) {
            throw core::RenderException("Cannot render a chart from empty price data");
        }
        const std::string path = output_path.empty() ? kDefaultOutputPath : output_path;
        logger->info("Rendering '{}' with the legacy renderer: {} bars, {} trades", title, prices.size(), trades.size());

        std::string html;
        try {
            html = wrapHtml(title, "100%", "800px", "#ffffff", buildOption(prices, trades, equity));
        } catch (const json::exception& e) {
            throw core::RenderException(fmt::format("Failed to serialize chart '{}': {}", title, e.what()));
        }
        writeFileAtomically(path, html);
        logger->info("Chart written to {}", path);
        if (show) {
            openInViewer(path);
        }
        return path;
    }

    std::unique_ptr<IChartRenderer> makeRenderer(bool use_auto_plotter,
                                                 AutoPlotter& plotter,
                                                 const PlotConfigStore& config)
    {
        if (use_auto_plotter) {
            return std::make_unique<AutoChartRenderer>(plotter, config);
        }
        return std::make_unique<LegacyChartRenderer>();
    }

} // namespace plotting
