#include "auto_plotter.hpp"
#include "exceptions.hpp"
#include "html_chart_writer.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace plotting {

    namespace {

        const double kUndefined = std::numeric_limits<double>::quiet_NaN();
        const char* kFallbackColor = "#FF6B6B";

        const double kEquityPanePct = 15.0;
        const double kVolumePanePct = 15.0;
        const double kSubPanePct = 15.0;
        const double kMainPaneFloorPct = 30.0;

        // Turns computed indicator lines into styled layers
        std::vector<SeriesLayer> toLayers(const indicators::IndicatorDefinition& definition,
                                          const indicators::IndicatorSeries& series,
                                          const PlotTheme& theme)
        {
            std::vector<SeriesLayer> layers;
            const bool band = definition.plot_type == indicators::PlotType::Band;
            for (const auto& line : series.lines) {
                SeriesLayer layer;
                layer.label = line.label;
                layer.plot_type = line.plot_type;
                layer.color = resolveSeriesColor(definition, line, series.lines.size(), theme);
                layer.width = definition.style.width;
                layer.values = line.values;
                if (band) {
                    layer.band_group = series.name;
                    layer.fill_opacity = definition.style.fill_opacity;
                }
                layers.push_back(std::move(layer));
            }
            return layers;
        }

        void addTradeMarkers(ChartDocument& document,
                             const core::PriceSeries& prices,
                             const std::vector<core::Trade>& trades)
        {
            auto logger = core::logging::getLogger();
            auto addMarker = [&](const core::Timestamp& when, double price, bool is_buy) {
                auto index = findBarIndex(prices, when);
                if (!index) {
                    logger->warn("Trade at {} does not match any bar; marker skipped", core::utils::timestampToString(when));
                    return;
                }
                TradeMarker marker;
                marker.bar_index = *index;
                marker.price = price;
                marker.is_buy = is_buy;
                marker.color = is_buy ? document.theme.buy_color : document.theme.sell_color;
                marker.symbol = is_buy ? document.theme.buy_symbol : document.theme.sell_symbol;
                document.markers.push_back(marker);
            };

            for (const auto& trade : trades) {
                const bool is_long = trade.direction == core::TradeDirection::Long;
                addMarker(trade.entry_time, trade.entry_price, is_long);
                if (!trade.is_open) {
                    addMarker(trade.exit_time, trade.exit_price, !is_long);
                }
            }
        }

        Pane buildVolumePane(const core::PriceSeries& prices, const PlotTheme& theme) {
            Pane pane;
            pane.title = "Volume";
            pane.kind = PaneKind::Volume;

            SeriesLayer layer;
            layer.label = "Volume";
            layer.plot_type = indicators::PlotType::Bar;
            layer.color = theme.up_color;
            layer.values = prices.column(core::PriceColumn::Volume);
            layer.point_colors.reserve(prices.size());
            for (const auto& candle : prices.candles()) {
                layer.point_colors.push_back(candle.close > candle.open ? theme.up_color : theme.down_color);
            }
            pane.series.push_back(std::move(layer));
            return pane;
        }

        Pane buildEquityPane(const core::PriceSeries& prices, const core::EquityCurve& equity) {
            Pane pane;
            pane.title = "Equity";
            pane.kind = PaneKind::Equity;

            SeriesLayer layer;
            layer.label = "Equity";
            layer.color = kFallbackColor;
            layer.width = 2.0;
            layer.values.assign(prices.size(), kUndefined);

            std::vector<std::size_t> mapped;
            for (const auto& point : equity) {
                auto index = findBarIndex(prices, point.timestamp);
                if (!index) {
                    continue;
                }
                layer.values[*index] = point.equity;
                mapped.push_back(*index);
            }
            if (mapped.size() < equity.size()) {
                core::logging::getLogger()->warn("{} equity point(s) do not match any bar and are not drawn",
                                                 equity.size() - mapped.size());
            }

            if (mapped.size() > 1) {
                const double start = layer.values[mapped.front()];
                double running_peak = start;
                double worst_drawdown = 0.0;
                std::size_t worst_index = mapped.front();
                std::size_t peak_index = mapped.front();
                for (std::size_t index : mapped) {
                    const double value = layer.values[index];
                    running_peak = std::max(running_peak, value);
                    if (running_peak > 0.0) {
                        const double drawdown = value / running_peak - 1.0;
                        if (drawdown < worst_drawdown) {
                            worst_drawdown = drawdown;
                            worst_index = index;
                        }
                    }
                    if (value > layer.values[peak_index]) {
                        peak_index = index;
                    }
                }
                const std::size_t final_index = mapped.back();

                pane.annotations.push_back(PaneAnnotation{
                    fmt::format("Max Drawdown: {:.2f}%", worst_drawdown * 100.0), worst_index, layer.values[worst_index], "red"});
                if (start > 0.0) {
                    pane.annotations.push_back(PaneAnnotation{
                        fmt::format("Peak: {:.1f}%", layer.values[peak_index] / start * 100.0),
                        peak_index, layer.values[peak_index], "cyan"});
                    pane.annotations.push_back(PaneAnnotation{
                        fmt::format("Final: {:.1f}%", layer.values[final_index] / start * 100.0),
                        final_index, layer.values[final_index], "blue"});
                }
            }
            pane.series.push_back(std::move(layer));
            return pane;
        }

    } // end anonymous namespace

    AutoPlotter::AutoPlotter(const indicators::IndicatorRegistry& registry)
        : calculator_(registry) {}

    AutoPlotter& AutoPlotter::addCustomIndicator(indicators::IndicatorDefinition definition,
                                                 indicators::IndicatorSeries series)
    {
        if (series.lines.empty()) {
            throw core::InvalidParameter(definition.name, "data", "custom indicator has no series");
        }
        for (const auto& line : series.lines) {
            if (line.values.size() != series.lines.front().values.size()) {
                throw core::InvalidParameter(definition.name, "data",
                    fmt::format("series '{}' has {} points but '{}' has {}", line.label, line.values.size(),
                                series.lines.front().label, series.lines.front().values.size()));
            }
        }
        if (series.name.empty()) {
            series.name = definition.name;
        }
        core::logging::getLogger()->debug("Custom indicator '{}' queued for the next render", definition.name);
        custom_indicators_.emplace_back(std::move(definition), std::move(series));
        return *this;
    }

    ChartDocument AutoPlotter::compose(const core::PriceSeries& prices,
                                       const std::vector<core::Trade>& trades,
                                       const core::EquityCurve& equity,
                                       const PlotConfigStore& config,
                                       const std::optional<ThemeSpecifier>& theme,
                                       const std::string& title)
    {
        auto logger = core::logging::getLogger();

        // Custom indicators apply to this render only, whatever its outcome
        auto custom_indicators = std::move(custom_indicators_);
        custom_indicators_.clear();

        if (prices.empty()) {
            throw core::RenderException("Cannot render a chart from empty price data");
        }

        ChartDocument document;
        document.title = title;
        if (theme) {
            document.theme = resolveTheme(*theme);
        } else if (config.theme()) {
            document.theme = resolveTheme(*config.theme());
        } else {
            document.theme = ThemeResolver::light();
        }

        document.candles = prices.candles();
        document.x_labels.reserve(prices.size());
        for (const auto& candle : prices.candles()) {
            document.x_labels.push_back(core::utils::timestampToString(candle.timestamp));
        }
        document.main_pane.title = "Price";
        document.main_pane.kind = PaneKind::Main;

        const auto requests = config.listEnabled();
        logger->info("Composing chart '{}': {} bars, {} indicator(s), {} custom, theme '{}'",
                     title, prices.size(), requests.size(), custom_indicators.size(), document.theme.name);

        // Compute everything first: one bad request aborts the render before any output exists
        std::vector<std::pair<const indicators::IndicatorDefinition*, indicators::IndicatorSeries>> computed;
        for (const auto& request : requests) {
            try {
                indicators::ResolvedRequest resolved = calculator_.resolve(request.name, request.params);
                computed.emplace_back(resolved.definition, calculator_.compute(prices, resolved));
            } catch (const core::IndicatorCalculationException& e) {
                logger->error("Chart '{}' aborted: indicator '{}' failed: {}", title, request.name, e.what());
                throw core::IndicatorCalculationException(fmt::format("Indicator '{}': {}", request.name, e.what()));
            } catch (const core::StrategyChartsException& e) {
                logger->error("Chart '{}' aborted: indicator '{}' rejected: {}", title, request.name, e.what());
                throw;
            }
        }
        for (const auto& custom : custom_indicators) {
            if (custom.second.size() != prices.size()) {
                logger->error("Chart '{}' aborted: custom indicator '{}' length mismatch", title, custom.first.name);
                throw core::InvalidParameter(custom.first.name, "data",
                    fmt::format("custom series has {} points but the price data has {}", custom.second.size(), prices.size()));
            }
            computed.emplace_back(&custom.first, custom.second);
        }

        bool volume_requested = false;
        for (const auto& entry : computed) {
            const indicators::IndicatorDefinition& definition = *entry.first;
            volume_requested = volume_requested || definition.kind == indicators::IndicatorKind::Volume;
            std::vector<SeriesLayer> layers = toLayers(definition, entry.second, document.theme);
            if (definition.type == indicators::IndicatorType::Overlay) {
                for (auto& layer : layers) {
                    document.main_pane.series.push_back(std::move(layer));
                }
            } else {
                Pane pane;
                pane.title = entry.second.name;
                pane.kind = PaneKind::Indicator;
                pane.series = std::move(layers);
                document.sub_panes.push_back(std::move(pane));
            }
        }

        if (!trades.empty()) {
            addTradeMarkers(document, prices, trades);
        }
        // A requested VOL already draws volume in its own sub-pane
        if (prices.hasColumn(core::PriceColumn::Volume) && !volume_requested) {
            document.volume_pane = buildVolumePane(prices, document.theme);
        }
        if (!equity.empty()) {
            document.equity_pane = buildEquityPane(prices, equity);
        }

        layoutPanes(document);
        logger->debug("Chart '{}' composed: {} overlay series, {} sub-pane(s), {} marker(s)",
                      title, document.main_pane.series.size(), document.sub_panes.size(), document.markers.size());
        return document;
    }

    std::string AutoPlotter::plot(const core::PriceSeries& prices,
                                  const std::vector<core::Trade>& trades,
                                  const core::EquityCurve& equity,
                                  const PlotConfigStore& config,
                                  const std::string& output_path,
                                  bool show,
                                  const std::string& title,
                                  const std::optional<ThemeSpecifier>& theme)
    {
        ChartDocument document = compose(prices, trades, equity, config, theme, title);
        const std::string path = output_path.empty() ? defaultOutputPath(title) : output_path;
        HtmlChartWriter{}.write(document, path);
        core::logging::getLogger()->info("Chart written to {}", path);
        if (show) {
            openInViewer(path);
        }
        return path;
    }

    std::string AutoPlotter::defaultOutputPath(const std::string& title) {
        return title + "_backtest_result.html";
    }

    std::string resolveSeriesColor(const indicators::IndicatorDefinition& definition,
                                   const indicators::SeriesLine& line,
                                   std::size_t line_count,
                                   const PlotTheme& theme)
    {
        auto per_output = definition.style.line_colors.find(line.key);
        if (per_output != definition.style.line_colors.end()) {
            return per_output->second;
        }
        if (line_count == 1 && definition.style.color) {
            return *definition.style.color;
        }
        auto ma = theme.ma_colors.find(line.label);
        if (ma != theme.ma_colors.end()) {
            return ma->second;
        }
        auto indicator = theme.indicator_colors.find(line.label);
        if (indicator != theme.indicator_colors.end()) {
            return indicator->second;
        }
        return kFallbackColor;
    }

    void layoutPanes(ChartDocument& document) {
        const double equity_pct = document.equity_pane ? kEquityPanePct : 0.0;
        const double volume_pct = document.volume_pane ? kVolumePanePct : 0.0;
        const std::size_t sub_count = document.sub_panes.size();

        double sub_pct = kSubPanePct;
        double main_pct = 100.0 - equity_pct - volume_pct - sub_pct * static_cast<double>(sub_count);
        if (main_pct < kMainPaneFloorPct) {
            main_pct = kMainPaneFloorPct;
            sub_pct = (100.0 - kMainPaneFloorPct - equity_pct - volume_pct) / static_cast<double>(sub_count);
        }

        double top = 0.0;
        auto place = [&top](Pane& pane, double height) {
            pane.top_pct = top;
            pane.height_pct = height;
            top += height;
        };
        place(document.main_pane, main_pct);
        for (auto& pane : document.sub_panes) {
            place(pane, sub_pct);
        }
        if (document.volume_pane) place(*document.volume_pane, volume_pct);
        if (document.equity_pane) place(*document.equity_pane, equity_pct);
    }

    std::optional<std::size_t> findBarIndex(const core::PriceSeries& prices, const core::Timestamp& timestamp) {
        const auto& candles = prices.candles();
        auto it = std::lower_bound(candles.begin(), candles.end(), timestamp,
                                   [](const core::Candle& candle, const core::Timestamp& ts) { return candle.timestamp < ts; });
        if (it == candles.end() || it->timestamp != timestamp) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(candles.begin(), it));
    }

} // namespace plotting
