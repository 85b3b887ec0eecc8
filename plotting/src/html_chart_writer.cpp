#include "html_chart_writer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "output_file.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <system_error>

namespace plotting {

    namespace {

        // Page area left for panes (percent of canvas); the rest holds legend and zoom slider
        const double kCanvasTopPct = 5.0;
        const double kCanvasSpanPct = 85.0;
        const double kPaneGapPct = 3.0;

        json valueOrNull(double value) {
            return std::isfinite(value) ? json(value) : json(nullptr);
        }

        json valuesOrNull(const std::vector<double>& values) {
            json data = json::array();
            for (double value : values) {
                data.push_back(valueOrNull(value));
            }
            return data;
        }

        std::string percent(double value) {
            return fmt::format("{:.2f}%", value);
        }

        json layerSeries(const SeriesLayer& layer, std::size_t axis, bool smooth) {
            json series;
            series["name"] = layer.label;
            series["xAxisIndex"] = axis;
            series["yAxisIndex"] = axis;
            series["itemStyle"] = {{"color", layer.color}};

            if (layer.plot_type == indicators::PlotType::Bar) {
                series["type"] = "bar";
                if (layer.point_colors.size() == layer.values.size()) {
                    json data = json::array();
                    for (std::size_t i = 0; i < layer.values.size(); ++i) {
                        data.push_back({{"value", valueOrNull(layer.values[i])},
                                        {"itemStyle", {{"color", layer.point_colors[i]}}}});
                    }
                    series["data"] = data;
                } else {
                    series["data"] = valuesOrNull(layer.values);
                }
                return series;
            }

            series["type"] = "line";
            series["data"] = valuesOrNull(layer.values);
            series["showSymbol"] = false;
            series["smooth"] = smooth;
            series["lineStyle"] = {{"width", layer.width}, {"color", layer.color}};
            if (layer.plot_type == indicators::PlotType::Area) {
                series["areaStyle"] = {{"opacity", 0.3}, {"color", layer.color}};
            }
            return series;
        }

        // Fill between the first and last line of each band group using two stacked series:
        // an invisible base at the lower edge and the (upper - lower) difference on top of it.
        void appendBandFills(json& series, const std::vector<SeriesLayer>& layers, std::size_t axis) {
            std::map<std::string, std::pair<const SeriesLayer*, const SeriesLayer*>> groups;
            std::vector<std::string> order;
            for (const auto& layer : layers) {
                if (layer.band_group.empty() || !layer.fill_opacity) continue;
                auto it = groups.find(layer.band_group);
                if (it == groups.end()) {
                    groups.emplace(layer.band_group, std::make_pair(&layer, &layer));
                    order.push_back(layer.band_group);
                } else {
                    it->second.second = &layer;
                }
            }

            for (const auto& group : order) {
                const SeriesLayer* upper = groups[group].first;
                const SeriesLayer* lower = groups[group].second;
                if (upper == lower) continue;

                std::vector<double> width(lower->values.size());
                for (std::size_t i = 0; i < width.size(); ++i) {
                    width[i] = upper->values[i] - lower->values[i];
                }
                const std::string stack = group + "_fill";
                series.push_back({{"name", group}, {"type", "line"}, {"stack", stack},
                                  {"xAxisIndex", axis}, {"yAxisIndex", axis}, {"silent", true},
                                  {"showSymbol", false}, {"lineStyle", {{"opacity", 0}}},
                                  {"data", valuesOrNull(lower->values)}});
                series.push_back({{"name", group}, {"type", "line"}, {"stack", stack},
                                  {"xAxisIndex", axis}, {"yAxisIndex", axis}, {"silent", true},
                                  {"showSymbol", false}, {"lineStyle", {{"opacity", 0}}},
                                  {"areaStyle", {{"color", upper->color}, {"opacity", *upper->fill_opacity}}},
                                  {"data", valuesOrNull(width)}});
            }
        }

        std::string escapeHtml(const std::string& text) {
            std::string escaped;
            escaped.reserve(text.size());
            for (char c : text) {
                switch (c) {
                    case '&': escaped += "&amp;"; break;
                    case '<': escaped += "&lt;"; break;
                    case '>': escaped += "&gt;"; break;
                    case '"': escaped += "&quot;"; break;
                    default: escaped += c;
                }
            }
            return escaped;
        }

        std::string shellQuote(const std::string& text) {
            std::string quoted = "'";
            for (char c : text) {
                if (c == '\'') {
                    quoted += "'\\''";
                } else {
                    quoted += c;
                }
            }
            quoted += "'";
            return quoted;
        }

    } // end anonymous namespace

    json HtmlChartWriter::buildOption(const ChartDocument& document) const {
        const PlotTheme& theme = document.theme;
        const auto panes = document.panes();

        json titles = json::array();
        json grids = json::array();
        json x_axes = json::array();
        json y_axes = json::array();
        json series = json::array();
        json legend = json::array();
        json axis_indices = json::array();

        for (std::size_t i = 0; i < panes.size(); ++i) {
            const Pane& pane = *panes[i];
            const double top = kCanvasTopPct + pane.top_pct * kCanvasSpanPct / 100.0;
            const double height = std::max(pane.height_pct * kCanvasSpanPct / 100.0 - kPaneGapPct, 1.0);
            const bool last = i + 1 == panes.size();

            titles.push_back({{"text", pane.title}, {"left", "5%"}, {"top", percent(top - kPaneGapPct + 0.5)},
                              {"textStyle", {{"color", theme.text_color}, {"fontSize", 12}}}});
            grids.push_back({{"left", "5%"}, {"right", "5%"}, {"top", percent(top)}, {"height", percent(height)}});
            x_axes.push_back({{"type", "category"}, {"gridIndex", i}, {"data", document.x_labels},
                              {"boundaryGap", true},
                              {"axisLine", {{"onZero", false}, {"lineStyle", {{"color", theme.text_color}}}}},
                              {"axisTick", {{"show", false}}},
                              {"splitLine", {{"show", false}}},
                              {"axisLabel", {{"show", last}, {"color", theme.text_color}}}});
            y_axes.push_back({{"scale", true}, {"gridIndex", i},
                              {"splitNumber", pane.kind == PaneKind::Main ? 5 : 3},
                              {"axisLabel", {{"color", theme.text_color}}},
                              {"splitLine", {{"show", true}, {"lineStyle", {{"color", theme.grid_color}, {"opacity", 0.3}}}}}});
            axis_indices.push_back(i);

            if (pane.kind == PaneKind::Main) {
                json ohlc = json::array();
                for (const auto& candle : document.candles) {
                    ohlc.push_back({candle.open, candle.close, candle.low, candle.high});
                }
                json candlestick = {
                    {"name", "Candles"}, {"type", "candlestick"}, {"xAxisIndex", i}, {"yAxisIndex", i},
                    {"data", ohlc},
                    {"itemStyle", {{"color", theme.up_color}, {"color0", theme.down_color},
                                   {"borderColor", theme.up_color}, {"borderColor0", theme.down_color}}}
                };
                if (!document.markers.empty()) {
                    json points = json::array();
                    for (const auto& marker : document.markers) {
                        points.push_back({{"name", marker.is_buy ? "Buy" : "Sell"},
                                          {"coord", {document.x_labels.at(marker.bar_index), marker.price}},
                                          {"value", marker.is_buy ? "B" : "S"},
                                          {"symbol", marker.symbol}, {"symbolSize", 12},
                                          {"itemStyle", {{"color", marker.color}}}});
                    }
                    candlestick["markPoint"] = {{"data", points}, {"label", {{"position", "top"}}}};
                }
                series.push_back(candlestick);
                legend.push_back("Candles");
            }

            for (const auto& layer : pane.series) {
                json entry = layerSeries(layer, i, pane.kind != PaneKind::Volume);
                if (pane.kind == PaneKind::Equity) {
                    entry["connectNulls"] = true;
                    if (!pane.annotations.empty()) {
                        json points = json::array();
                        for (const auto& annotation : pane.annotations) {
                            points.push_back({{"coord", {document.x_labels.at(annotation.bar_index), annotation.value}},
                                              {"value", annotation.text}, {"symbolSize", 16},
                                              {"itemStyle", {{"color", annotation.color}}}});
                        }
                        entry["markPoint"] = {{"data", points}, {"label", {{"fontSize", 10}}}};
                    }
                }
                series.push_back(entry);
                if (pane.kind != PaneKind::Volume && pane.kind != PaneKind::Equity) {
                    legend.push_back(layer.label);
                }
            }
            appendBandFills(series, pane.series, i);
        }

        json option;
        option["backgroundColor"] = theme.background_color;
        option["animation"] = false;
        option["title"] = titles;
        option["legend"] = {{"top", "0%"}, {"data", legend}, {"textStyle", {{"color", theme.text_color}}}};
        option["tooltip"] = {{"trigger", "axis"}, {"axisPointer", {{"type", "cross"}}}};
        option["axisPointer"] = {{"link", json::array({{{"xAxisIndex", "all"}}})}};
        option["grid"] = grids;
        option["xAxis"] = x_axes;
        option["yAxis"] = y_axes;
        option["dataZoom"] = json::array({
            {{"type", "inside"}, {"xAxisIndex", axis_indices}},
            {{"type", "slider"}, {"xAxisIndex", axis_indices}, {"bottom", "1%"}}
        });
        option["series"] = series;
        return option;
    }

    std::string HtmlChartWriter::renderHtml(const ChartDocument& document) const {
        return wrapHtml(document.title, document.theme.width, document.theme.height,
                        document.theme.background_color, buildOption(document));
    }

    void HtmlChartWriter::write(const ChartDocument& document, const std::string& path) const {
        std::string html;
        try {
            html = renderHtml(document);
        } catch (const json::exception& e) {
            throw core::RenderException(fmt::format("Failed to serialize chart '{}': {}", document.title, e.what()));
        }
        writeFileAtomically(path, html);
    }

    std::string wrapHtml(const std::string& title,
                         const std::string& width,
                         const std::string& height,
                         const std::string& background_color,
                         const json& option)
    {
        // "</" would end the script element early
        std::string script = option.dump();
        for (std::size_t pos = script.find("</"); pos != std::string::npos; pos = script.find("</", pos + 3)) {
            script.replace(pos, 2, "<\\/");
        }

        return fmt::format(
            "<!DOCTYPE html>\n"
            "<html>\n"
            "<head>\n"
            "<meta charset=\"UTF-8\">\n"
            "<title>{0}</title>\n"
            "<script src=\"https://cdn.jsdelivr.net/npm/echarts@5/dist/echarts.min.js\"></script>\n"
            "</head>\n"
            "<body style=\"margin:0;background:{3};\">\n"
            "<div id=\"chart\" style=\"width:{1};height:{2};\"></div>\n"
            "<script>\n"
            "var chart = echarts.init(document.getElementById('chart'));\n"
            "chart.setOption({4});\n"
            "window.addEventListener('resize', function() {{ chart.resize(); }});\n"
            "</script>\n"
            "</body>\n"
            "</html>\n",
            escapeHtml(title), escapeHtml(width), escapeHtml(height), escapeHtml(background_color), script);
    }

    void openInViewer(const std::string& path) {
        auto logger = core::logging::getLogger();
#if defined(__APPLE__)
        const char* opener = "open";
#else
        const char* opener = "xdg-open";
#endif
        std::error_code ec;
        const std::filesystem::path absolute = std::filesystem::absolute(path, ec);
        const std::string target = ec ? path : absolute.string();
        const std::string command = fmt::format("{} {} >/dev/null 2>&1", opener, shellQuote(target));
        logger->info("Opening {} in viewer", target);
        const int rc = std::system(command.c_str());
        if (rc != 0) {
            logger->warn("Could not open '{}' in a viewer ({} returned {})", target, opener, rc);
        }
    }

} // namespace plotting
