#pragma once

#include "datatypes.hpp"
#include "indicator_params.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace indicators {

    using json = nlohmann::json;

    // Where an indicator is drawn
    enum class IndicatorType {
        Overlay,   // On the price pane (moving averages, Bollinger Bands)
        Subplot    // In its own stacked pane (MACD, RSI, KDJ)
    };

    enum class PlotType {
        Line,
        Bar,
        Area,
        Band
    };

    std::string toString(IndicatorType type);
    std::string toString(PlotType type);
    IndicatorType indicatorTypeFromString(const std::string& text);
    PlotType plotTypeFromString(const std::string& text);

    // One output series of an indicator. The rendered label is the request name + suffix
    // unless fixed_label is set (VOL always draws a series called "Volume").
    struct OutputSpec {
        std::string key;        // Style lookup key, e.g. "signal"
        std::string suffix;     // Appended to the request name, e.g. "_signal"
        PlotType plot_type = PlotType::Line;
        std::string fixed_label;

        std::string labelFor(const std::string& request_name) const {
            return fixed_label.empty() ? request_name + suffix : fixed_label;
        }
    };

    struct IndicatorStyle {
        std::optional<std::string> color;           // Used by single-output indicators
        double width = 1.0;
        double fill_opacity = 0.1;                  // Band fill
        std::map<std::string, std::string> line_colors;  // Output key -> color
    };

    struct SeriesLine {
        std::string label;
        std::string key;
        PlotType plot_type = PlotType::Line;
        std::vector<double> values;     // NaN marks undefined points
    };

    // Computed output, aligned 1:1 with the price series
    struct IndicatorSeries {
        std::string name;
        std::vector<SeriesLine> lines;

        std::size_t size() const { return lines.empty() ? 0 : lines.front().values.size(); }
        // Throws std::out_of_range if no line carries the label
        const SeriesLine& line(const std::string& label) const;
    };

    // Returns one vector per declared output, in declaration order
    using ComputeFunction = std::function<std::vector<std::vector<double>>(const core::PriceSeries&,
                                                                            const IndicatorParams&)>;

    struct IndicatorDefinition {
        std::string name;
        IndicatorKind kind = IndicatorKind::Custom;
        IndicatorType type = IndicatorType::Overlay;
        PlotType plot_type = PlotType::Line;
        json default_params = json::object();
        std::set<core::PriceColumn> required_columns;
        std::vector<OutputSpec> outputs;
        IndicatorStyle style;
        ComputeFunction compute;    // Empty for descriptors paired with precomputed data
    };

    // Descriptor for an indicator whose data is computed outside the pipeline.
    // Pair it with an IndicatorSeries via plotting::AutoPlotter::addCustomIndicator.
    IndicatorDefinition createCustomIndicator(const std::string& name,
                                              IndicatorType type,
                                              PlotType plot_type,
                                              const json& params = json::object(),
                                              const IndicatorStyle& style = IndicatorStyle{});

} // namespace indicators
