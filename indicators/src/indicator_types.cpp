#include "indicator_types.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace indicators {

    std::string toString(IndicatorType type) {
        switch (type) {
            case IndicatorType::Overlay: return "overlay";
            case IndicatorType::Subplot: return "subplot";
        }
        return "unknown";
    }

    std::string toString(PlotType type) {
        switch (type) {
            case PlotType::Line: return "line";
            case PlotType::Bar:  return "bar";
            case PlotType::Area: return "area";
            case PlotType::Band: return "band";
        }
        return "unknown";
    }

    IndicatorType indicatorTypeFromString(const std::string& text) {
        const std::string lowered = core::utils::toLower(core::utils::trim(text));
        if (lowered == "overlay") return IndicatorType::Overlay;
        if (lowered == "subplot") return IndicatorType::Subplot;
        throw core::ConfigException(fmt::format("Unknown indicator type '{}' (expected overlay or subplot)", text));
    }

    PlotType plotTypeFromString(const std::string& text) {
        const std::string lowered = core::utils::toLower(core::utils::trim(text));
        if (lowered == "line") return PlotType::Line;
        if (lowered == "bar") return PlotType::Bar;
        if (lowered == "area") return PlotType::Area;
        if (lowered == "band") return PlotType::Band;
        throw core::ConfigException(fmt::format("Unknown plot type '{}' (expected line, bar, area or band)", text));
    }

    const SeriesLine& IndicatorSeries::line(const std::string& label) const {
        for (const auto& l : lines) {
            if (l.label == label) {
                return l;
            }
        }
        throw std::out_of_range(fmt::format("Indicator series '{}' has no line labelled '{}'", name, label));
    }

    IndicatorDefinition createCustomIndicator(const std::string& name,
                                              IndicatorType type,
                                              PlotType plot_type,
                                              const json& params,
                                              const IndicatorStyle& style)
    {
        if (name.empty()) {
            throw core::InvalidParameter(name, "name", "custom indicator name must not be empty");
        }
        if (!params.is_object()) {
            throw core::InvalidParameter(name, "params", "parameters must be a JSON object");
        }
        IndicatorDefinition definition;
        definition.name = name;
        definition.kind = IndicatorKind::Custom;
        definition.type = type;
        definition.plot_type = plot_type;
        definition.default_params = params;
        definition.style = style;
        return definition;
    }

} // namespace indicators
