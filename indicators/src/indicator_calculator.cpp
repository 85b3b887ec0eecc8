#include "indicator_calculator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <utility>

namespace indicators {

    IndicatorCalculator::IndicatorCalculator(const IndicatorRegistry& registry)
        : registry_(registry) {}

    ResolvedRequest IndicatorCalculator::resolve(const std::string& name, const nlohmann::json& params) const {
        auto logger = core::logging::getLogger();
        try {
            ResolvedRequest request;
            request.label = name;

            // A definition registered under the full name takes precedence over name parsing
            std::optional<int> inline_period;
            request.definition = registry_.find(name);
            if (!request.definition) {
                ParsedName parsed = parseIndicatorName(core::utils::trim(name));
                request.definition = registry_.find(parsed.base);
                if (!request.definition) {
                    throw core::UnknownIndicator(name);
                }
                inline_period = parsed.inline_period;
            }

            request.params = buildParams(name, request.definition->kind, request.definition->default_params,
                                         inline_period, params);
            logger->trace("Resolved '{}' -> {} {}", name, request.definition->name, paramsToJson(request.params).dump());
            return request;
        } catch (const core::NamedEntityException& e) {
            logger->error("Indicator request '{}' rejected: {}", name, e.what());
            throw;
        }
    }

    IndicatorSeries IndicatorCalculator::compute(const core::PriceSeries& prices,
                                                 const std::string& name,
                                                 const nlohmann::json& params) const
    {
        return compute(prices, resolve(name, params));
    }

    IndicatorSeries IndicatorCalculator::compute(const core::PriceSeries& prices, const ResolvedRequest& request) const {
        auto logger = core::logging::getLogger();
        if (!request.definition) {
            throw core::UnknownIndicator(request.label);
        }
        const IndicatorDefinition& definition = *request.definition;

        for (auto column : definition.required_columns) {
            if (!prices.hasColumn(column)) {
                logger->error("Indicator '{}' needs column {} which the price data lacks", request.label, core::toString(column));
                throw core::MissingInputColumn(request.label, core::toString(column));
            }
        }
        if (!definition.compute) {
            throw core::IndicatorCalculationException(fmt::format(
                "Indicator '{}' has no compute function; pair it with precomputed data instead", request.label));
        }

        logger->debug("Computing {} over {} bars with {}", request.label, prices.size(), paramsToJson(request.params).dump());
        std::vector<std::vector<double>> outputs = definition.compute(prices, request.params);

        if (outputs.size() != definition.outputs.size()) {
            throw core::IndicatorCalculationException(fmt::format(
                "Indicator '{}' produced {} series but declares {}", request.label, outputs.size(), definition.outputs.size()));
        }

        IndicatorSeries series;
        series.name = request.label;
        series.lines.reserve(outputs.size());
        for (std::size_t i = 0; i < outputs.size(); ++i) {
            if (outputs[i].size() != prices.size()) {
                throw core::IndicatorCalculationException(fmt::format(
                    "Indicator '{}' output '{}' has {} points, expected {}",
                    request.label, definition.outputs[i].key, outputs[i].size(), prices.size()));
            }
            const OutputSpec& spec = definition.outputs[i];
            series.lines.push_back(SeriesLine{spec.labelFor(request.label), spec.key, spec.plot_type, std::move(outputs[i])});
        }
        logger->trace("Computed {} line(s) for {}", series.lines.size(), request.label);
        return series;
    }

} // namespace indicators
