#pragma once

#include "datatypes.hpp"
#include "indicator_params.hpp"
#include "indicator_registry.hpp"
#include "indicator_types.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace indicators {

    // A request name normalized against the registry
    struct ResolvedRequest {
        const IndicatorDefinition* definition = nullptr;
        std::string label;          // The name as requested, used to label output series
        IndicatorParams params;
    };

    // Computes indicator series from price data. Stateless apart from the registry
    // reference; identical input always gives identical output.
    class IndicatorCalculator {
    public:
        explicit IndicatorCalculator(const IndicatorRegistry& registry);

        // Resolves "MA20" / "SMA(10)" / "MACD" to a definition and validated parameters.
        // Explicit params win over a period encoded in the name.
        // Throws core::UnknownIndicator or core::InvalidParameter.
        ResolvedRequest resolve(const std::string& name, const nlohmann::json& params = nlohmann::json::object()) const;

        // Throws core::UnknownIndicator, core::MissingInputColumn, core::InvalidParameter
        // or core::IndicatorCalculationException.
        IndicatorSeries compute(const core::PriceSeries& prices,
                                const std::string& name,
                                const nlohmann::json& params = nlohmann::json::object()) const;

        IndicatorSeries compute(const core::PriceSeries& prices, const ResolvedRequest& request) const;

        const IndicatorRegistry& registry() const { return registry_; }

    private:
        const IndicatorRegistry& registry_;
    };

} // namespace indicators
