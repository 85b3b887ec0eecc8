#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace indicators {

    enum class IndicatorKind {
        SimpleMovingAverage,
        ExponentialMovingAverage,
        Macd,
        Rsi,
        BollingerBands,
        Kdj,
        Stochastic,
        Atr,
        WilliamsR,
        Volume,
        Custom
    };

    // --- Parameter schemas, one per indicator kind ---
    struct PeriodParams {
        int period = 0;
    };

    struct MacdParams {
        int fast = 12;
        int slow = 26;
        int signal = 9;
    };

    struct BollingerParams {
        int period = 20;
        double std_dev = 2.0;
    };

    struct KdjParams {
        int n = 9;
        int m1 = 3;
        int m2 = 3;
    };

    struct StochasticParams {
        int k_period = 14;
        int d_period = 3;
    };

    struct VolumeParams {};

    struct CustomParams {
        nlohmann::json values = nlohmann::json::object();
    };

    using IndicatorParams = std::variant<PeriodParams,
                                         MacdParams,
                                         BollingerParams,
                                         KdjParams,
                                         StochasticParams,
                                         VolumeParams,
                                         CustomParams>;

    // "MA20" -> {"MA", 20}, "SMA(10)" -> {"SMA", 10}, "MACD" -> {"MACD", nullopt}
    struct ParsedName {
        std::string base;
        std::optional<int> inline_period;
    };

    ParsedName parseIndicatorName(const std::string& name);

    // Merges defaults, the name-derived period and explicit parameters (explicit wins,
    // the inline period only replaces the default) and converts the result into the
    // schema for `kind`. Throws core::InvalidParameter naming `indicator`.
    IndicatorParams buildParams(const std::string& indicator,
                                IndicatorKind kind,
                                const nlohmann::json& defaults,
                                std::optional<int> inline_period,
                                const nlohmann::json& explicit_params);

    // Parameters back to a JSON object (for logging and chart legends)
    nlohmann::json paramsToJson(const IndicatorParams& params);

} // namespace indicators
