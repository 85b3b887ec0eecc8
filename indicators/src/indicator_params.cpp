#include "indicator_params.hpp"
#include "exceptions.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <regex>
#include <string>

namespace indicators {

    using json = nlohmann::json;

    namespace {

        int requireInt(const std::string& indicator, const json& params, const char* key, int minimum) {
            if (!params.contains(key)) {
                throw core::InvalidParameter(indicator, key, "missing required parameter");
            }
            const json& value = params.at(key);
            if (!value.is_number()) {
                throw core::InvalidParameter(indicator, key, fmt::format("expected a number, got {}", value.type_name()));
            }
            const double raw = value.get<double>();
            if (!std::isfinite(raw) || raw != std::floor(raw)) {
                throw core::InvalidParameter(indicator, key, fmt::format("expected an integer, got {}", raw));
            }
            if (raw < minimum || raw > std::numeric_limits<int>::max()) {
                throw core::InvalidParameter(indicator, key, fmt::format("must be >= {}, got {}", minimum, raw));
            }
            return static_cast<int>(raw);
        }

        double requirePositive(const std::string& indicator, const json& params, const char* key) {
            if (!params.contains(key)) {
                throw core::InvalidParameter(indicator, key, "missing required parameter");
            }
            const json& value = params.at(key);
            if (!value.is_number()) {
                throw core::InvalidParameter(indicator, key, fmt::format("expected a number, got {}", value.type_name()));
            }
            const double raw = value.get<double>();
            if (!std::isfinite(raw) || raw <= 0.0) {
                throw core::InvalidParameter(indicator, key, fmt::format("must be > 0, got {}", raw));
            }
            return raw;
        }

        void rejectUnknownKeys(const std::string& indicator, const json& params,
                               std::initializer_list<const char*> allowed) {
            for (auto it = params.begin(); it != params.end(); ++it) {
                bool known = false;
                for (const char* key : allowed) {
                    if (it.key() == key) {
                        known = true;
                        break;
                    }
                }
                if (!known) {
                    throw core::InvalidParameter(indicator, it.key(), "unknown parameter for this indicator");
                }
            }
        }

        PeriodParams periodParams(const std::string& indicator, const json& params, int minimum) {
            rejectUnknownKeys(indicator, params, {"period"});
            return PeriodParams{requireInt(indicator, params, "period", minimum)};
        }

    } // end anonymous namespace

    ParsedName parseIndicatorName(const std::string& name) {
        static const std::regex call_form(R"(^(.+)\((\d+)\)$)");           // SMA(10)
        static const std::regex suffix_form(R"(^([A-Za-z_]*[A-Za-z_])(\d+)$)"); // MA20
        std::smatch match;
        if (std::regex_match(name, match, call_form) || std::regex_match(name, match, suffix_form)) {
            try {
                return {match[1].str(), std::stoi(match[2].str())};
            } catch (const std::out_of_range&) {
                // Digits too long for an int; treat the whole string as the name
            }
        }
        return {name, std::nullopt};
    }

    IndicatorParams buildParams(const std::string& indicator,
                                IndicatorKind kind,
                                const json& defaults,
                                std::optional<int> inline_period,
                                const json& explicit_params)
    {
        json merged = defaults.is_object() ? defaults : json::object();

        if (inline_period) {
            const bool has_period = kind == IndicatorKind::SimpleMovingAverage ||
                                    kind == IndicatorKind::ExponentialMovingAverage ||
                                    kind == IndicatorKind::Rsi ||
                                    kind == IndicatorKind::Atr ||
                                    kind == IndicatorKind::WilliamsR ||
                                    kind == IndicatorKind::BollingerBands ||
                                    kind == IndicatorKind::Custom;
            if (!has_period) {
                throw core::InvalidParameter(indicator, "period",
                    "the name encodes a period but this indicator has no 'period' parameter");
            }
            merged["period"] = *inline_period;
        }

        if (!explicit_params.is_null()) {
            if (!explicit_params.is_object()) {
                throw core::InvalidParameter(indicator, "params", "parameters must be a JSON object");
            }
            merged.update(explicit_params);
        }

        switch (kind) {
            case IndicatorKind::SimpleMovingAverage:
            case IndicatorKind::Atr:
                return periodParams(indicator, merged, 1);
            case IndicatorKind::ExponentialMovingAverage:
            case IndicatorKind::Rsi:
            case IndicatorKind::WilliamsR:
                return periodParams(indicator, merged, 2);
            case IndicatorKind::Macd: {
                rejectUnknownKeys(indicator, merged, {"fast", "slow", "signal"});
                MacdParams p;
                p.fast = requireInt(indicator, merged, "fast", 2);
                p.slow = requireInt(indicator, merged, "slow", 2);
                p.signal = requireInt(indicator, merged, "signal", 1);
                if (p.fast >= p.slow) {
                    throw core::InvalidParameter(indicator, "fast",
                        fmt::format("fast period ({}) must be less than slow period ({})", p.fast, p.slow));
                }
                return p;
            }
            case IndicatorKind::BollingerBands: {
                rejectUnknownKeys(indicator, merged, {"period", "std"});
                BollingerParams p;
                p.period = requireInt(indicator, merged, "period", 2);
                p.std_dev = requirePositive(indicator, merged, "std");
                return p;
            }
            case IndicatorKind::Kdj: {
                rejectUnknownKeys(indicator, merged, {"n", "m1", "m2"});
                KdjParams p;
                p.n = requireInt(indicator, merged, "n", 1);
                p.m1 = requireInt(indicator, merged, "m1", 1);
                p.m2 = requireInt(indicator, merged, "m2", 1);
                return p;
            }
            case IndicatorKind::Stochastic: {
                rejectUnknownKeys(indicator, merged, {"k_period", "d_period"});
                StochasticParams p;
                p.k_period = requireInt(indicator, merged, "k_period", 1);
                p.d_period = requireInt(indicator, merged, "d_period", 1);
                return p;
            }
            case IndicatorKind::Volume:
                rejectUnknownKeys(indicator, merged, {});
                return VolumeParams{};
            case IndicatorKind::Custom:
                return CustomParams{merged};
        }
        throw core::InvalidParameter(indicator, "kind", "unsupported indicator kind");
    }

    json paramsToJson(const IndicatorParams& params) {
        struct Visitor {
            json operator()(const PeriodParams& p) const { return {{"period", p.period}}; }
            json operator()(const MacdParams& p) const { return {{"fast", p.fast}, {"slow", p.slow}, {"signal", p.signal}}; }
            json operator()(const BollingerParams& p) const { return {{"period", p.period}, {"std", p.std_dev}}; }
            json operator()(const KdjParams& p) const { return {{"n", p.n}, {"m1", p.m1}, {"m2", p.m2}}; }
            json operator()(const StochasticParams& p) const { return {{"k_period", p.k_period}, {"d_period", p.d_period}}; }
            json operator()(const VolumeParams&) const { return json::object(); }
            json operator()(const CustomParams& p) const { return p.values; }
        };
        return std::visit(Visitor{}, params);
    }

} // namespace indicators
