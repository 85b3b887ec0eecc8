#include "strategy_factory.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace backtester {

    namespace { // Use anonymous namespace for file-local helpers

        int intParam(const json& params, const char* key, int fallback, int minimum) {
            if (!params.contains(key)) return fallback;
            const json& value = params.at(key);
            if (!value.is_number_integer()) {
                throw core::ConfigException(fmt::format("'strategy_params.{}' must be an integer", key));
            }
            const int parsed = value.get<int>();
            if (parsed < minimum) {
                throw core::ConfigException(fmt::format("'strategy_params.{}' must be >= {}, got {}", key, minimum, parsed));
            }
            return parsed;
        }

        double fractionParam(const json& params, const char* key, double fallback) {
            if (!params.contains(key)) return fallback;
            const json& value = params.at(key);
            if (!value.is_number()) {
                throw core::ConfigException(fmt::format("'strategy_params.{}' must be a number", key));
            }
            const double parsed = value.get<double>();
            if (!(parsed > 0.0) || parsed > 1.0) {
                throw core::ConfigException(fmt::format("'strategy_params.{}' must be in (0, 1], got {}", key, parsed));
            }
            return parsed;
        }

        // True when a crosses above b between bars i-1 and i
        bool crossover(const std::vector<double>& a, const std::vector<double>& b, std::size_t i) {
            if (i == 0) return false;
            const double a0 = a[i - 1], a1 = a[i], b0 = b[i - 1], b1 = b[i];
            if (std::isnan(a0) || std::isnan(a1) || std::isnan(b0) || std::isnan(b1)) return false;
            return a0 < b0 && a1 > b1;
        }

    } // end anonymous namespace

    std::unique_ptr<StrategyBase> StrategyFactory::createStrategy(const json& config) {
        if (!config.is_object() || !config.contains("strategy") || !config["strategy"].is_string()) {
            throw core::ConfigException("Run config requires 'strategy' (string)");
        }
        json params = config.value("strategy_params", json::object());
        if (!params.is_object()) {
            throw core::ConfigException("'strategy_params' must be an object");
        }
        return createStrategy(config["strategy"].get<std::string>(), params);
    }

    std::unique_ptr<StrategyBase> StrategyFactory::createStrategy(const std::string& name, const json& params) {
        auto logger = core::logging::getLogger();
        logger->debug("Creating strategy '{}' with params {}", name, params.dump());

        if (name == "SMACross") {
            const int fast = intParam(params, "n1", 52, 2);
            const int slow = intParam(params, "n2", 104, 2);
            if (fast >= slow) {
                throw core::ConfigException(fmt::format("SMACross requires n1 < n2, got n1={} n2={}", fast, slow));
            }
            const double fraction = fractionParam(params, "fraction", 0.3);
            const int lot_size = intParam(params, "lot_size", 100, 1);
            return std::make_unique<SmaCrossStrategy>(fast, slow, fraction, lot_size);
        }

        throw core::ConfigException(fmt::format("Unknown strategy '{}'", name));
    }

    std::set<std::string> StrategyFactory::availableStrategies() {
        return {"SMACross"};
    }

    SmaCrossStrategy::SmaCrossStrategy(int fast_period, int slow_period, double fraction, long long lot_size)
        : fast_period_(fast_period), slow_period_(slow_period), fraction_(fraction), lot_size_(lot_size) {}

    void SmaCrossStrategy::init() {
        const std::string fast_name = fmt::format("EMA{}", fast_period_);
        const std::string slow_name = fmt::format("EMA{}", slow_period_);
        fast_ = indicator(fast_name).lines.front().values;
        slow_ = indicator(slow_name).lines.front().values;

        addPlotIndicator(fast_name);
        addPlotIndicator(slow_name);
    }

    void SmaCrossStrategy::next(std::size_t i) {
        if (crossover(fast_, slow_, i)) {
            const double price = data()[i].close;
            const long long lots = static_cast<long long>(equity(i) * fraction_ / price / static_cast<double>(lot_size_));
            const long long size = lots * lot_size_;
            if (size >= lot_size_ && !buy(i, size)) {
                core::logging::getLogger()->debug("SMACross: buy of {} at bar {} rejected", size, i);
            }
        } else if (crossover(slow_, fast_, i) && position() > 0) {
            if (!close(i)) {
                core::logging::getLogger()->warn("SMACross: failed to close position at bar {}", i);
            }
        }
    }

} // namespace backtester
