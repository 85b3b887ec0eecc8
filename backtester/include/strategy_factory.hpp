#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "strategy_base.hpp"

namespace backtester {

    using json = nlohmann::json;

    class StrategyFactory {
    public:
        // Creates a strategy from a run config: {"strategy": name, "strategy_params": {...}}
        static std::unique_ptr<StrategyBase> createStrategy(const json& config);

        // Throws core::ConfigException for an unknown name or bad parameters
        static std::unique_ptr<StrategyBase> createStrategy(const std::string& name, const json& params);

        static std::set<std::string> availableStrategies();
    };

    // EMA crossover: buys roughly `fraction` of equity in whole lots when the fast EMA
    // crosses above the slow one, closes the position when it crosses back below.
    class SmaCrossStrategy : public StrategyBase {
    public:
        SmaCrossStrategy(int fast_period = 52, int slow_period = 104, double fraction = 0.3, long long lot_size = 100);

        std::string getName() const override { return "SMACross"; }
        void init() override;
        void next(std::size_t i) override;

        int fastPeriod() const { return fast_period_; }
        int slowPeriod() const { return slow_period_; }

    private:
        int fast_period_;
        int slow_period_;
        double fraction_;
        long long lot_size_;
        std::vector<double> fast_;
        std::vector<double> slow_;
    };

} // namespace backtester
