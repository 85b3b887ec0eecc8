#pragma once

#include "indicator_types.hpp"

#include <map>
#include <set>
#include <string>

namespace indicators {

    // Maps an indicator base name ("MA", "MACD", ...) to its definition.
    // Built once at startup and handed to the calculator and the chart composer;
    // registration after concurrent readers have started is not supported.
    class IndicatorRegistry {
    public:
        IndicatorRegistry() = default;

        // Registry pre-populated with the built-in catalogue
        static IndicatorRegistry withBuiltins();

        // Adds or overwrites the entry under definition.name (case-insensitive key).
        // Throws core::InvalidParameter if the definition is malformed.
        void registerIndicator(IndicatorDefinition definition);

        // Throws core::UnknownIndicator when absent
        const IndicatorDefinition& lookup(const std::string& name) const;

        // nullptr when absent
        const IndicatorDefinition* find(const std::string& name) const;

        bool contains(const std::string& name) const;
        std::set<std::string> listNames() const;
        std::size_t size() const { return definitions_.size(); }

    private:
        std::map<std::string, IndicatorDefinition> definitions_;
    };

    // Registers MA, SMA, EMA, MACD, RSI, BOLL, KDJ, STOCH, ATR, WILLR and VOL
    void registerBuiltinIndicators(IndicatorRegistry& registry);

} // namespace indicators
