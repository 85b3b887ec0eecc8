#pragma once

#include "datatypes.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>

namespace test_helpers {

    inline core::Timestamp day(std::size_t index) {
        return core::utils::stringToTimestamp("2024-01-01") + std::chrono::hours(24 * static_cast<long long>(index));
    }

    // Deterministic daily OHLCV bars around a slow sine wave
    inline core::PriceSeries sinePrices(std::size_t count,
                                        std::set<core::PriceColumn> columns = core::PriceSeries::allColumns())
    {
        core::TimeSeries<core::Candle> candles;
        candles.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            const double x = static_cast<double>(i);
            core::Candle candle;
            candle.timestamp = day(i);
            candle.close = 100.0 + 10.0 * std::sin(x * 0.1) + 0.05 * x;
            candle.open = candle.close - 0.5 * std::cos(x * 0.3);
            candle.high = std::max(candle.open, candle.close) + 1.0;
            candle.low = std::min(candle.open, candle.close) - 1.0;
            candle.volume = 1000 + static_cast<long long>((i * 37) % 500);
            candles.push_back(candle);
        }
        return core::PriceSeries(std::move(candles), std::move(columns));
    }

    inline core::PriceSeries constantPrices(std::size_t count, double price) {
        core::TimeSeries<core::Candle> candles;
        for (std::size_t i = 0; i < count; ++i) {
            core::Candle candle;
            candle.timestamp = day(i);
            candle.open = candle.high = candle.low = candle.close = price;
            candle.volume = 100;
            candles.push_back(candle);
        }
        return core::PriceSeries(std::move(candles));
    }

    // Close prices rising to bar `turn`, then falling
    inline core::PriceSeries tentPrices(std::size_t count, std::size_t turn) {
        core::TimeSeries<core::Candle> candles;
        for (std::size_t i = 0; i < count; ++i) {
            const double x = static_cast<double>(i);
            const double t = static_cast<double>(turn);
            core::Candle candle;
            candle.timestamp = day(i);
            candle.close = i <= turn ? 100.0 + x : 100.0 + t - (x - t);
            candle.open = candle.close;
            candle.high = candle.close + 0.5;
            candle.low = candle.close - 0.5;
            candle.volume = 500;
            candles.push_back(candle);
        }
        return core::PriceSeries(std::move(candles));
    }

    inline std::size_t countNaN(const std::vector<double>& values) {
        return static_cast<std::size_t>(std::count_if(values.begin(), values.end(), [](double v) { return std::isnan(v); }));
    }

} // namespace test_helpers
