#pragma once

#include <vector>

namespace indicators {
namespace ta {

    // Thin wrappers over the TA-Lib C API. Every result is aligned 1:1 with the input:
    // indices before TA-Lib's first output (its lookback) hold NaN.
    // Throws core::IndicatorCalculationException on a TA-Lib error code.

    std::vector<double> sma(const std::vector<double>& close, int period);
    std::vector<double> ema(const std::vector<double>& close, int period);
    std::vector<double> rsi(const std::vector<double>& close, int period);

    struct MacdResult {
        std::vector<double> macd;
        std::vector<double> signal;
        std::vector<double> histogram;
    };
    MacdResult macd(const std::vector<double>& close, int fast, int slow, int signal);

    struct BandResult {
        std::vector<double> upper;
        std::vector<double> middle;
        std::vector<double> lower;
    };
    BandResult bollinger(const std::vector<double>& close, int period, double std_dev);

    struct StochasticResult {
        std::vector<double> k;
        std::vector<double> d;
    };
    // Slow stochastic with SMA smoothing for both %K and %D
    StochasticResult stochastic(const std::vector<double>& high,
                                const std::vector<double>& low,
                                const std::vector<double>& close,
                                int fast_k_period, int slow_k_period, int slow_d_period);

    std::vector<double> atr(const std::vector<double>& high,
                            const std::vector<double>& low,
                            const std::vector<double>& close,
                            int period);

    std::vector<double> williamsR(const std::vector<double>& high,
                                  const std::vector<double>& low,
                                  const std::vector<double>& close,
                                  int period);

} // namespace ta
} // namespace indicators
