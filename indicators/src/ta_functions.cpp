#include "ta_functions.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace indicators {
namespace ta {

    namespace {

        const double kUndefined = std::numeric_limits<double>::quiet_NaN();

        void checkRetCode(TA_RetCode ret_code, const char* function) {
            if (ret_code != TA_SUCCESS) {
                core::logging::getLogger()->error("TA-Lib {} failed with error code: {}", function, static_cast<int>(ret_code));
                throw core::IndicatorCalculationException(
                    fmt::format("TA-Lib {} failed with error code {}", function, static_cast<int>(ret_code)));
            }
        }

        // TA-Lib writes out_nb_element values starting at out[0] that belong to input
        // index out_begin_idx onward. Shift them into place, NaN-fill the lookback.
        std::vector<double> align(std::vector<double> raw, int out_begin_idx, int out_nb_element, std::size_t input_size) {
            std::vector<double> aligned(input_size, kUndefined);
            for (int i = 0; i < out_nb_element; ++i) {
                const std::size_t target = static_cast<std::size_t>(out_begin_idx + i);
                if (target < input_size) {
                    aligned[target] = raw[static_cast<std::size_t>(i)];
                }
            }
            return aligned;
        }

        int lastIndex(const std::vector<double>& input) {
            return static_cast<int>(input.size()) - 1;
        }

    } // end anonymous namespace

    std::vector<double> sma(const std::vector<double>& close, int period) {
        if (close.empty()) return {};
        std::vector<double> out(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_MA(0, lastIndex(close), close.data(), period, TA_MAType_SMA,
                                    &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_MA");
        return align(std::move(out), out_begin_idx, out_nb_element, close.size());
    }

    std::vector<double> ema(const std::vector<double>& close, int period) {
        if (close.empty()) return {};
        std::vector<double> out(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        // TA-Lib seeds the EMA with the SMA of the first `period` values
        TA_RetCode ret_code = TA_EMA(0, lastIndex(close), close.data(), period,
                                     &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_EMA");
        return align(std::move(out), out_begin_idx, out_nb_element, close.size());
    }

    std::vector<double> rsi(const std::vector<double>& close, int period) {
        if (close.empty()) return {};
        std::vector<double> out(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_RSI(0, lastIndex(close), close.data(), period,
                                     &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_RSI");
        return align(std::move(out), out_begin_idx, out_nb_element, close.size());
    }

    MacdResult macd(const std::vector<double>& close, int fast, int slow, int signal) {
        MacdResult result;
        if (close.empty()) return result;
        std::vector<double> macd_out(close.size());
        std::vector<double> signal_out(close.size());
        std::vector<double> hist_out(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_MACD(0, lastIndex(close), close.data(), fast, slow, signal,
                                      &out_begin_idx, &out_nb_element,
                                      macd_out.data(), signal_out.data(), hist_out.data());
        checkRetCode(ret_code, "TA_MACD");
        result.macd = align(std::move(macd_out), out_begin_idx, out_nb_element, close.size());
        result.signal = align(std::move(signal_out), out_begin_idx, out_nb_element, close.size());
        result.histogram = align(std::move(hist_out), out_begin_idx, out_nb_element, close.size());
        return result;
    }

    BandResult bollinger(const std::vector<double>& close, int period, double std_dev) {
        BandResult result;
        if (close.empty()) return result;
        std::vector<double> upper(close.size());
        std::vector<double> middle(close.size());
        std::vector<double> lower(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_BBANDS(0, lastIndex(close), close.data(), period, std_dev, std_dev, TA_MAType_SMA,
                                        &out_begin_idx, &out_nb_element,
                                        upper.data(), middle.data(), lower.data());
        checkRetCode(ret_code, "TA_BBANDS");
        result.upper = align(std::move(upper), out_begin_idx, out_nb_element, close.size());
        result.middle = align(std::move(middle), out_begin_idx, out_nb_element, close.size());
        result.lower = align(std::move(lower), out_begin_idx, out_nb_element, close.size());
        return result;
    }

    StochasticResult stochastic(const std::vector<double>& high,
                                const std::vector<double>& low,
                                const std::vector<double>& close,
                                int fast_k_period, int slow_k_period, int slow_d_period)
    {
        StochasticResult result;
        if (close.empty()) return result;
        std::vector<double> k_out(close.size());
        std::vector<double> d_out(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_STOCH(0, lastIndex(close), high.data(), low.data(), close.data(),
                                       fast_k_period, slow_k_period, TA_MAType_SMA, slow_d_period, TA_MAType_SMA,
                                       &out_begin_idx, &out_nb_element, k_out.data(), d_out.data());
        checkRetCode(ret_code, "TA_STOCH");
        result.k = align(std::move(k_out), out_begin_idx, out_nb_element, close.size());
        result.d = align(std::move(d_out), out_begin_idx, out_nb_element, close.size());
        return result;
    }

    std::vector<double> atr(const std::vector<double>& high,
                            const std::vector<double>& low,
                            const std::vector<double>& close,
                            int period)
    {
        if (close.empty()) return {};
        std::vector<double> out(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_ATR(0, lastIndex(close), high.data(), low.data(), close.data(), period,
                                     &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_ATR");
        return align(std::move(out), out_begin_idx, out_nb_element, close.size());
    }

    std::vector<double> williamsR(const std::vector<double>& high,
                                  const std::vector<double>& low,
                                  const std::vector<double>& close,
                                  int period)
    {
        if (close.empty()) return {};
        std::vector<double> out(close.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_WILLR(0, lastIndex(close), high.data(), low.data(), close.data(), period,
                                       &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_WILLR");
        return align(std::move(out), out_begin_idx, out_nb_element, close.size());
    }

} // namespace ta
} // namespace indicators
