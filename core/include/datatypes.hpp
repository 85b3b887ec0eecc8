#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <optional>

namespace core {

    // Using system_clock for time points; all timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;

    template<typename T>
    using TimeSeries = std::vector<T>;

    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0;

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Columns a price table may carry. Close-only tables are valid input.
    enum class PriceColumn {
        Open,
        High,
        Low,
        Close,
        Volume
    };

    std::string toString(PriceColumn column);

    // Ordered, timestamp-indexed OHLCV table. Timestamps are strictly increasing.
    // Immutable once constructed.
    class PriceSeries {
    public:
        PriceSeries() = default;
        explicit PriceSeries(TimeSeries<Candle> candles,
                             std::set<PriceColumn> columns = allColumns());

        static std::set<PriceColumn> allColumns();
        static std::set<PriceColumn> ohlcColumns();

        std::size_t size() const { return candles_.size(); }
        bool empty() const { return candles_.empty(); }
        const Candle& operator[](std::size_t index) const { return candles_[index]; }
        const TimeSeries<Candle>& candles() const { return candles_; }

        const std::set<PriceColumn>& columns() const { return columns_; }
        bool hasColumn(PriceColumn column) const;

        // Extracts one column as doubles. Throws DataLoadException if the column is absent.
        std::vector<double> column(PriceColumn column) const;

    private:
        TimeSeries<Candle> candles_;
        std::set<PriceColumn> columns_;
    };

    enum class TradeDirection {
        Long,
        Short
    };

    // A single buy or sell execution at a bar index
    struct Execution {
        std::size_t bar_index = 0;
        Timestamp timestamp;
        bool is_buy = true;
        double price = 0.0;
        long long size = 0;
        double cash_after = 0.0;
    };

    // A round trip. An open trade has an entry but no exit yet; its exit fields are unset.
    struct Trade {
        TradeDirection direction = TradeDirection::Long;
        Timestamp entry_time;
        Timestamp exit_time;
        bool is_open = false;
        double entry_price = 0.0;
        double exit_price = 0.0;
        long long quantity = 0;
        double commission = 0.0;      // Total commission (entry + exit)
        double pnl = 0.0;
        double return_pct = 0.0;      // PnL / entry value
    };

    struct EquityPoint {
        Timestamp timestamp;
        double equity = 0.0;
    };

    using EquityCurve = TimeSeries<EquityPoint>;

} // namespace core
