#include "datatypes.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

namespace core {

    std::string toString(PriceColumn column) {
        switch (column) {
            case PriceColumn::Open:   return "Open";
            case PriceColumn::High:   return "High";
            case PriceColumn::Low:    return "Low";
            case PriceColumn::Close:  return "Close";
            case PriceColumn::Volume: return "Volume";
        }
        return "Unknown";
    }

    PriceSeries::PriceSeries(TimeSeries<Candle> candles, std::set<PriceColumn> columns)
        : candles_(std::move(candles)), columns_(std::move(columns))
    {
        for (std::size_t i = 1; i < candles_.size(); ++i) {
            if (!(candles_[i - 1].timestamp < candles_[i].timestamp)) {
                throw DataLoadException("Price data timestamps must be strictly increasing (row " + std::to_string(i) +
                                        " at " + utils::timestampToString(candles_[i].timestamp) + ")");
            }
        }
    }

    std::set<PriceColumn> PriceSeries::allColumns() {
        return {PriceColumn::Open, PriceColumn::High, PriceColumn::Low, PriceColumn::Close, PriceColumn::Volume};
    }

    std::set<PriceColumn> PriceSeries::ohlcColumns() {
        return {PriceColumn::Open, PriceColumn::High, PriceColumn::Low, PriceColumn::Close};
    }

    bool PriceSeries::hasColumn(PriceColumn column) const {
        return columns_.count(column) > 0;
    }

    std::vector<double> PriceSeries::column(PriceColumn column) const {
        if (!hasColumn(column)) {
            throw DataLoadException("Price data has no '" + toString(column) + "' column");
        }
        std::vector<double> values;
        values.reserve(candles_.size());
        for (const auto& candle : candles_) {
            switch (column) {
                case PriceColumn::Open:   values.push_back(candle.open); break;
                case PriceColumn::High:   values.push_back(candle.high); break;
                case PriceColumn::Low:    values.push_back(candle.low); break;
                case PriceColumn::Close:  values.push_back(candle.close); break;
                case PriceColumn::Volume: values.push_back(static_cast<double>(candle.volume)); break;
            }
        }
        return values;
    }

} // namespace core
