#pragma once

#include <istream>
#include <string>

#include "datatypes.hpp"

namespace data {

    // Reads OHLCV price tables from comma-separated text. The header names the
    // columns (case-insensitive): one of datetime/date/time, then any of
    // open, high, low, close, volume. close is required; the other price
    // columns are marked available only when present.
    class CsvLoader {
    public:
        // Throws core::DataLoadException if the file cannot be opened or parsed
        static core::PriceSeries loadFile(const std::string& path);

        static core::PriceSeries parse(std::istream& input, const std::string& source_name = "<stream>");
    };

} // namespace data
