#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <vector>

namespace data {

    namespace {

        std::vector<std::string> splitLine(const std::string& line) {
            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string field;
            while (std::getline(ss, field, ',')) {
                fields.push_back(core::utils::trim(field));
            }
            if (!line.empty() && line.back() == ',') {
                fields.emplace_back();
            }
            return fields;
        }

        double parseNumber(const std::string& text, const std::string& column, std::size_t line_no,
                           const std::string& source)
        {
            std::size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(text, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (text.empty() || consumed != text.size() || !std::isfinite(value)) {
                throw core::DataLoadException(fmt::format("{}:{}: invalid {} value '{}'", source, line_no, column, text));
            }
            return value;
        }

        long long toVolume(double value, std::size_t line_no, const std::string& source) {
            // 2^63 is exactly representable; anything at or above it overflows long long
            if (value < 0.0 || value >= static_cast<double>(std::numeric_limits<long long>::max())) {
                throw core::DataLoadException(fmt::format("{}:{}: volume {} out of range", source, line_no, value));
            }
            return static_cast<long long>(value);
        }

    } // end anonymous namespace

    core::PriceSeries CsvLoader::loadFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw core::DataLoadException("Cannot open price file '" + path + "'");
        }
        core::logging::getLogger()->info("Loading prices from CSV: {}", path);
        return parse(file, path);
    }

    core::PriceSeries CsvLoader::parse(std::istream& input, const std::string& source_name) {
        auto logger = core::logging::getLogger();

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(input, line)) {
            ++line_no;
            if (!core::utils::trim(line).empty()) break;
        }
        if (core::utils::trim(line).empty()) {
            throw core::DataLoadException(source_name + ": missing header row");
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // --- Header ---
        std::optional<std::size_t> time_index;
        std::map<core::PriceColumn, std::size_t> column_index;
        const std::vector<std::string> header = splitLine(line);
        for (std::size_t i = 0; i < header.size(); ++i) {
            const std::string name = core::utils::toLower(header[i]);
            if (name == "datetime" || name == "date" || name == "time" || name == "timestamp") {
                if (!time_index) time_index = i;
            } else if (name == "open") {
                column_index[core::PriceColumn::Open] = i;
            } else if (name == "high") {
                column_index[core::PriceColumn::High] = i;
            } else if (name == "low") {
                column_index[core::PriceColumn::Low] = i;
            } else if (name == "close") {
                column_index[core::PriceColumn::Close] = i;
            } else if (name == "volume") {
                column_index[core::PriceColumn::Volume] = i;
            } else {
                logger->debug("{}: ignoring column '{}'", source_name, header[i]);
            }
        }
        if (!time_index) {
            throw core::DataLoadException(source_name + ": header needs a datetime, date or time column");
        }
        if (!column_index.count(core::PriceColumn::Close)) {
            throw core::DataLoadException(source_name + ": header needs a close column");
        }

        // --- Rows ---
        core::TimeSeries<core::Candle> candles;
        while (std::getline(input, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (core::utils::trim(line).empty()) continue;

            const std::vector<std::string> fields = splitLine(line);
            if (fields.size() < header.size()) {
                throw core::DataLoadException(fmt::format("{}:{}: expected {} fields, got {}",
                                                          source_name, line_no, header.size(), fields.size()));
            }

            core::Candle candle;
            try {
                candle.timestamp = core::utils::stringToTimestamp(fields[*time_index]);
            } catch (const std::exception& e) {
                throw core::DataLoadException(fmt::format("{}:{}: {}", source_name, line_no, e.what()));
            }

            for (const auto& [column, index] : column_index) {
                const double value = parseNumber(fields[index], core::toString(column), line_no, source_name);
                switch (column) {
                    case core::PriceColumn::Open:   candle.open = value; break;
                    case core::PriceColumn::High:   candle.high = value; break;
                    case core::PriceColumn::Low:    candle.low = value; break;
                    case core::PriceColumn::Close:  candle.close = value; break;
                    case core::PriceColumn::Volume: candle.volume = toVolume(value, line_no, source_name); break;
                }
            }
            // Absent price columns mirror the close so candles stay drawable
            if (!column_index.count(core::PriceColumn::Open)) candle.open = candle.close;
            if (!column_index.count(core::PriceColumn::High)) candle.high = candle.close;
            if (!column_index.count(core::PriceColumn::Low)) candle.low = candle.close;
            candles.push_back(candle);
        }

        std::set<core::PriceColumn> columns;
        for (const auto& entry : column_index) {
            columns.insert(entry.first);
        }
        logger->debug("{}: parsed {} rows with {} price columns", source_name, candles.size(), columns.size());
        return core::PriceSeries(std::move(candles), std::move(columns));
    }

} // namespace data
