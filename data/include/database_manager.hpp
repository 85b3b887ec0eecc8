#pragma once

#include <string>
#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

    // Local SQLite candle store keyed by (instrument, interval, timestamp).
    // Timestamps are stored as UTC "YYYY-MM-DD HH:MM:SS" text so they sort lexically.
    class DatabaseManager {
    public:
        explicit DatabaseManager(const std::string& db_path);
        ~DatabaseManager();

        DatabaseManager(const DatabaseManager&) = delete;
        DatabaseManager& operator=(const DatabaseManager&) = delete;

        bool connect();
        void disconnect();
        bool isConnected() const;

        bool initializeSchema();
        bool executeSQL(const std::string& sql);

        // Inserts candles, ignoring rows whose key already exists. Runs in one transaction.
        bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                         const std::string& instrument_key,
                         const std::string& interval);

        // Returns a full OHLCV series ordered by timestamp, bounds inclusive.
        // Throws core::DataLoadException when not connected or on a query failure.
        core::PriceSeries queryCandles(const std::string& instrument_key,
                                       const std::string& interval,
                                       core::Timestamp start_time,
                                       core::Timestamp end_time);

        const std::string& path() const { return database_path_; }

    private:
        std::string database_path_;
        sqlite3* db_ = nullptr;
        bool connected_ = false;
    };

} // namespace data
