#include "database_manager.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <memory>

namespace data {

    namespace {

        using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

        StatementPtr prepare(sqlite3* db, const char* sql) {
            sqlite3_stmt* stmt = nullptr;
            const int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
            StatementPtr guard(stmt, &sqlite3_finalize);
            if (rc != SQLITE_OK) {
                throw core::DataLoadException(fmt::format("Failed to prepare SQL statement [{}]: {}", rc, sqlite3_errmsg(db)));
            }
            return guard;
        }

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string& db_path)
        : database_path_(db_path)
    {
        core::logging::getLogger()->debug("DatabaseManager created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager() {
        disconnect();
    }

    bool DatabaseManager::connect() {
        auto logger = core::logging::getLogger();
        if (connected_) {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);
        const int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                       nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Cannot open SQLite database '{}': {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_);     // Handle is allocated even when open fails
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        logger->debug("Connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect() {
        if (!connected_) return;

        auto logger = core::logging::getLogger();
        logger->debug("Disconnecting from SQLite database: {}", database_path_);
        if (sqlite3_close(db_) != SQLITE_OK) {
            logger->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const {
        return connected_ && db_ != nullptr;
    }

    bool DatabaseManager::executeSQL(const std::string& sql) {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        logger->trace("Executing SQL: {}", sql);
        char* error_msg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg) != SQLITE_OK) {
            logger->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema() {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot initialize schema: Not connected to database.");
            return false;
        }

        const std::string create_candles_sql = R"(
            CREATE TABLE IF NOT EXISTS historical_candles (
                instrument_key TEXT NOT NULL,
                interval TEXT NOT NULL,
                timestamp TEXT NOT NULL,
                open REAL,
                high REAL,
                low REAL,
                close REAL NOT NULL,
                volume INTEGER,
                PRIMARY KEY (instrument_key, interval, timestamp)
            );
        )";

        bool success = executeSQL(create_candles_sql);
        if (success) {
            logger->debug("SQLite candle schema ready.");
        } else {
            logger->error("SQLite candle schema initialization failed.");
        }
        return success;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle>& candles,
                                      const std::string& instrument_key,
                                      const std::string& interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty()) {
            logger->debug("No candles provided to save for {} ({}).", instrument_key, interval);
            return true;
        }

        const char* sql = R"(
            INSERT OR IGNORE INTO historical_candles
            (instrument_key, interval, timestamp, open, high, low, close, volume)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?);
        )";

        if (!executeSQL("BEGIN TRANSACTION;")) {
            logger->error("Failed to begin transaction for saving candles.");
            return false;
        }

        bool success = true;
        int saved_count = 0;
        try {
            StatementPtr stmt = prepare(db_, sql);
            for (const auto& candle : candles) {
                const std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
                sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 4, candle.open);
                sqlite3_bind_double(stmt.get(), 5, candle.high);
                sqlite3_bind_double(stmt.get(), 6, candle.low);
                sqlite3_bind_double(stmt.get(), 7, candle.close);
                sqlite3_bind_int64(stmt.get(), 8, candle.volume);

                const int rc = sqlite3_step(stmt.get());
                if (rc != SQLITE_DONE) {
                    logger->error("Failed to insert candle at {} [{}]: {}", timestamp_str, rc, sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
                saved_count += sqlite3_changes(db_) > 0 ? 1 : 0;

                if (sqlite3_reset(stmt.get()) != SQLITE_OK) {
                    logger->error("Failed to reset prepared statement: {}", sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
            }
        } catch (const core::DataLoadException& e) {
            logger->error("{}", e.what());
            success = false;
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;")) {
            logger->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success && !executeSQL("ROLLBACK;")) {
                logger->error("Rollback after failed commit also failed for {} ({}).", instrument_key, interval);
            }
            return false;
        }

        if (success) {
            logger->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
        } else {
            logger->warn("Transaction rolled back due to error during candle save for {} ({}).", instrument_key, interval);
        }
        return success;
    }

    core::PriceSeries DatabaseManager::queryCandles(const std::string& instrument_key,
                                                    const std::string& interval,
                                                    core::Timestamp start_time,
                                                    core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DataLoadException("Cannot query candles: not connected to database '" + database_path_ + "'");
        }

        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);
        logger->debug("Querying candles for {} ({}) between '{}' and '{}'", instrument_key, interval, start_str, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        StatementPtr stmt = prepare(db_, sql);
        sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Candle> candles;
        int rc = SQLITE_OK;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            const unsigned char* ts_text = sqlite3_column_text(stmt.get(), 0);
            if (!ts_text) {
                throw core::DataLoadException(fmt::format("NULL timestamp in candle row {} for {} ({})",
                                                          candles.size(), instrument_key, interval));
            }
            core::Candle candle;
            candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
            candle.open = sqlite3_column_double(stmt.get(), 1);
            candle.high = sqlite3_column_double(stmt.get(), 2);
            candle.low = sqlite3_column_double(stmt.get(), 3);
            candle.close = sqlite3_column_double(stmt.get(), 4);
            candle.volume = sqlite3_column_int64(stmt.get(), 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE) {
            throw core::DataLoadException(fmt::format("Error reading candles [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        logger->debug("Loaded {} candles for {} ({}).", candles.size(), instrument_key, interval);
        return core::PriceSeries(std::move(candles));
    }

} // namespace data
