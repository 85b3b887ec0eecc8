#include <catch2/catch.hpp>

#include "csv_loader.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace data;
using test_helpers::day;
namespace fs = std::filesystem;

namespace {

    fs::path scratchDir() {
        fs::path dir = fs::temp_directory_path() / "strategy_charts_tests" / "data";
        fs::create_directories(dir);
        return dir;
    }

} // end anonymous namespace

TEST_CASE("CSV loader", "[data][csv]") {
    SECTION("Full OHLCV with a case-insensitive header") {
        std::istringstream input(
            "Date,Open,High,Low,Close,Volume\n"
            "2024-01-01,10,12,9,11,1000\n"
            "2024-01-02,11,13,10,12.5,1500\r\n"
            "\n");
        auto prices = CsvLoader::parse(input);
        REQUIRE(prices.size() == 2);
        REQUIRE(prices.columns() == core::PriceSeries::allColumns());
        REQUIRE(prices[1].timestamp == day(1));
        REQUIRE(prices[1].close == Approx(12.5));
        REQUIRE(prices[1].volume == 1500);
    }

    SECTION("Close-only tables mark only close available") {
        std::istringstream input("datetime,close\n2024-01-01 09:30:00,5\n2024-01-01 09:31:00,6\n");
        auto prices = CsvLoader::parse(input);
        REQUIRE(prices.columns() == std::set<core::PriceColumn>{core::PriceColumn::Close});
        REQUIRE_FALSE(prices.hasColumn(core::PriceColumn::Volume));
        REQUIRE(prices[0].high == Approx(5.0));
    }

    SECTION("Malformed input") {
        std::istringstream no_time("open,close\n1,2\n");
        REQUIRE_THROWS_AS(CsvLoader::parse(no_time), core::DataLoadException);

        std::istringstream no_close("date,open\n2024-01-01,2\n");
        REQUIRE_THROWS_AS(CsvLoader::parse(no_close), core::DataLoadException);

        std::istringstream bad_number("date,close\n2024-01-01,abc\n");
        REQUIRE_THROWS_WITH(CsvLoader::parse(bad_number, "prices.csv"), Catch::Contains("prices.csv:2"));

        std::istringstream bad_date("date,close\nyesterday,1\n");
        REQUIRE_THROWS_AS(CsvLoader::parse(bad_date), core::DataLoadException);

        std::istringstream unordered("date,close\n2024-01-02,1\n2024-01-01,2\n");
        REQUIRE_THROWS_AS(CsvLoader::parse(unordered), core::DataLoadException);

        std::istringstream nan_close("date,close\n2024-01-01,nan\n");
        REQUIRE_THROWS_WITH(CsvLoader::parse(nan_close, "prices.csv"), Catch::Contains("invalid Close value"));

        std::istringstream inf_open("date,open,close\n2024-01-01,inf,1\n");
        REQUIRE_THROWS_AS(CsvLoader::parse(inf_open), core::DataLoadException);

        std::istringstream huge_volume("date,close,volume\n2024-01-01,1,1e30\n");
        REQUIRE_THROWS_WITH(CsvLoader::parse(huge_volume, "prices.csv"), Catch::Contains("out of range"));

        std::istringstream negative_volume("date,close,volume\n2024-01-01,1,-5\n");
        REQUIRE_THROWS_AS(CsvLoader::parse(negative_volume), core::DataLoadException);

        std::istringstream empty("");
        REQUIRE_THROWS_AS(CsvLoader::parse(empty), core::DataLoadException);
    }

    SECTION("Files") {
        const fs::path path = scratchDir() / "prices.csv";
        {
            std::ofstream out(path);
            out << "time,close,volume\n2024-01-01,1,10\n2024-01-02,2,20\n";
        }
        auto prices = CsvLoader::loadFile(path.string());
        REQUIRE(prices.size() == 2);
        REQUIRE(prices.hasColumn(core::PriceColumn::Volume));
        REQUIRE_THROWS_AS(CsvLoader::loadFile((scratchDir() / "missing.csv").string()), core::DataLoadException);
    }
}

TEST_CASE("SQLite candle store", "[data][sqlite]") {
    const fs::path path = scratchDir() / "candles.db";
    fs::remove(path);

    DatabaseManager db(path.string());
    REQUIRE_FALSE(db.isConnected());
    REQUIRE_THROWS_AS(db.queryCandles("X", "day", day(0), day(1)), core::DataLoadException);

    REQUIRE(db.connect());
    REQUIRE(db.isConnected());
    REQUIRE(db.initializeSchema());

    const auto prices = test_helpers::sinePrices(10);
    REQUIRE(db.saveCandles(prices.candles(), "NSE:TEST", "day"));
    REQUIRE(db.saveCandles(prices.candles(), "NSE:TEST", "day"));    // Duplicates ignored

    SECTION("Range query returns a full OHLCV series") {
        auto loaded = db.queryCandles("NSE:TEST", "day", day(2), day(5));
        REQUIRE(loaded.size() == 4);
        REQUIRE(loaded.columns() == core::PriceSeries::allColumns());
        REQUIRE(loaded[0].timestamp == day(2));
        REQUIRE(loaded[0].close == Approx(prices[2].close));
        REQUIRE(loaded[3].volume == prices[5].volume);
    }

    SECTION("Other instruments and intervals are separate") {
        REQUIRE(db.queryCandles("NSE:OTHER", "day", day(0), day(9)).empty());
        REQUIRE(db.queryCandles("NSE:TEST", "minute", day(0), day(9)).empty());
        REQUIRE(db.queryCandles("NSE:TEST", "day", day(0), day(9)).size() == 10);
    }

    db.disconnect();
    REQUIRE_FALSE(db.isConnected());
}
