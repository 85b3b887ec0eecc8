#include <catch2/catch.hpp>

#include "chart_renderer.hpp"
#include "exceptions.hpp"
#include "html_chart_writer.hpp"
#include "output_file.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace plotting;
namespace fs = std::filesystem;

namespace {

    fs::path scratchDir() {
        fs::path dir = fs::temp_directory_path() / "strategy_charts_tests" / "renderer";
        fs::create_directories(dir);
        return dir;
    }

    std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

} // end anonymous namespace

TEST_CASE("ScopedOutputFile", "[plotting][output]") {
    const fs::path target = scratchDir() / "nested" / "scoped.txt";
    fs::remove(target);

    SECTION("Commit moves the partial file into place") {
        {
            ScopedOutputFile file(target);
            file.stream() << "hello";
            REQUIRE(fs::exists(file.partialPath()));
            REQUIRE_FALSE(fs::exists(target));
            file.commit();
            REQUIRE(file.committed());
        }
        REQUIRE(readFile(target) == "hello");
        REQUIRE_FALSE(fs::exists(target.string() + ".partial"));
    }

    SECTION("Destruction without commit leaves nothing behind") {
        {
            ScopedOutputFile file(target);
            file.stream() << "abandoned";
        }
        REQUIRE_FALSE(fs::exists(target));
        REQUIRE_FALSE(fs::exists(target.string() + ".partial"));
    }

    SECTION("writeFileAtomically replaces existing content") {
        writeFileAtomically(target, "first");
        writeFileAtomically(target, "second");
        REQUIRE(readFile(target) == "second");
    }
}

TEST_CASE("HTML chart writer", "[plotting][html]") {
    const auto registry = indicators::IndicatorRegistry::withBuiltins();
    AutoPlotter plotter(registry);
    const auto prices = test_helpers::sinePrices(60);

    PlotConfigStore config;
    config.addIndicator("BOLL");
    config.addIndicator("MACD");
    auto document = plotter.compose(prices, {}, {}, config, std::nullopt, "Chart </script> test");

    HtmlChartWriter writer;
    const json option = writer.buildOption(document);

    SECTION("One grid and axis pair per pane") {
        const std::size_t panes = document.panes().size();
        REQUIRE(panes == 3);
        REQUIRE(option.at("grid").size() == panes);
        REQUIRE(option.at("xAxis").size() == panes);
        REQUIRE(option.at("yAxis").size() == panes);
        REQUIRE(option.at("series").front().at("type") == "candlestick");
    }

    SECTION("Undefined points serialize as null") {
        bool found = false;
        for (const auto& series : option.at("series")) {
            if (series.value("name", "") == "MACD_hist") {
                REQUIRE(series.at("type") == "bar");
                REQUIRE(series.at("data").front().is_null());
                found = true;
            }
        }
        REQUIRE(found);
    }

    SECTION("Title is escaped and scripts cannot be closed early") {
        const std::string html = writer.renderHtml(document);
        REQUIRE(html.find("<title>Chart &lt;/script&gt; test</title>") != std::string::npos);
        REQUIRE(html.find("Chart </script> test\"") == std::string::npos);
    }
}

TEST_CASE("Renderer selection", "[plotting][renderer]") {
    const auto registry = indicators::IndicatorRegistry::withBuiltins();
    AutoPlotter plotter(registry);
    PlotConfigStore config;

    REQUIRE(makeRenderer(true, plotter, config)->name() == "auto");
    REQUIRE(makeRenderer(false, plotter, config)->name() == "legacy");
}

TEST_CASE("Legacy renderer", "[plotting][renderer]") {
    const auto prices = test_helpers::sinePrices(30);
    LegacyChartRenderer renderer;

    core::Trade trade;
    trade.entry_time = test_helpers::day(3);
    trade.exit_time = test_helpers::day(8);
    trade.entry_price = prices[3].close;
    trade.exit_price = prices[8].close;

    core::EquityCurve equity;
    for (const auto& candle : prices.candles()) {
        equity.push_back(core::EquityPoint{candle.timestamp, 10000.0});
    }

    SECTION("Fixed panes and markers") {
        const json option = renderer.buildOption(prices, {trade}, equity);
        REQUIRE(option.at("grid").size() == 3);
        const auto& points = option.at("series").front().at("markPoint").at("data");
        REQUIRE(points.size() == 2);
        REQUIRE(points[0].at("symbol") == "triangle");
        REQUIRE(points[1].at("symbol") == "pin");
        REQUIRE(option.at("series").back().at("name") == "Equity");
    }

    SECTION("Close-only data drops the volume pane") {
        const auto close_only = test_helpers::sinePrices(30, {core::PriceColumn::Close});
        const json option = renderer.buildOption(close_only, {}, {});
        REQUIRE(option.at("grid").size() == 1);
    }

    SECTION("Writes the requested file") {
        const fs::path output = scratchDir() / "legacy.html";
        fs::remove(output);
        REQUIRE(renderer.render(prices, {trade}, equity, "Legacy", output.string(), false) == output.string());
        REQUIRE(readFile(output).find("echarts") != std::string::npos);
    }

    SECTION("Empty prices are rejected") {
        REQUIRE_THROWS_AS(renderer.render(core::PriceSeries{}, {}, {}, "Empty", (scratchDir() / "x.html").string(), false),
                          core::RenderException);
    }
}
