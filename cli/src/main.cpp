// cli/src/main.cpp

#include <iostream>
#include <string>
#include <exception>
#include <fstream>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "csv_loader.hpp"
#include "database_manager.hpp"
#include "indicator_registry.hpp"
#include "strategy_factory.hpp"
#include "backtester.hpp"

using json = nlohmann::json;

namespace {

    struct CliOptions {
        std::string config_path;
        bool legacy = false;
        bool show = false;
        std::optional<std::string> output;
    };

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " <config.json> [--legacy] [--show] [--output <path>]" << std::endl;
    }

    CliOptions parseArguments(int argc, char* argv[]) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--legacy") {
                options.legacy = true;
            } else if (arg == "--show") {
                options.show = true;
            } else if (arg == "--output") {
                if (i + 1 >= argc) {
                    throw core::ConfigException("--output requires a path");
                }
                options.output = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                throw core::ConfigException("Unknown option '" + arg + "'");
            } else if (options.config_path.empty()) {
                options.config_path = arg;
            } else {
                throw core::ConfigException("Unexpected argument '" + arg + "'");
            }
        }
        if (options.config_path.empty()) {
            throw core::ConfigException("Missing run config path");
        }
        return options;
    }

    json loadConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException("Failed to open run config: " + path);
        }
        try {
            json config = json::parse(ifs);
            if (!config.is_object()) {
                throw core::ConfigException("Run config '" + path + "' must be a JSON object");
            }
            return config;
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse run config '{}': {}", path, e.what()));
        }
    }

    std::string requireString(const json& object, const char* key, const std::string& context) {
        if (!object.contains(key) || !object.at(key).is_string()) {
            throw core::ConfigException(fmt::format("'{}.{}' is required and must be a string", context, key));
        }
        return object.at(key).get<std::string>();
    }

    double numberOr(const json& object, const char* key, double fallback) {
        if (!object.contains(key)) return fallback;
        if (!object.at(key).is_number()) {
            throw core::ConfigException(fmt::format("'{}' must be a number", key));
        }
        return object.at(key).get<double>();
    }

    core::PriceSeries loadPrices(const json& config) {
        if (!config.contains("data") || !config.at("data").is_object()) {
            throw core::ConfigException("'data' is required and must be an object");
        }
        const json& data_config = config.at("data");

        if (data_config.contains("csv")) {
            return data::CsvLoader::loadFile(requireString(data_config, "csv", "data"));
        }

        if (data_config.contains("sqlite")) {
            const std::string db_path = requireString(data_config, "sqlite", "data");
            const std::string instrument = requireString(data_config, "instrument", "data");
            const std::string interval = data_config.contains("interval")
                ? requireString(data_config, "interval", "data") : std::string("day");
            core::Timestamp start_time;
            core::Timestamp end_time;
            try {
                start_time = core::utils::stringToTimestamp(requireString(data_config, "start", "data"));
                std::string end_text = requireString(data_config, "end", "data");
                if (end_text.size() == 10) end_text += " 23:59:59";    // Date-only end bound covers the whole day
                end_time = core::utils::stringToTimestamp(end_text);
            } catch (const core::ConfigException&) {
                throw;
            } catch (const std::exception& e) {
                throw core::ConfigException(fmt::format("Invalid 'data.start'/'data.end' date: {}", e.what()));
            }

            data::DatabaseManager db_manager(db_path);
            if (!db_manager.connect()) {
                throw core::DataLoadException("Cannot open SQLite database '" + db_path + "'");
            }
            if (!db_manager.initializeSchema()) {
                throw core::DataLoadException("Cannot initialize candle schema in '" + db_path + "'");
            }
            core::PriceSeries prices = db_manager.queryCandles(instrument, interval, start_time, end_time);
            if (prices.empty()) {
                throw core::DataLoadException(fmt::format("No candles for {} ({}) in '{}'", instrument, interval, db_path));
            }
            return prices;
        }

        throw core::ConfigException("'data' must contain either 'csv' or 'sqlite'");
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        core::logging::initialize("strategy_charts", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();

        CliOptions options;
        try {
            options = parseArguments(argc, argv);
        } catch (const core::ConfigException&) {
            printUsage(argc > 0 ? argv[0] : "strategy_charts");
            throw;
        }

        // --- Load run config ---
        logger->info("Loading run config from: {}", options.config_path);
        const json config = loadConfig(options.config_path);
        const json plot_config = config.value("plot", json::object());
        if (!plot_config.is_object()) {
            throw core::ConfigException("'plot' must be an object");
        }

        // --- Prices, strategy, engine ---
        core::PriceSeries prices = loadPrices(config);
        logger->info("Loaded {} bars", prices.size());

        const auto registry = indicators::IndicatorRegistry::withBuiltins();
        auto strategy = backtester::StrategyFactory::createStrategy(config);

        backtester::BacktestEngine engine(std::move(prices), std::move(strategy), registry,
                                          numberOr(config, "cash", 10000.0),
                                          numberOr(config, "commission", 0.002));
        engine.getStrategy().plotConfig().applyJson(plot_config);

        // --- Run ---
        const backtester::BacktestMetrics metrics = engine.run();
        std::cout << fmt::format("Return: {:.2f}%  Annualized: {:.2f}%  Max Drawdown: {:.2f}%  Sharpe: {:.2f}  Executions: {}",
                                 metrics.return_pct, metrics.annualized_return_pct, metrics.max_drawdown_pct,
                                 metrics.sharpe_ratio, metrics.executions)
                  << std::endl;

        // --- Plot ---
        const std::string renderer = plot_config.contains("renderer")
            ? requireString(plot_config, "renderer", "plot") : std::string("auto");
        if (renderer != "auto" && renderer != "legacy") {
            throw core::ConfigException("'plot.renderer' must be \"auto\" or \"legacy\", got \"" + renderer + "\"");
        }
        const bool use_auto_plotter = !options.legacy && renderer == "auto";
        const std::string output = options.output ? *options.output
            : (plot_config.contains("output") ? requireString(plot_config, "output", "plot") : std::string());
        const std::string title = plot_config.contains("title") ? requireString(plot_config, "title", "plot") : std::string();
        bool show = options.show;
        if (!show && plot_config.contains("show")) {
            if (!plot_config.at("show").is_boolean()) {
                throw core::ConfigException("'plot.show' must be a boolean");
            }
            show = plot_config.at("show").get<bool>();
        }

        const std::string written = engine.plot(output, show, use_auto_plotter, title);
        std::cout << "Chart written to " << written << std::endl;
        logger->info("strategy_charts finished.");

    } catch (const core::StrategyChartsException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
