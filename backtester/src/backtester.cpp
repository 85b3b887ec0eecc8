#include "backtester.hpp"
#include "chart_renderer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace backtester {

    namespace {
        const double kBarsPerYear = 252.0;   // Daily bars
        const double kSharpeEpsilon = 1e-9;
    }

    BacktestEngine::BacktestEngine(core::PriceSeries data,
                                   std::unique_ptr<StrategyBase> strategy,
                                   const indicators::IndicatorRegistry& registry,
                                   double cash,
                                   double commission)
        : data_(std::move(data)),
          strategy_(std::move(strategy)),
          calculator_(registry),
          plotter_(registry)
    {
        if (!strategy_) {
            throw core::BacktestException("BacktestEngine requires a strategy");
        }
        if (data_.empty()) {
            throw core::BacktestException("BacktestEngine requires non-empty price data");
        }
        portfolio_ = std::make_unique<Portfolio>(cash, commission);
        strategy_->attach(data_, *portfolio_, calculator_);

        auto logger = core::logging::getLogger();
        logger->debug("BacktestEngine initialized: strategy '{}', {} bars, cash {:.2f}, commission {}",
                      strategy_->getName(), data_.size(), cash, commission);
        strategy_->init();
    }

    BacktestMetrics BacktestEngine::run() {
        auto logger = core::logging::getLogger();
        if (has_run_) {
            throw core::BacktestException("Backtest already ran; build a new engine to run again");
        }
        logger->info("========================================================");
        logger->info("Starting Backtest Run: {}", strategy_->getName());
        logger->info("Period: {} to {} ({} bars)",
                     core::utils::timestampToString(data_.candles().front().timestamp),
                     core::utils::timestampToString(data_.candles().back().timestamp), data_.size());
        logger->info("========================================================");

        for (std::size_t i = 0; i < data_.size(); ++i) {
            strategy_->step(i);
        }
        has_run_ = true;

        calculateMetrics();
        logger->info("Backtest Run Completed for Strategy '{}'", strategy_->getName());
        metrics_.logMetrics();
        return metrics_;
    }

    void BacktestEngine::calculateMetrics() {
        auto logger = core::logging::getLogger();
        logger->info("Calculating performance metrics...");

        const auto& equity_curve = portfolio_->getEquityCurve();
        const auto& trade_log = portfolio_->getTradeLog();

        BacktestMetrics metrics;
        metrics.executions = static_cast<int>(portfolio_->getExecutions().size());
        metrics.round_trip_trades = static_cast<int>(trade_log.size());
        if (!trade_log.empty()) {
            const auto winners = std::count_if(trade_log.begin(), trade_log.end(),
                                               [](const core::Trade& trade) { return trade.pnl > 0.0; });
            metrics.win_rate = static_cast<double>(winners) / static_cast<double>(trade_log.size());
        }

        if (equity_curve.empty()) {
            logger->warn("No equity points recorded; metrics left at zero");
            metrics_ = metrics;
            return;
        }

        // --- Return ---
        const double first_equity = equity_curve.front().equity;
        const double final_equity = equity_curve.back().equity;
        if (equity_curve.size() > 1 && first_equity != 0.0) {
            metrics.return_pct = (final_equity / first_equity - 1.0) * 100.0;
        }

        // --- Max Drawdown ---
        double peak_equity = first_equity;
        double max_drawdown = 0.0;
        for (const auto& point : equity_curve) {
            peak_equity = std::max(peak_equity, point.equity);
            if (peak_equity > 0.0) {
                max_drawdown = std::min(max_drawdown, point.equity / peak_equity - 1.0);
            }
        }
        metrics.max_drawdown_pct = max_drawdown * 100.0;

        // --- Bar returns (first bar counts as 0) ---
        std::vector<double> returns;
        returns.reserve(equity_curve.size());
        returns.push_back(0.0);
        for (std::size_t i = 1; i < equity_curve.size(); ++i) {
            const double previous = equity_curve[i - 1].equity;
            returns.push_back(previous != 0.0 ? equity_curve[i].equity / previous - 1.0 : 0.0);
        }
        const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
        metrics.annualized_return_pct = (std::pow(1.0 + mean, kBarsPerYear) - 1.0) * 100.0;

        // --- Sharpe Ratio (sample standard deviation) ---
        if (returns.size() > 1) {
            double squared = 0.0;
            for (double r : returns) {
                squared += (r - mean) * (r - mean);
            }
            const double stddev = std::sqrt(squared / static_cast<double>(returns.size() - 1));
            metrics.sharpe_ratio = mean / (stddev + kSharpeEpsilon) * std::sqrt(kBarsPerYear);
        }

        metrics_ = metrics;
    }

    std::vector<core::Trade> BacktestEngine::plotTrades() const {
        std::vector<core::Trade> trades = portfolio_->getTradeLog();
        if (auto open_trade = portfolio_->getOpenTrade()) {
            trades.push_back(*open_trade);
        }
        return trades;
    }

    std::string BacktestEngine::plot(const std::string& filename, bool show, bool use_auto_plotter, const std::string& title) {
        if (!has_run_ || portfolio_->getEquityCurve().empty()) {
            throw core::BacktestException("No equity curve to plot; call run() first");
        }
        const std::string chart_title = title.empty() ? strategy_->getName() : title;
        auto renderer = plotting::makeRenderer(use_auto_plotter, plotter_, strategy_->plotConfig());
        core::logging::getLogger()->info("Plotting '{}' with the {} renderer", chart_title, renderer->name());
        return renderer->render(data_, plotTrades(), portfolio_->getEquityCurve(), chart_title, filename, show);
    }

} // namespace backtester
