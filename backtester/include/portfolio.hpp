// backtester/include/portfolio.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

// Use short paths
#include "datatypes.hpp" // Provides core::Timestamp, core::Execution, core::Trade, core::EquityCurve
#include "logging.hpp"   // Provides core::logging::getLogger needed by BacktestMetrics::logMetrics

namespace backtester {

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double return_pct = 0.0;             // (final / initial - 1) * 100
        double annualized_return_pct = 0.0;  // Mean bar return compounded over 252 bars
        double max_drawdown_pct = 0.0;       // Most negative (equity / running peak - 1) * 100
        double sharpe_ratio = 0.0;           // mean / stddev of bar returns * sqrt(252)
        int executions = 0;                  // Buy and sell executions
        int round_trip_trades = 0;
        double win_rate = 0.0;               // Winning round trips / round trips

        // Helper method to log calculated metrics
        void logMetrics() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Backtest Metrics ---");
            logger->info("Return [%]: {:.2f}", return_pct);
            logger->info("Return (Ann.) [%]: {:.2f}", annualized_return_pct);
            logger->info("Max. Drawdown [%]: {:.2f}", max_drawdown_pct);
            logger->info("Sharpe Ratio: {:.2f}", sharpe_ratio);
            logger->info("# Executions: {}", executions);
            logger->info("# Round Trips: {}", round_trip_trades);
            logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
            logger->info("------------------------");
        }
    };

    // --- Open Position Info Struct ---
    // Accumulates the legs of the current long position until it is flat again
    struct OpenPositionInfo {
        core::Timestamp entry_time;
        long long bought_quantity = 0;
        double bought_value = 0.0;
        long long sold_quantity = 0;
        double sold_value = 0.0;
        double commission = 0.0;
    };

    // --- Portfolio Class Definition ---
    // Single-instrument, long-only book with a proportional commission on every execution.
    class Portfolio {
    public:
        Portfolio(double initial_cash, double commission_rate);

        // --- Getters ---
        double getInitialCash() const { return initial_cash_; }
        double getCommissionRate() const { return commission_rate_; }
        double getCash() const { return cash_; }
        long long getPosition() const { return position_; }
        double getAveragePrice() const { return average_price_; }
        double getEquity(double mark_price) const { return cash_ + static_cast<double>(position_) * mark_price; }
        const core::EquityCurve& getEquityCurve() const { return equity_curve_; }
        const std::vector<core::Execution>& getExecutions() const { return executions_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }

        // The position still held, as a trade with only its entry leg filled in.
        // std::nullopt when flat.
        std::optional<core::Trade> getOpenTrade() const;

        // --- Modifiers ---
        // Buys `size` units at `price`; cost includes commission. Returns false (and changes
        // nothing) if size is not positive or cash does not cover the cost.
        bool buy(std::size_t bar_index, core::Timestamp timestamp, double price, long long size);

        // Sells `size` units at `price`; proceeds are net of commission. Returns false if
        // size is not positive or exceeds the position.
        bool sell(std::size_t bar_index, core::Timestamp timestamp, double price, long long size);

        // Appends cash + position * mark_price to the equity curve
        void recordEquity(core::Timestamp timestamp, double mark_price);

    private:
        void closeRoundTrip(core::Timestamp exit_time);

        double initial_cash_;
        double commission_rate_;
        double cash_;
        long long position_ = 0;
        double average_price_ = 0.0;
        OpenPositionInfo open_position_;
        std::vector<core::Execution> executions_;
        std::vector<core::Trade> trade_log_;
        core::EquityCurve equity_curve_;
    };

} // namespace backtester
