#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace backtester {

    Portfolio::Portfolio(double initial_cash, double commission_rate)
        : initial_cash_(initial_cash), commission_rate_(commission_rate), cash_(initial_cash)
    {
        if (!(initial_cash > 0.0) || !std::isfinite(initial_cash)) {
            throw core::BacktestException(fmt::format("Initial cash must be positive, got {}", initial_cash));
        }
        if (!(commission_rate >= 0.0) || commission_rate >= 1.0) {
            throw core::BacktestException(fmt::format("Commission rate must be in [0, 1), got {}", commission_rate));
        }
    }

    bool Portfolio::buy(std::size_t bar_index, core::Timestamp timestamp, double price, long long size) {
        auto logger = core::logging::getLogger();
        if (size <= 0) {
            logger->warn("Ignoring buy of non-positive size {} at bar {}", size, bar_index);
            return false;
        }
        const double value = price * static_cast<double>(size);
        const double commission = value * commission_rate_;
        const double cost = value + commission;
        if (cash_ < cost) {
            logger->debug("Insufficient cash for buy at bar {}: have {:.2f}, need {:.2f}", bar_index, cash_, cost);
            return false;
        }

        if (position_ == 0) {
            open_position_ = OpenPositionInfo{};
            open_position_.entry_time = timestamp;
        }
        const double total_cost = average_price_ * static_cast<double>(position_) + value;
        position_ += size;
        average_price_ = total_cost / static_cast<double>(position_);
        cash_ -= cost;

        open_position_.bought_quantity += size;
        open_position_.bought_value += value;
        open_position_.commission += commission;
        executions_.push_back(core::Execution{bar_index, timestamp, true, price, size, cash_});

        logger->debug("BUY  {} @ {:.2f} on {} (comm {:.2f}) -> cash {:.2f}, position {}",
                      size, price, core::utils::timestampToString(timestamp), commission, cash_, position_);
        return true;
    }

    bool Portfolio::sell(std::size_t bar_index, core::Timestamp timestamp, double price, long long size) {
        auto logger = core::logging::getLogger();
        if (size <= 0) {
            logger->warn("Ignoring sell of non-positive size {} at bar {}", size, bar_index);
            return false;
        }
        if (size > position_) {
            logger->debug("Cannot sell {} at bar {}: position is {} (long-only)", size, bar_index, position_);
            return false;
        }
        const double value = price * static_cast<double>(size);
        const double commission = value * commission_rate_;
        position_ -= size;
        cash_ += value - commission;

        open_position_.sold_quantity += size;
        open_position_.sold_value += value;
        open_position_.commission += commission;
        executions_.push_back(core::Execution{bar_index, timestamp, false, price, size, cash_});

        logger->debug("SELL {} @ {:.2f} on {} (comm {:.2f}) -> cash {:.2f}, position {}",
                      size, price, core::utils::timestampToString(timestamp), commission, cash_, position_);

        if (position_ == 0) {
            average_price_ = 0.0;
            closeRoundTrip(timestamp);
        }
        return true;
    }

    void Portfolio::closeRoundTrip(core::Timestamp exit_time) {
        const OpenPositionInfo& info = open_position_;
        core::Trade trade;
        trade.direction = core::TradeDirection::Long;
        trade.entry_time = info.entry_time;
        trade.exit_time = exit_time;
        trade.quantity = info.bought_quantity;
        trade.entry_price = info.bought_value / static_cast<double>(info.bought_quantity);
        trade.exit_price = info.sold_value / static_cast<double>(info.sold_quantity);
        trade.commission = info.commission;
        trade.pnl = info.sold_value - info.bought_value - info.commission;
        trade.return_pct = info.bought_value != 0.0 ? trade.pnl / info.bought_value : 0.0;
        trade_log_.push_back(trade);

        core::logging::getLogger()->debug("Round trip closed: {} -> {}, PnL = {:.2f}",
                                          core::utils::timestampToString(trade.entry_time),
                                          core::utils::timestampToString(trade.exit_time), trade.pnl);
        open_position_ = OpenPositionInfo{};
    }

    std::optional<core::Trade> Portfolio::getOpenTrade() const {
        if (position_ == 0) return std::nullopt;
        core::Trade trade;
        trade.direction = core::TradeDirection::Long;
        trade.entry_time = open_position_.entry_time;
        trade.is_open = true;
        trade.quantity = position_;
        trade.entry_price = open_position_.bought_value / static_cast<double>(open_position_.bought_quantity);
        trade.commission = open_position_.commission;
        return trade;
    }

    void Portfolio::recordEquity(core::Timestamp timestamp, double mark_price) {
        // Avoid duplicate entries for the same timestamp
        if (!equity_curve_.empty() && equity_curve_.back().timestamp == timestamp) {
            equity_curve_.back().equity = getEquity(mark_price);
            return;
        }
        equity_curve_.push_back(core::EquityPoint{timestamp, getEquity(mark_price)});
    }

} // namespace backtester
