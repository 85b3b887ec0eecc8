#include "strategy_base.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>

namespace backtester {

    void StrategyBase::attach(const core::PriceSeries& data, Portfolio& portfolio,
                              const indicators::IndicatorCalculator& calculator)
    {
        data_ = &data;
        portfolio_ = &portfolio;
        calculator_ = &calculator;
    }

    void StrategyBase::requireAttached() const {
        if (!data_ || !portfolio_ || !calculator_) {
            throw core::BacktestException(fmt::format("Strategy '{}' is not attached to a backtest engine", getName()));
        }
    }

    void StrategyBase::step(std::size_t i) {
        requireAttached();
        next(i);
        portfolio_->recordEquity((*data_)[i].timestamp, (*data_)[i].close);
    }

    bool StrategyBase::buy(std::size_t i, long long size) {
        requireAttached();
        if (i >= data_->size()) {
            throw core::BacktestException(fmt::format("buy(): bar index {} out of range ({} bars)", i, data_->size()));
        }
        const core::Candle& bar = (*data_)[i];
        return portfolio_->buy(i, bar.timestamp, bar.close, size);
    }

    bool StrategyBase::sell(std::size_t i, long long size) {
        requireAttached();
        if (i >= data_->size()) {
            throw core::BacktestException(fmt::format("sell(): bar index {} out of range ({} bars)", i, data_->size()));
        }
        const core::Candle& bar = (*data_)[i];
        return portfolio_->sell(i, bar.timestamp, bar.close, size);
    }

    bool StrategyBase::close(std::size_t i) {
        requireAttached();
        if (portfolio_->getPosition() <= 0) {
            return false;
        }
        return sell(i, portfolio_->getPosition());
    }

    const core::PriceSeries& StrategyBase::data() const {
        requireAttached();
        return *data_;
    }

    long long StrategyBase::position() const {
        requireAttached();
        return portfolio_->getPosition();
    }

    double StrategyBase::cash() const {
        requireAttached();
        return portfolio_->getCash();
    }

    double StrategyBase::equity(std::size_t i) const {
        requireAttached();
        return portfolio_->getEquity((*data_)[i].close);
    }

    indicators::IndicatorSeries StrategyBase::indicator(const std::string& name, const json& params) const {
        requireAttached();
        return calculator_->compute(*data_, name, params);
    }

} // namespace backtester
