#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>

namespace backtester {

    Portfolio::Portfolio(double initial_capital)
        : initial_capital_(initial_capital), capital_(initial_capital) {
        if (!(initial_capital > 0) || !std::isfinite(initial_capital)) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
        equity_curve_.push_back(initial_capital_);
    }

    core::PositionState Portfolio::getState() const {
        return open_trade_ ? core::PositionState::Long : core::PositionState::Flat;
    }

    double Portfolio::markToMarket(double price) const {
        if (!open_trade_) {
            return capital_;
        }
        double unrealized = (price - open_trade_->entry_price) / open_trade_->entry_price;
        return capital_ * (1.0 + unrealized);
    }

    void Portfolio::recordBarValue(double close_price) {
        equity_curve_.push_back(markToMarket(close_price));
    }

    void Portfolio::openPosition(core::Timestamp timestamp, double price) {
        if (open_trade_) {
            throw std::logic_error("Cannot open a position while already Long.");
        }
        if (!(price > 0)) {
            throw core::DataException(fmt::format("Cannot enter at non-positive price {} on {}",
                                                  price, core::utils::timestampToString(timestamp)));
        }

        core::Trade trade;
        trade.entry_time = timestamp;
        trade.entry_price = price;
        open_trade_ = trade;

        core::logging::getLogger()->debug("Entry: Time={}, Price={:.2f}, Capital={:.2f}",
                                          core::utils::timestampToString(timestamp), price, capital_);
    }

    const core::Trade& Portfolio::closePosition(core::Timestamp timestamp, double price) {
        if (!open_trade_) {
            throw std::logic_error("Cannot close a position while Flat.");
        }

        core::Trade trade = *open_trade_;
        trade.exit_time = timestamp;
        trade.exit_price = price;
        trade.pnl = price - trade.entry_price;
        trade.return_pct = *trade.pnl / trade.entry_price * 100.0;

        capital_ *= (1.0 + *trade.return_pct / 100.0);
        trade_log_.push_back(trade);
        open_trade_.reset();

        core::logging::getLogger()->debug("Exit: Time={}, Price={:.2f}, PnL={:.2f}, Return={:.2f}%, Capital={:.2f}",
                                          core::utils::timestampToString(timestamp), price,
                                          *trade.pnl, *trade.return_pct, capital_);
        return trade_log_.back();
    }

} // namespace backtester
