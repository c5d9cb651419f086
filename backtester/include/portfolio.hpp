// backtester/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <optional>

// Use short paths
#include "datatypes.hpp" // Provides core::Timestamp, core::PositionState, core::Trade
#include "logging.hpp"   // Provides core::logging::getLogger needed by BacktestMetrics::logMetrics

namespace backtester {

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double total_return_pct = 0.0;  // (final - initial) / initial * 100
        double win_rate = 0.0;          // Fraction of closed trades with pnl > 0
        int num_trades = 0;
        double max_drawdown_pct = 0.0;  // Non-positive: deepest fall below the running peak, in %
        double final_capital = 0.0;
        double total_pnl = 0.0;         // final - initial capital
        int winning_trades = 0;
        int losing_trades = 0;
        double profit_factor = 0.0;     // Gross profit / |gross loss|
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;

        // Helper method to log calculated metrics
        void logMetrics() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Backtest Metrics ---");
            logger->info("Final Capital: {:.2f}", final_capital);
            logger->info("Total Return: {:.2f}%", total_return_pct);
            logger->info("Total PnL: {:.2f}", total_pnl);
            logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct);
            logger->info("Trades: {} ({} winning, {} losing)", num_trades, winning_trades, losing_trades);
            logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
            logger->info("Profit Factor: {:.2f}", profit_factor);
            logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
            logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
            logger->info("------------------------");
        }
    };

    // --- Portfolio Class Definition ---
    // Long-only, single instrument, fully invested: capital compounds by each
    // closed trade's return. The equity curve starts at the initial capital.
    class Portfolio {
    public:
        explicit Portfolio(double initial_capital);

        // --- Getters ---
        double getInitialCapital() const { return initial_capital_; }
        double getCapital() const { return capital_; }
        core::PositionState getState() const;
        const std::optional<core::Trade>& getOpenTrade() const { return open_trade_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }
        const std::vector<double>& getEquityCurve() const { return equity_curve_; }

        // Capital marked to market at the given price (unrealized return compounded
        // onto current capital while Long, plain capital while Flat)
        double markToMarket(double price) const;

        // --- Modifiers ---
        // Throws std::logic_error when already Long; core::DataException for a non-positive price
        void openPosition(core::Timestamp timestamp, double price);
        // Throws std::logic_error when Flat. Returns the completed trade.
        const core::Trade& closePosition(core::Timestamp timestamp, double price);
        // Appends one equity curve value marked at the bar's close
        void recordBarValue(double close_price);

    private:
        double initial_capital_;
        double capital_;
        std::optional<core::Trade> open_trade_;
        std::vector<core::Trade> trade_log_;
        std::vector<double> equity_curve_;
    };

} // namespace backtester
