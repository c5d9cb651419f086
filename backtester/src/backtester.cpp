#include "backtester.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace backtester {

    Backtester::Backtester(double initial_capital)
        : initial_capital_(initial_capital)
    {
        if (!(initial_capital_ > 0) || !std::isfinite(initial_capital_)) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
        core::logging::getLogger()->debug("Backtester initialized with capital: {}", initial_capital_);
    }

    void Backtester::checkAlignment(const core::BarSeries& bars, const rule_engine::SignalSeries& signals) {
        if (signals.entry.size() != bars.size() || signals.exit.size() != bars.size() ||
            signals.timestamps.size() != bars.size()) {
            throw core::DataException(fmt::format(
                "Signal series misaligned with price series: {} bars, {} timestamps, {} entry and {} exit signals",
                bars.size(), signals.timestamps.size(), signals.entry.size(), signals.exit.size()));
        }
        const auto& index = bars.timestamps();
        for (std::size_t i = 0; i < index.size(); ++i) {
            if (signals.timestamps[i] != index[i]) {
                throw core::DataException(fmt::format(
                    "Signal series misaligned with price series at position {}: signal {} vs bar {}", i,
                    core::utils::timestampToString(signals.timestamps[i]),
                    core::utils::timestampToString(index[i])));
            }
        }
    }

    BacktestResult Backtester::run(const core::BarSeries& bars, const rule_engine::SignalSeries& signals) const
    {
        auto logger = core::logging::getLogger();
        logger->info("Starting backtest over {} bars with capital {:.2f}", bars.size(), initial_capital_);

        bars.validate();
        checkAlignment(bars, signals);

        const auto& dates = bars.timestamps();
        const auto& open = bars.field("open");
        const auto& close = bars.field("close");

        Portfolio portfolio(initial_capital_);

        for (std::size_t i = 0; i < bars.size(); ++i) {
            if (i > 0) {
                // Close before open: one bar may exit and re-enter
                if (portfolio.getState() == core::PositionState::Long && signals.exit[i - 1]) {
                    portfolio.closePosition(dates[i], open[i]);
                }
                if (portfolio.getState() == core::PositionState::Flat && signals.entry[i - 1]) {
                    portfolio.openPosition(dates[i], open[i]);
                }
            }
            portfolio.recordBarValue(close[i]);
        }

        if (portfolio.getState() == core::PositionState::Long) {
            logger->debug("Force-closing open position at final close");
            portfolio.closePosition(dates.back(), close.back());
        }

        BacktestResult result;
        result.trades = portfolio.getTradeLog();
        result.equity_curve = portfolio.getEquityCurve();
        result.metrics = calculateMetrics(initial_capital_, portfolio.getCapital(), result.trades, result.equity_curve);

        logger->info("Backtest finished: {} trades, final capital {:.2f}", result.metrics.num_trades,
                     result.metrics.final_capital);
        return result;
    }

    BacktestMetrics Backtester::calculateMetrics(double initial_capital,
                                                 double final_capital,
                                                 const std::vector<core::Trade>& trades,
                                                 const std::vector<double>& equity_curve)
    {
        BacktestMetrics metrics;
        metrics.final_capital = final_capital;
        metrics.num_trades = static_cast<int>(trades.size());

        // --- PnL and Return ---
        metrics.total_pnl = final_capital - initial_capital;
        metrics.total_return_pct = metrics.total_pnl / initial_capital * 100.0;

        // --- Max Drawdown ---
        double peak_equity = -std::numeric_limits<double>::infinity();
        double max_drawdown = 0.0;
        for (double equity : equity_curve) {
            peak_equity = std::max(peak_equity, equity);
            if (peak_equity > 0) {
                max_drawdown = std::min(max_drawdown, (equity - peak_equity) / peak_equity * 100.0);
            }
        }
        metrics.max_drawdown_pct = max_drawdown;

        // --- Trade-Based Metrics ---
        int realized_trades = 0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;

        for (const auto& trade : trades) {
            if (!trade.pnl) {
                continue; // Unrealized: excluded from win rate
            }
            ++realized_trades;
            if (*trade.pnl > 0) {
                metrics.winning_trades++;
                gross_profit += *trade.pnl;
            } else if (*trade.pnl < 0) {
                metrics.losing_trades++;
                gross_loss += *trade.pnl; // Loss is negative
            }
        }

        metrics.win_rate = (realized_trades > 0)
            ? static_cast<double>(metrics.winning_trades) / realized_trades
            : 0.0;

        if (gross_loss < 0) {
            metrics.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 0) {
            metrics.profit_factor = std::numeric_limits<double>::infinity();
        } else {
            metrics.profit_factor = 0.0;
        }

        metrics.avg_win_pnl = (metrics.winning_trades > 0) ? gross_profit / metrics.winning_trades : 0.0;
        metrics.avg_loss_pnl = (metrics.losing_trades > 0) ? gross_loss / metrics.losing_trades : 0.0; // Negative

        return metrics;
    }

} // namespace backtester
