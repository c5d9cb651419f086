#pragma once

#include <vector>

// Required project headers (use short paths)
#include "bar_series.hpp"
#include "datatypes.hpp"
#include "portfolio.hpp"
#include "signal_evaluator.hpp" // rule_engine::SignalSeries

namespace backtester {

    struct BacktestResult {
        std::vector<core::Trade> trades;   // Every trade is closed
        BacktestMetrics metrics;
        std::vector<double> equity_curve;  // bars + 1 values, starting at initial capital
    };

    // Replays signals bar by bar with next-bar execution: a signal seen on bar
    // i-1 fills at bar i's open. An open position is closed at the last close.
    class Backtester {
    public:
        explicit Backtester(double initial_capital = 100000.0);

        double getInitialCapital() const { return initial_capital_; }

        // Throws core::DataException when the bars fail validation or the signals
        // are not aligned with the bar index (length and every timestamp).
        BacktestResult run(const core::BarSeries& bars, const rule_engine::SignalSeries& signals) const;

        static BacktestMetrics calculateMetrics(double initial_capital,
                                                double final_capital,
                                                const std::vector<core::Trade>& trades,
                                                const std::vector<double>& equity_curve);

    private:
        double initial_capital_;

        static void checkAlignment(const core::BarSeries& bars, const rule_engine::SignalSeries& signals);
    };

} // namespace backtester
