// pipeline_test.cpp: rule text to metrics on synthetic bars

#include <gtest/gtest.h>

#include "backtester.hpp"
#include "parser.hpp"
#include "result_io.hpp"
#include "sample_data.hpp"
#include "signal_evaluator.hpp"

#include <algorithm>
#include <string>

namespace {

const char* kRules =
    "ENTRY: close crosses above SMA(close, 20) AND volume > 500K\n"
    "EXIT: close crosses below SMA(close, 20) OR RSI(close, 14) > 70";

}  // namespace

class PipelineTest : public ::testing::Test {
protected:
    core::BarSeries bars_ = data::generateSampleBars(250, "2023-01-01", 42);
    rule_engine::Strategy strategy_ = rule_engine::compile(kRules);
    rule_engine::SignalEvaluator evaluator_;
    backtester::Backtester backtester_{100000.0};
};

TEST_F(PipelineTest, TradesFollowSignalsByOneBar) {
    rule_engine::SignalSeries signals = evaluator_.evaluate(bars_, strategy_);
    backtester::BacktestResult result = backtester_.run(bars_, signals);

    const auto& index = bars_.timestamps();
    const auto& open = bars_.field("open");
    for (const auto& trade : result.trades) {
        auto it = std::find(index.begin(), index.end(), trade.entry_time);
        ASSERT_TRUE(it != index.end());
        std::size_t k = static_cast<std::size_t>(it - index.begin());
        ASSERT_GT(k, 0u);
        EXPECT_TRUE(signals.entry[k - 1]);
        EXPECT_DOUBLE_EQ(trade.entry_price, open[k]);
        EXPECT_TRUE(trade.isClosed());
    }
    EXPECT_EQ(result.equity_curve.size(), bars_.size() + 1);
    EXPECT_DOUBLE_EQ(result.equity_curve.front(), 100000.0);
    EXPECT_LE(result.metrics.max_drawdown_pct, 0.0);
    EXPECT_EQ(result.metrics.num_trades, static_cast<int>(result.trades.size()));
}

TEST_F(PipelineTest, CrossSignalsNeverFireOnFirstBar) {
    rule_engine::SignalSeries signals = evaluator_.evaluate(bars_, rule_engine::compile(
        "ENTRY: close crosses above SMA(close, 5) EXIT: close crosses below SMA(close, 5)"));
    EXPECT_FALSE(signals.entry[0]);
    EXPECT_FALSE(signals.exit[0]);
}

TEST_F(PipelineTest, RepeatedRunsAreBitIdentical) {
    auto first_signals = evaluator_.evaluate(bars_, strategy_);
    auto second_signals = evaluator_.evaluate(bars_, strategy_);
    EXPECT_EQ(first_signals.entry, second_signals.entry);
    EXPECT_EQ(first_signals.exit, second_signals.exit);

    auto first = backtester_.run(bars_, first_signals);
    auto second = backtester_.run(bars_, second_signals);
    EXPECT_EQ(backtester::toJson(first).dump(), backtester::toJson(second).dump());
}

TEST_F(PipelineTest, LastTradeIsForceClosedOnFinalBar) {
    // Always in the market after the first bar; never exits
    auto signals = evaluator_.evaluate(bars_, rule_engine::compile("ENTRY: close > 0"));
    auto result = backtester_.run(bars_, signals);
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(*result.trades.back().exit_time, bars_.timestamps().back());
    EXPECT_DOUBLE_EQ(*result.trades.back().exit_price, bars_.field("close").back());
    EXPECT_NEAR(result.metrics.final_capital, result.equity_curve.back(), 1e-6);
}
