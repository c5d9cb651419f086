// indicator_test.cpp: SMA warm-up and RSI smoothing

#include <gtest/gtest.h>

#include "rsi_indicator.hpp"
#include "sma_indicator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using indicators::RsiIndicator;
using indicators::SmaIndicator;

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();
}  // namespace

// ===========================================================================
// 1. SmaIndicator
// ===========================================================================
TEST(SmaIndicatorTest, NameAndLookback) {
    SmaIndicator sma(20);
    EXPECT_EQ(sma.getName(), "SMA(20)");
    EXPECT_EQ(sma.getLookback(), 19);
}

TEST(SmaIndicatorTest, NonPositivePeriodThrows) {
    EXPECT_THROW(SmaIndicator(0), std::invalid_argument);
    EXPECT_THROW(SmaIndicator(-3), std::invalid_argument);
}

TEST(SmaIndicatorTest, ExpandingMeanThenFullWindow) {
    SmaIndicator sma(3);
    sma.calculate({1.0, 2.0, 3.0, 4.0, 5.0, 9.0});
    const auto& r = sma.getResult();
    ASSERT_EQ(r.size(), 6u);
    EXPECT_DOUBLE_EQ(r[0], 1.0);
    EXPECT_DOUBLE_EQ(r[1], 1.5);
    EXPECT_DOUBLE_EQ(r[2], 2.0);
    EXPECT_DOUBLE_EQ(r[3], 3.0);
    EXPECT_DOUBLE_EQ(r[4], 4.0);
    EXPECT_DOUBLE_EQ(r[5], 6.0);
}

TEST(SmaIndicatorTest, SeriesShorterThanWindowIsAllWarmUp) {
    SmaIndicator sma(5);
    sma.calculate({2.0, 4.0});
    const auto& r = sma.getResult();
    ASSERT_EQ(r.size(), 2u);
    EXPECT_DOUBLE_EQ(r[0], 2.0);
    EXPECT_DOUBLE_EQ(r[1], 3.0);
}

TEST(SmaIndicatorTest, PeriodOneIsIdentity) {
    SmaIndicator sma(1);
    sma.calculate({3.0, 1.0, 4.0});
    EXPECT_EQ(sma.getResult(), (std::vector<double>{3.0, 1.0, 4.0}));
}

TEST(SmaIndicatorTest, LeadingMissingValuesStayMissing) {
    SmaIndicator sma(2);
    sma.calculate({kNaN, 1.0, 2.0, 3.0});
    const auto& r = sma.getResult();
    ASSERT_EQ(r.size(), 4u);
    EXPECT_TRUE(std::isnan(r[0]));
    EXPECT_DOUBLE_EQ(r[1], 1.0);
    EXPECT_DOUBLE_EQ(r[2], 1.5);
    EXPECT_DOUBLE_EQ(r[3], 2.5);
}

TEST(SmaIndicatorTest, WindowBeyondTaLibRangeUsesAvailableBars) {
    SmaIndicator sma(200000);
    EXPECT_EQ(sma.getLookback(), 199999);
    sma.calculate({2.0, 4.0, 6.0, 8.0});
    const auto& r = sma.getResult();
    ASSERT_EQ(r.size(), 4u);
    EXPECT_DOUBLE_EQ(r[0], 2.0);
    EXPECT_DOUBLE_EQ(r[1], 3.0);
    EXPECT_DOUBLE_EQ(r[3], 5.0);
}

TEST(SmaIndicatorTest, FullWindowBeyondTaLibRange) {
    const int period = 100001;
    std::vector<double> input(period + 2);
    for (std::size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<double>(i);
    }
    SmaIndicator sma(period);
    sma.calculate(input);
    const auto& r = sma.getResult();
    ASSERT_EQ(r.size(), input.size());
    EXPECT_DOUBLE_EQ(r[period - 2], (period - 2) / 2.0);
    EXPECT_DOUBLE_EQ(r[period - 1], 50000.0);
    EXPECT_DOUBLE_EQ(r[period + 1], 50002.0);
}

TEST(SmaIndicatorTest, EmptyInput) {
    SmaIndicator sma(3);
    sma.calculate({});
    EXPECT_TRUE(sma.getResult().empty());
}

// ===========================================================================
// 2. RsiIndicator
// ===========================================================================
TEST(RsiIndicatorTest, NameAndLookback) {
    RsiIndicator rsi(14);
    EXPECT_EQ(rsi.getName(), "RSI(14)");
    EXPECT_EQ(rsi.getLookback(), 13);
}

TEST(RsiIndicatorTest, NonPositivePeriodThrows) {
    EXPECT_THROW(RsiIndicator(0), std::invalid_argument);
}

TEST(RsiIndicatorTest, NeutralUntilEnoughObservations) {
    RsiIndicator rsi(4);
    rsi.calculate({1.0, 2.0, 3.0, 4.0, 5.0});
    const auto& r = rsi.getResult();
    ASSERT_EQ(r.size(), 5u);
    EXPECT_DOUBLE_EQ(r[0], 50.0);
    EXPECT_DOUBLE_EQ(r[1], 50.0);
    EXPECT_DOUBLE_EQ(r[2], 50.0);
    EXPECT_NEAR(r[3], 100.0, 1e-6);
    EXPECT_NEAR(r[4], 100.0, 1e-6);
}

TEST(RsiIndicatorTest, WilderSmoothing) {
    // alpha = 1/2; bar 0 counts as a zero move
    // bar 1: +1 -> avg_gain 0.5, avg_loss 0
    // bar 2: -1 -> avg_gain 0.25, avg_loss 0.5 -> RSI = 100 - 100 / 1.5
    RsiIndicator rsi(2);
    rsi.calculate({10.0, 11.0, 10.0});
    const auto& r = rsi.getResult();
    ASSERT_EQ(r.size(), 3u);
    EXPECT_DOUBLE_EQ(r[0], 50.0);
    EXPECT_NEAR(r[1], 100.0, 1e-6);
    EXPECT_NEAR(r[2], 100.0 - 100.0 / 1.5, 1e-6);
}

TEST(RsiIndicatorTest, FallingSeriesApproachesZero) {
    RsiIndicator rsi(3);
    rsi.calculate({10.0, 9.0, 8.0, 7.0});
    const auto& r = rsi.getResult();
    EXPECT_NEAR(r[2], 0.0, 1e-6);
    EXPECT_NEAR(r[3], 0.0, 1e-6);
}

TEST(RsiIndicatorTest, ValuesStayInRange) {
    RsiIndicator rsi(5);
    std::vector<double> input;
    for (int i = 0; i < 60; ++i) {
        input.push_back(100.0 + 5.0 * std::sin(i * 0.4));
    }
    rsi.calculate(input);
    for (double v : rsi.getResult()) {
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 100.0);
    }
}
