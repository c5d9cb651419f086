// bar_series_test.cpp: columnar OHLCV container and validation

#include <gtest/gtest.h>

#include "bar_series.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <limits>
#include <vector>

using core::BarSeries;
using test_helpers::day;
using test_helpers::make_bars;

TEST(BarSeriesTest, FromCandles) {
    std::vector<core::Candle> candles(2);
    candles[0].timestamp = day(0);
    candles[0].open = 1.0;
    candles[0].high = 2.0;
    candles[0].low = 0.5;
    candles[0].close = 1.5;
    candles[0].volume = 100.0;
    candles[1] = candles[0];
    candles[1].timestamp = day(1);
    candles[1].close = 1.8;

    BarSeries bars = BarSeries::fromCandles(candles);
    EXPECT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars.field("close"), (std::vector<double>{1.5, 1.8}));
    EXPECT_EQ(bars.timestampAt(1), day(1));
    EXPECT_NO_THROW(bars.validate());
}

TEST(BarSeriesTest, FieldNamesAndLookup) {
    BarSeries bars = make_bars({1.0, 2.0});
    EXPECT_TRUE(bars.hasField("volume"));
    EXPECT_FALSE(bars.hasField("open_interest"));
    EXPECT_EQ(bars.fieldNames().size(), 5u);
    EXPECT_THROW(bars.field("open_interest"), core::DataException);
    EXPECT_THROW(bars.timestampAt(2), core::DataException);
}

TEST(BarSeriesTest, SetFieldRequiresMatchingLength) {
    BarSeries bars(test_helpers::days(3));
    EXPECT_THROW(bars.setField("close", {1.0, 2.0}), core::DataException);
    EXPECT_NO_THROW(bars.setField("close", {1.0, 2.0, 3.0}));
}

TEST(BarSeriesTest, ValidateRejectsMissingField) {
    for (const auto& name : core::requiredFields()) {
        BarSeries bars = test_helpers::make_bars_without(name, {1.0, 2.0});
        EXPECT_THROW(bars.validate(), core::DataException) << "missing " << name;
    }
}

TEST(BarSeriesTest, ValidateRejectsNonFiniteValues) {
    BarSeries bars = make_bars({1.0, std::numeric_limits<double>::quiet_NaN(), 3.0});
    EXPECT_THROW(bars.validate(), core::DataException);
}

TEST(BarSeriesTest, ValidateRejectsUnorderedTimestamps) {
    BarSeries bars({day(0), day(2), day(1)});
    for (const auto& name : core::requiredFields()) {
        bars.setField(name, {1.0, 1.0, 1.0});
    }
    EXPECT_THROW(bars.validate(), core::DataException);

    BarSeries duplicate({day(0), day(0)});
    for (const auto& name : core::requiredFields()) {
        duplicate.setField(name, {1.0, 1.0});
    }
    EXPECT_THROW(duplicate.validate(), core::DataException);
}

TEST(BarSeriesTest, EmptySeriesWithAllFieldsIsValid) {
    EXPECT_NO_THROW(make_bars({}).validate());
}

TEST(BarSeriesTest, DefaultSeriesLacksFields) {
    EXPECT_THROW(BarSeries().validate(), core::DataException);
}
