// utils_test.cpp: timestamp conversions

#include <gtest/gtest.h>

#include "utils.hpp"

#include <chrono>
#include <stdexcept>

using namespace core::utils;

TEST(UtilsTest, DateRoundTrip) {
    core::Timestamp ts = dateToTimestamp("2024-02-29");
    EXPECT_EQ(timestampToDateString(ts), "2024-02-29");
    EXPECT_EQ(timestampToString(ts), "2024-02-29T00:00:00Z");
}

TEST(UtilsTest, DateIsUtcMidnight) {
    EXPECT_EQ(std::chrono::system_clock::to_time_t(dateToTimestamp("1970-01-02")), 86400);
}

TEST(UtilsTest, ParsesZuluAndOffsets) {
    EXPECT_EQ(stringToTimestamp("2023-01-02T00:00:00Z"), dateToTimestamp("2023-01-02"));
    EXPECT_EQ(stringToTimestamp("2023-01-02T05:30:00+05:30"), dateToTimestamp("2023-01-02"));
    EXPECT_EQ(stringToTimestamp("2023-01-01T20:00:00-04:00"), dateToTimestamp("2023-01-02"));
}

TEST(UtilsTest, FractionalSeconds) {
    core::Timestamp ts = stringToTimestamp("2023-01-02T00:00:00.500Z");
    EXPECT_EQ(ts - dateToTimestamp("2023-01-02"), std::chrono::milliseconds(500));
}

TEST(UtilsTest, MalformedInputThrows) {
    EXPECT_THROW(dateToTimestamp("02/01/2023"), std::invalid_argument);
    EXPECT_THROW(dateToTimestamp("2023-01-02T00:00:00Z"), std::invalid_argument);
    EXPECT_THROW(stringToTimestamp("2023-01-02T00:00:00"), std::invalid_argument);
    EXPECT_THROW(stringToTimestamp("2023-01-02T00:00:00X"), std::invalid_argument);
    EXPECT_THROW(stringToTimestamp("yesterday"), std::invalid_argument);
}
