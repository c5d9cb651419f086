#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 string in UTC (e.g. 2023-01-02T00:00:00Z)
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string with 'Z' or +HH:MM/-HH:MM offset to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Daily bars: "YYYY-MM-DD" <-> UTC midnight
    Timestamp dateToTimestamp(const std::string& date);
    std::string timestampToDateString(const Timestamp& ts);

} // namespace utils
} // namespace core
