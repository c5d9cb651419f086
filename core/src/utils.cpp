#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::invalid_argument
#include <cmath>      // For std::pow
#include <cctype>     // For std::isdigit
#include <ctime>      // For timegm / gmtime_r

namespace core {
namespace utils {

    namespace {

        time_t toEpochSeconds(std::tm& tm) {
            // timegm interprets struct tm as UTC; _mkgmtime on Windows
            #ifdef _WIN32
                return _mkgmtime(&tm);
            #else
                return timegm(&tm);
            #endif
        }

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::invalid_argument("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::invalid_argument("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
            throw std::invalid_argument("Timestamp missing timezone offset/indicator: " + iso_string);
        }

        time_t tt = toEpochSeconds(tm);
        if (tt == static_cast<time_t>(-1)) {
            throw std::invalid_argument("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2023-01-02T05:30:00+05:30 is 2023-01-02T00:00:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    Timestamp dateToTimestamp(const std::string& date) {
        std::tm tm = {};
        std::istringstream ss(date);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Failed to parse date (expected YYYY-MM-DD): " + date);
        }
        time_t tt = toEpochSeconds(tm);
        if (tt == static_cast<time_t>(-1)) {
            throw std::invalid_argument("Failed to convert date to UTC epoch seconds: " + date);
        }
        return std::chrono::system_clock::from_time_t(tt);
    }

    std::string timestampToDateString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

} // namespace utils
} // namespace core
