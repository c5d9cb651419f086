#pragma once

#include <string>
#include <vector>
#include <array>
#include <chrono>   // For timestamps
#include <optional> // For fields that stay empty until a trade is closed

namespace core {

    // Using system_clock for time points; bars are stamped at UTC midnight
    using Timestamp = std::chrono::system_clock::time_point;

    // Basic TimeSeries concept: index-aligned with the owning bar series
    template<typename T>
    using TimeSeries = std::vector<T>;

    // Field names every OHLCV series must carry
    inline const std::array<std::string, 5>& requiredFields() {
        static const std::array<std::string, 5> fields{"open", "high", "low", "close", "volume"};
        return fields;
    }

    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;
    };

    // Simulator state at a bar boundary (long-only)
    enum class PositionState {
        Flat,
        Long
    };

    struct Trade {
        Timestamp entry_time;
        double entry_price = 0.0;
        std::optional<Timestamp> exit_time;  // Empty while the trade is open
        std::optional<double> exit_price;
        std::optional<double> pnl;           // exit_price - entry_price, per unit
        std::optional<double> return_pct;    // pnl / entry_price * 100

        bool isClosed() const { return exit_time.has_value(); }
    };

} // namespace core
