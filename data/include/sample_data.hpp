#pragma once

#include "bar_series.hpp"
#include <string>

namespace data {

    // Deterministic random-walk OHLCV series of daily bars starting at start_date
    // (YYYY-MM-DD, UTC midnight). The same seed always yields the same series.
    // Throws std::invalid_argument for num_bars < 0 or a malformed date.
    core::BarSeries generateSampleBars(int num_bars, const std::string& start_date, unsigned int seed = 42);

} // namespace data
