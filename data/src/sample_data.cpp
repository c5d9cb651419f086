#include "sample_data.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <random>
#include <stdexcept>

namespace data {

core::BarSeries generateSampleBars(int num_bars, const std::string& start_date, unsigned int seed) {
    if (num_bars < 0) {
        throw std::invalid_argument("Number of sample bars must not be negative.");
    }

    const core::Timestamp start = core::utils::dateToTimestamp(start_date);
    const std::size_t count = static_cast<std::size_t>(num_bars);

    std::mt19937 rng(seed);
    std::normal_distribution<double> step(0.0, 0.5);
    std::uniform_real_distribution<double> wick(0.0, 1.0);
    std::uniform_int_distribution<int> volume_dist(500000, 1999999);

    std::vector<core::Timestamp> timestamps;
    core::TimeSeries<double> open, high, low, close, volume;
    timestamps.reserve(count);
    open.reserve(count);
    high.reserve(count);
    low.reserve(count);
    close.reserve(count);
    volume.reserve(count);

    double last_close = 100.0;
    for (std::size_t i = 0; i < count; ++i) {
        // Price floor keeps the walk strictly positive
        double o = std::max(1.0, last_close + step(rng) * 0.5);
        double c = std::max(1.0, o + step(rng));
        double h = std::max(o, c) + wick(rng);
        double l = std::max(0.5, std::min(o, c) - wick(rng));

        timestamps.push_back(start + std::chrono::hours(24 * static_cast<long>(i)));
        open.push_back(o);
        high.push_back(h);
        low.push_back(l);
        close.push_back(c);
        volume.push_back(static_cast<double>(volume_dist(rng)));
        last_close = c;
    }

    core::BarSeries bars(std::move(timestamps));
    bars.setField("open", std::move(open));
    bars.setField("high", std::move(high));
    bars.setField("low", std::move(low));
    bars.setField("close", std::move(close));
    bars.setField("volume", std::move(volume));

    core::logging::getLogger()->debug("Generated {} sample bars from {} (seed {})", count, start_date, seed);
    return bars;
}

} // namespace data
