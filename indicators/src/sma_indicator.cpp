#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace indicators {

namespace {
    // TA-Lib rejects optInTimePeriod above this value
    constexpr int kMaxTaLibPeriod = 100000;
}

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("SMA period must be positive.");
    }

    // A full window needs period - 1 earlier values; TA_MA_Lookback agrees up to kMaxTaLibPeriod
    lookback_ = period_ - 1;

    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {} over {} values...", name_, input.size());
    results_.assign(input.size(), std::numeric_limits<double>::quiet_NaN());

    // Skip positions with no observation yet (shifted inputs)
    std::size_t first = 0;
    while (first < input.size() && std::isnan(input[first])) {
        ++first;
    }
    if (first == input.size()) {
        logger->debug("{}: input has no observations, result left empty.", name_);
        return;
    }

    const std::size_t available = input.size() - first;
    const std::size_t warmup = std::min(available, static_cast<std::size_t>(lookback_));

    // Warm-up region: mean over the observations seen so far
    double running_sum = 0.0;
    for (std::size_t k = 0; k < warmup; ++k) {
        running_sum += input[first + k];
        results_[first + k] = running_sum / static_cast<double>(k + 1);
    }

    if (available <= static_cast<std::size_t>(lookback_)) {
        logger->debug("Input size ({}) does not exceed lookback ({}) for {}. Only warm-up values generated.",
                      available, lookback_, name_);
        return;
    }

    if (period_ > kMaxTaLibPeriod) {
        // Full windows beyond TA-Lib's range: slide the running sum
        for (std::size_t k = warmup; k < available; ++k) {
            running_sum += input[first + k];
            if (k >= static_cast<std::size_t>(period_)) {
                running_sum -= input[first + k - period_];
            }
            results_[first + k] = running_sum / static_cast<double>(period_);
        }
        logger->trace("Calculated {} results for {} without TA-Lib", results_.size(), name_);
        return;
    }

    // Full windows: TA-Lib writes one value per input position from lookback_ on
    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_MA(
        0,                                     // startIdx
        static_cast<int>(available) - 1,       // endIdx
        input.data() + first,                  // Pointer to first observed input
        period_,                               // optInTimePeriod
        TA_MAType_SMA,                         // optInMAType
        &out_begin_idx,                        // outBegIdx
        &out_nb_element,                       // outNbElement
        results_.data() + first + lookback_    // outReal
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    const int expected = static_cast<int>(available) - lookback_;
    if (out_begin_idx != lookback_ || out_nb_element != expected) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA output misaligned for {}: begin {} (expected {}), count {} (expected {})",
                        name_, out_begin_idx, lookback_, out_nb_element, expected));
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
