#include "rsi_indicator.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("RSI period must be positive.");
    }

    // First defined value needs period observations, the first of which is bar 0
    lookback_ = period_ - 1;

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {} over {} values...", name_, input.size());
    results_.assign(input.size(), kNeutralValue);
    if (input.empty()) {
        return;
    }

    // EWM recursion (alpha = 1/period) seeded with bar 0, whose move is zero
    const double alpha = 1.0 / static_cast<double>(period_);
    double avg_gain = 0.0;
    double avg_loss = 0.0;

    for (std::size_t i = 0; i < input.size(); ++i) {
        // A delta with a missing side (bar 0, shifted input) counts as no move
        double delta = (i == 0) ? std::nan("") : input[i] - input[i - 1];
        double gain = (delta > 0.0) ? delta : 0.0;
        double loss = (delta < 0.0) ? -delta : 0.0;

        if (i == 0) {
            avg_gain = gain;
            avg_loss = loss;
        } else {
            avg_gain = (1.0 - alpha) * avg_gain + alpha * gain;
            avg_loss = (1.0 - alpha) * avg_loss + alpha * loss;
        }

        if (i >= static_cast<std::size_t>(lookback_)) {
            double rs = avg_gain / (avg_loss + kEpsilon);
            results_[i] = 100.0 - (100.0 / (1.0 + rs));
        }
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
