#pragma once

#include "datatypes.hpp" // Needs TimeSeries
#include <string>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Name of the indicator instance (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading output positions computed from less than a full window.
    // Those positions still carry a value (see each indicator's warm-up rule).
    virtual int getLookback() const = 0;

    // Calculate the indicator over an input series and store the result internally.
    // Leading NaN inputs mark positions with no observation yet.
    virtual void calculate(const core::TimeSeries<double>& input) = 0;

    // Results are index-aligned with the last input: same length, same order.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
