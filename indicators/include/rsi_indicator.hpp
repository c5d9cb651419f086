#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Relative strength index with exponentially weighted average gain/loss
// (alpha = 1/period). Positions before period observations read 50.
class RsiIndicator : public IIndicator {
public:
    static constexpr double kNeutralValue = 50.0;
    static constexpr double kEpsilon = 1e-10;

    explicit RsiIndicator(int period);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
