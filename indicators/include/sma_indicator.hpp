#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Simple moving average over a trailing window. Before a full window is
// available the mean covers the observations seen so far (expanding mean).
class SmaIndicator : public IIndicator {
public:
    explicit SmaIndicator(int period);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;              // TA-Lib lookback (period - 1)
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
