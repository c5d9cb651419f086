#pragma once

#include "ast.hpp"
#include "bar_series.hpp"
#include "datatypes.hpp"
#include "indicators.hpp"
#include <memory>
#include <string>
#include <vector>

namespace rule_engine {

    // Per-bar entry/exit flags, index-aligned with the evaluated bar series
    struct SignalSeries {
        std::vector<core::Timestamp> timestamps;
        std::vector<bool> entry;
        std::vector<bool> exit;

        std::size_t size() const { return timestamps.size(); }
        std::size_t entryCount() const;
        std::size_t exitCount() const;
    };

    // Creates the indicator a FunctionCall node names ("SMA", "RSI").
    // Throws core::EvaluationException for any other name.
    std::unique_ptr<indicators::IIndicator> makeIndicator(const std::string& name, int window);

    // Evaluates a parsed strategy against a bar series. Stateless: the same
    // evaluator may be used for any number of (series, strategy) pairs.
    class SignalEvaluator {
    public:
        SignalEvaluator() = default;

        // Throws core::DataException if the series fails validation and
        // core::EvaluationException for unknown fields, malformed nodes or
        // division by zero. An absent section yields an all-false series.
        SignalSeries evaluate(const core::BarSeries& series, const Strategy& strategy) const;

        // Building blocks, exposed for direct use on sub-expressions
        core::TimeSeries<double> evaluateNumeric(const core::BarSeries& series, const Expr& expr) const;
        std::vector<bool> evaluateCondition(const core::BarSeries& series, const Expr& expr) const;
    };

} // namespace rule_engine
