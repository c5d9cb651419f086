#include "signal_evaluator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "rsi_indicator.hpp"
#include "sma_indicator.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace rule_engine {

std::size_t SignalSeries::entryCount() const {
    return static_cast<std::size_t>(std::count(entry.begin(), entry.end(), true));
}

std::size_t SignalSeries::exitCount() const {
    return static_cast<std::size_t>(std::count(exit.begin(), exit.end(), true));
}

std::unique_ptr<indicators::IIndicator> makeIndicator(const std::string& name, int window) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "SMA") {
        return std::make_unique<indicators::SmaIndicator>(window);
    }
    if (upper == "RSI") {
        return std::make_unique<indicators::RsiIndicator>(window);
    }
    throw core::EvaluationException(fmt::format("Unknown function '{}'", name));
}

namespace { // Visitors over Expr::Node

    const Expr& requireChild(const ExprPtr& child, const char* node_kind, const char* role) {
        if (!child) {
            throw core::EvaluationException(fmt::format("Malformed {} node: missing {} operand", node_kind, role));
        }
        return *child;
    }

    bool compare(ComparisonOp op, double left, double right) {
        // NaN operands make every comparison false
        switch (op) {
            case ComparisonOp::GT:  return left > right;
            case ComparisonOp::LT:  return left < right;
            case ComparisonOp::GTE: return left >= right;
            case ComparisonOp::LTE: return left <= right;
            case ComparisonOp::EQ:  return left == right;
        }
        return false;
    }

    struct NumericVisitor {
        const SignalEvaluator& evaluator;
        const core::BarSeries& series;

        core::TimeSeries<double> operator()(const Number& node) const {
            return core::TimeSeries<double>(series.size(), node.value);
        }

        core::TimeSeries<double> operator()(const Identifier& node) const {
            auto ref = resolveField(node.name);
            if (!ref) {
                throw core::EvaluationException(fmt::format("Unknown field '{}'", node.name));
            }

            const auto& column = series.field(field_to_string(ref->field));
            core::TimeSeries<double> values(column.size(), std::numeric_limits<double>::quiet_NaN());
            const std::size_t shift = static_cast<std::size_t>(ref->shift);
            for (std::size_t i = shift; i < column.size(); ++i) {
                values[i] = column[i - shift];
            }
            return values;
        }

        core::TimeSeries<double> operator()(const FunctionCall& node) const {
            if (node.arguments.size() != 2 || !node.arguments[0] || !node.arguments[1]) {
                throw core::EvaluationException(
                    fmt::format("Malformed {} call: expected 2 arguments, got {}", node.name, node.arguments.size()));
            }
            if (!std::holds_alternative<Identifier>(node.arguments[0]->node)) {
                throw core::EvaluationException(
                    fmt::format("Malformed {} call: first argument must be a field", node.name));
            }
            const auto* window = std::get_if<Number>(&node.arguments[1]->node);
            if (window == nullptr || window->value < 1.0 || window->value != std::floor(window->value) ||
                window->value > static_cast<double>(std::numeric_limits<int>::max())) {
                throw core::EvaluationException(
                    fmt::format("Malformed {} call: second argument must be an integer window >= 1", node.name));
            }

            auto indicator = makeIndicator(node.name, static_cast<int>(window->value));
            indicator->calculate(evaluator.evaluateNumeric(series, *node.arguments[0]));
            return indicator->getResult();
        }

        core::TimeSeries<double> operator()(const Binary& node) const {
            auto left = evaluator.evaluateNumeric(series, requireChild(node.left, "arithmetic", "left"));
            auto right = evaluator.evaluateNumeric(series, requireChild(node.right, "arithmetic", "right"));

            core::TimeSeries<double> result(series.size());
            for (std::size_t i = 0; i < result.size(); ++i) {
                switch (node.op) {
                    case ArithmeticOp::Add:      result[i] = left[i] + right[i]; break;
                    case ArithmeticOp::Subtract: result[i] = left[i] - right[i]; break;
                    case ArithmeticOp::Multiply: result[i] = left[i] * right[i]; break;
                    case ArithmeticOp::Divide:
                        if (right[i] == 0.0) {
                            throw core::EvaluationException(
                                fmt::format("Division by zero at bar {} in '{}'", i,
                                            describe(*node.left) + " / " + describe(*node.right)));
                        }
                        result[i] = left[i] / right[i];
                        break;
                }
            }
            return result;
        }

        template <typename BooleanNode>
        core::TimeSeries<double> operator()(const BooleanNode&) const {
            throw core::EvaluationException("Malformed node: condition used where a numeric value is required");
        }
    };

    struct BooleanVisitor {
        const SignalEvaluator& evaluator;
        const core::BarSeries& series;

        std::vector<bool> operator()(const Comparison& node) const {
            auto left = evaluator.evaluateNumeric(series, requireChild(node.left, "comparison", "left"));
            auto right = evaluator.evaluateNumeric(series, requireChild(node.right, "comparison", "right"));

            std::vector<bool> result(series.size(), false);
            for (std::size_t i = 0; i < result.size(); ++i) {
                result[i] = compare(node.op, left[i], right[i]);
            }
            return result;
        }

        // True only where the relation holds now but did not hold on the previous bar.
        // Bar 0 has no previous bar and is never a cross.
        std::vector<bool> operator()(const Cross& node) const {
            auto left = evaluator.evaluateNumeric(series, requireChild(node.left, "cross", "left"));
            auto right = evaluator.evaluateNumeric(series, requireChild(node.right, "cross", "right"));
            const ComparisonOp relation = (node.type == CrossType::CrossesAbove) ? ComparisonOp::GT : ComparisonOp::LT;

            std::vector<bool> result(series.size(), false);
            bool previous = false;
            for (std::size_t i = 0; i < result.size(); ++i) {
                bool current = compare(relation, left[i], right[i]);
                result[i] = (i > 0) && current && !previous;
                previous = current;
            }
            return result;
        }

        std::vector<bool> operator()(const Logical& node) const {
            if (node.operands.empty()) {
                throw core::EvaluationException(
                    fmt::format("Malformed {} node: no operands", op_to_string(node.op)));
            }

            std::vector<bool> result =
                evaluator.evaluateCondition(series, requireChild(node.operands.front(), "logical", "an"));
            for (std::size_t k = 1; k < node.operands.size(); ++k) {
                auto values = evaluator.evaluateCondition(series, requireChild(node.operands[k], "logical", "an"));
                for (std::size_t i = 0; i < result.size(); ++i) {
                    result[i] = (node.op == LogicalOp::And) ? (result[i] && values[i]) : (result[i] || values[i]);
                }
            }
            return result;
        }

        template <typename NumericNode>
        std::vector<bool> operator()(const NumericNode&) const {
            throw core::EvaluationException("Malformed node: numeric value used where a condition is required");
        }
    };

} // end anonymous namespace

core::TimeSeries<double> SignalEvaluator::evaluateNumeric(const core::BarSeries& series, const Expr& expr) const {
    return std::visit(NumericVisitor{*this, series}, expr.node);
}

std::vector<bool> SignalEvaluator::evaluateCondition(const core::BarSeries& series, const Expr& expr) const {
    return std::visit(BooleanVisitor{*this, series}, expr.node);
}

SignalSeries SignalEvaluator::evaluate(const core::BarSeries& series, const Strategy& strategy) const {
    auto logger = core::logging::getLogger();
    series.validate();

    SignalSeries signals;
    signals.timestamps = series.timestamps();
    signals.entry.assign(series.size(), false);
    signals.exit.assign(series.size(), false);

    if (strategy.entry) {
        signals.entry = evaluateCondition(series, *strategy.entry);
    }
    if (strategy.exit) {
        signals.exit = evaluateCondition(series, *strategy.exit);
    }

    logger->debug("Evaluated {} bars: {} entry signals, {} exit signals",
                  series.size(), signals.entryCount(), signals.exitCount());
    return signals;
}

} // namespace rule_engine
