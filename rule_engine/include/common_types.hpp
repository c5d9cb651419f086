#pragma once

#include <string>

namespace rule_engine {

    // Which bar series column a field identifier refers to
    enum class PriceField {
        Open,
        High,
        Low,
        Close,
        Volume
    };

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    enum class ArithmeticOp {
        Add,
        Subtract,
        Multiply,
        Divide
    };

    enum class LogicalOp {
        And,
        Or
    };

    inline std::string field_to_string(PriceField field) {
        switch (field) {
            case PriceField::Open:   return "open";
            case PriceField::High:   return "high";
            case PriceField::Low:    return "low";
            case PriceField::Close:  return "close";
            case PriceField::Volume: return "volume";
        }
        return "invalid_field";
    }

    inline std::string op_to_string(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::GT:  return ">";
            case ComparisonOp::LT:  return "<";
            case ComparisonOp::GTE: return ">=";
            case ComparisonOp::LTE: return "<=";
            case ComparisonOp::EQ:  return "==";
        }
        return "invalid_op";
    }

    inline std::string crosstype_to_string(CrossType type) {
        return (type == CrossType::CrossesAbove) ? "crosses above" : "crosses below";
    }

    inline std::string op_to_string(ArithmeticOp op) {
        switch (op) {
            case ArithmeticOp::Add:      return "+";
            case ArithmeticOp::Subtract: return "-";
            case ArithmeticOp::Multiply: return "*";
            case ArithmeticOp::Divide:   return "/";
        }
        return "invalid_op";
    }

    inline std::string op_to_string(LogicalOp op) {
        return (op == LogicalOp::And) ? "AND" : "OR";
    }

} // namespace rule_engine
