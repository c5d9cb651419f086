#pragma once

#include "common_types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace rule_engine {

    struct Expr;
    using ExprPtr = std::unique_ptr<Expr>;

    // --- Node kinds ---

    struct Number {
        double value = 0.0; // K/M scaling already applied
    };

    // Field name, optionally suffixed _yesterday (1 bar back) or _last_week (5 bars back)
    struct Identifier {
        std::string name;
    };

    // SMA/RSI(field, window)
    struct FunctionCall {
        std::string name;
        std::vector<ExprPtr> arguments;
    };

    struct Binary {
        ArithmeticOp op = ArithmeticOp::Add;
        ExprPtr left;
        ExprPtr right;
    };

    struct Comparison {
        ComparisonOp op = ComparisonOp::GT;
        ExprPtr left;
        ExprPtr right;
    };

    struct Cross {
        CrossType type = CrossType::CrossesAbove;
        ExprPtr left;
        ExprPtr right;
    };

    // n-ary: all operands combined with the same connective
    struct Logical {
        LogicalOp op = LogicalOp::And;
        std::vector<ExprPtr> operands;
    };

    struct Expr {
        using Node = std::variant<Number, Identifier, FunctionCall, Binary, Comparison, Cross, Logical>;

        Node node;
        std::size_t position = 0; // Offset of the node's first token in the rule text
    };

    // One tree per declared section; an absent section evaluates to all-false
    struct Strategy {
        ExprPtr entry;
        ExprPtr exit;
    };

    // --- Construction helpers ---

    template <typename NodeT>
    ExprPtr makeExpr(NodeT node, std::size_t position = 0) {
        return std::make_unique<Expr>(Expr{Expr::Node(std::move(node)), position});
    }

    ExprPtr makeNumber(double value, std::size_t position = 0);
    ExprPtr makeIdentifier(std::string name, std::size_t position = 0);
    ExprPtr makeFunctionCall(std::string name, ExprPtr field, ExprPtr window, std::size_t position = 0);
    ExprPtr makeBinary(ArithmeticOp op, ExprPtr left, ExprPtr right, std::size_t position = 0);
    ExprPtr makeComparison(ComparisonOp op, ExprPtr left, ExprPtr right, std::size_t position = 0);
    ExprPtr makeCross(CrossType type, ExprPtr left, ExprPtr right, std::size_t position = 0);
    ExprPtr makeLogical(LogicalOp op, std::vector<ExprPtr> operands, std::size_t position = 0);

    // Comparison, Cross and Logical yield booleans; every other node is numeric
    bool isCondition(const Expr& expr);

    // --- Field identifiers ---

    struct FieldReference {
        PriceField field = PriceField::Close;
        int shift = 0; // Bars to look back: 0, 1 (_yesterday) or 5 (_last_week)
    };

    // Case-insensitive; returns nullopt for anything outside the five fields and two suffixes
    std::optional<FieldReference> resolveField(const std::string& name);

    // --- Rendering ---

    std::string describe(const Expr& expr);
    std::string describe(const Strategy& strategy);

    nlohmann::json toJson(const Expr& expr);
    nlohmann::json toJson(const Strategy& strategy);

} // namespace rule_engine
