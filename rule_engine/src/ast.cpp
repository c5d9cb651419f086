#include "ast.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>

namespace rule_engine {

using json = nlohmann::json;

ExprPtr makeNumber(double value, std::size_t position) {
    return makeExpr(Number{value}, position);
}

ExprPtr makeIdentifier(std::string name, std::size_t position) {
    return makeExpr(Identifier{std::move(name)}, position);
}

ExprPtr makeFunctionCall(std::string name, ExprPtr field, ExprPtr window, std::size_t position) {
    FunctionCall call;
    call.name = std::move(name);
    call.arguments.push_back(std::move(field));
    call.arguments.push_back(std::move(window));
    return makeExpr(std::move(call), position);
}

ExprPtr makeBinary(ArithmeticOp op, ExprPtr left, ExprPtr right, std::size_t position) {
    return makeExpr(Binary{op, std::move(left), std::move(right)}, position);
}

ExprPtr makeComparison(ComparisonOp op, ExprPtr left, ExprPtr right, std::size_t position) {
    return makeExpr(Comparison{op, std::move(left), std::move(right)}, position);
}

ExprPtr makeCross(CrossType type, ExprPtr left, ExprPtr right, std::size_t position) {
    return makeExpr(Cross{type, std::move(left), std::move(right)}, position);
}

ExprPtr makeLogical(LogicalOp op, std::vector<ExprPtr> operands, std::size_t position) {
    return makeExpr(Logical{op, std::move(operands)}, position);
}

bool isCondition(const Expr& expr) {
    return std::holds_alternative<Comparison>(expr.node) ||
           std::holds_alternative<Cross>(expr.node) ||
           std::holds_alternative<Logical>(expr.node);
}

std::optional<FieldReference> resolveField(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const struct { const char* suffix; int shift; } kSuffixes[] = {
        {"_yesterday", 1},
        {"_last_week", 5},
    };

    FieldReference ref;
    std::string base = lower;
    for (const auto& entry : kSuffixes) {
        std::string suffix(entry.suffix);
        if (base.size() > suffix.size() &&
            base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0) {
            base = base.substr(0, base.size() - suffix.size());
            ref.shift = entry.shift;
            break;
        }
    }

    if (base == "open") ref.field = PriceField::Open;
    else if (base == "high") ref.field = PriceField::High;
    else if (base == "low") ref.field = PriceField::Low;
    else if (base == "close") ref.field = PriceField::Close;
    else if (base == "volume") ref.field = PriceField::Volume;
    else return std::nullopt;

    return ref;
}

namespace { // Visitors for rendering

    // Shortest round-trip digits written without an exponent, so the text lexes again
    std::string formatNumber(double value) {
        std::string text = fmt::format("{}", value);
        const std::size_t exp_pos = text.find('e');
        if (exp_pos == std::string::npos) {
            return text;
        }
        const int exponent = std::stoi(text.substr(exp_pos + 1));
        const std::size_t dot = text.find('.');
        const int mantissa_decimals = (dot == std::string::npos || dot > exp_pos)
                                          ? 0
                                          : static_cast<int>(exp_pos - dot - 1);
        return fmt::format("{:.{}f}", value, std::max(0, mantissa_decimals - exponent));
    }

    std::string describeChild(const ExprPtr& child) {
        return child ? describe(*child) : "<missing>";
    }

    json childToJson(const ExprPtr& child) {
        return child ? toJson(*child) : json(nullptr);
    }

    struct Describer {
        std::string operator()(const Number& node) const {
            return formatNumber(node.value);
        }
        std::string operator()(const Identifier& node) const {
            return node.name;
        }
        std::string operator()(const FunctionCall& node) const {
            std::stringstream ss;
            ss << node.name << "(";
            for (std::size_t i = 0; i < node.arguments.size(); ++i) {
                ss << describeChild(node.arguments[i]);
                if (i + 1 < node.arguments.size()) {
                    ss << ", ";
                }
            }
            ss << ")";
            return ss.str();
        }
        std::string operator()(const Binary& node) const {
            return fmt::format("({} {} {})", describeChild(node.left), op_to_string(node.op), describeChild(node.right));
        }
        std::string operator()(const Comparison& node) const {
            return fmt::format("{} {} {}", describeChild(node.left), op_to_string(node.op), describeChild(node.right));
        }
        std::string operator()(const Cross& node) const {
            return fmt::format("{} {} {}", describeChild(node.left), crosstype_to_string(node.type), describeChild(node.right));
        }
        std::string operator()(const Logical& node) const {
            std::stringstream ss;
            ss << "(";
            for (std::size_t i = 0; i < node.operands.size(); ++i) {
                ss << describeChild(node.operands[i]);
                if (i + 1 < node.operands.size()) {
                    ss << " " << op_to_string(node.op) << " ";
                }
            }
            ss << ")";
            return ss.str();
        }
    };

    struct JsonWriter {
        json operator()(const Number& node) const {
            return json{{"type", "number"}, {"value", node.value}};
        }
        json operator()(const Identifier& node) const {
            return json{{"type", "field"}, {"name", node.name}};
        }
        json operator()(const FunctionCall& node) const {
            std::string name = node.name;
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            json args = json::array();
            for (const auto& argument : node.arguments) {
                args.push_back(childToJson(argument));
            }
            return json{{"type", "func"}, {"name", name}, {"args", args}};
        }
        json operator()(const Binary& node) const {
            return json{{"type", "binary"}, {"op", op_to_string(node.op)},
                        {"left", childToJson(node.left)}, {"right", childToJson(node.right)}};
        }
        json operator()(const Comparison& node) const {
            return json{{"type", "comparison"}, {"op", op_to_string(node.op)},
                        {"left", childToJson(node.left)}, {"right", childToJson(node.right)}};
        }
        json operator()(const Cross& node) const {
            return json{{"type", "cross"},
                        {"cross_type", node.type == CrossType::CrossesAbove ? "above" : "below"},
                        {"left", childToJson(node.left)}, {"right", childToJson(node.right)}};
        }
        json operator()(const Logical& node) const {
            json operands = json::array();
            for (const auto& operand : node.operands) {
                operands.push_back(childToJson(operand));
            }
            return json{{"type", node.op == LogicalOp::And ? "and" : "or"}, {"operands", operands}};
        }
    };

} // end anonymous namespace

std::string describe(const Expr& expr) {
    return std::visit(Describer{}, expr.node);
}

std::string describe(const Strategy& strategy) {
    std::stringstream ss;
    if (strategy.entry) {
        ss << "ENTRY: " << describe(*strategy.entry);
    }
    if (strategy.exit) {
        if (strategy.entry) {
            ss << "\n";
        }
        ss << "EXIT: " << describe(*strategy.exit);
    }
    return ss.str();
}

json toJson(const Expr& expr) {
    return std::visit(JsonWriter{}, expr.node);
}

json toJson(const Strategy& strategy) {
    json result = json::object();
    if (strategy.entry) {
        result["entry"] = toJson(*strategy.entry);
    }
    if (strategy.exit) {
        result["exit"] = toJson(*strategy.exit);
    }
    return result;
}

} // namespace rule_engine
