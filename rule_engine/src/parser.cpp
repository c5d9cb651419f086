#include "parser.hpp"
#include "lexer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace rule_engine {

namespace { // File-local helpers

    bool isComparator(TokenType type) {
        return type == TokenType::Greater || type == TokenType::Less ||
               type == TokenType::GreaterEqual || type == TokenType::LessEqual ||
               type == TokenType::EqualEqual;
    }

    bool isCrossPhrase(TokenType type) {
        return type == TokenType::CrossesAbove || type == TokenType::CrossesBelow;
    }

    ComparisonOp toComparisonOp(TokenType type) {
        switch (type) {
            case TokenType::Greater:      return ComparisonOp::GT;
            case TokenType::Less:         return ComparisonOp::LT;
            case TokenType::GreaterEqual: return ComparisonOp::GTE;
            case TokenType::LessEqual:    return ComparisonOp::LTE;
            default:                      return ComparisonOp::EQ;
        }
    }

} // end anonymous namespace

double numberValue(const Token& token) {
    std::string digits = token.text;
    double scale = 1.0;
    if (!digits.empty() && (digits.back() == 'K' || digits.back() == 'k')) {
        scale = 1e3;
        digits.pop_back();
    } else if (!digits.empty() && (digits.back() == 'M' || digits.back() == 'm')) {
        scale = 1e6;
        digits.pop_back();
    }

    try {
        std::size_t consumed = 0;
        double value = std::stod(digits, &consumed);
        if (consumed != digits.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value * scale;
    } catch (const std::exception& e) {
        throw core::ParseException(
            fmt::format("Invalid numeric literal '{}' at offset {}: {}", token.text, token.position, e.what()),
            "number", describeToken(token), token.position);
    }
}

Parser::Parser(std::vector<Token> tokens)
    : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::EndOfInput) {
        std::size_t end = tokens_.empty() ? 0 : tokens_.back().position + tokens_.back().text.size();
        tokens_.push_back(Token{TokenType::EndOfInput, "", end});
    }
}

// --- Token cursor ---

const Token& Parser::peek() const {
    return tokens_[current_];
}

const Token& Parser::advance() {
    const Token& token = tokens_[current_];
    if (token.type != TokenType::EndOfInput) {
        ++current_;
    }
    return token;
}

bool Parser::check(TokenType type) const {
    return peek().type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

const Token& Parser::expect(TokenType type, const std::string& expected) {
    if (!check(type)) {
        fail(expected, peek());
    }
    return advance();
}

void Parser::fail(const std::string& expected, const Token& found) const {
    std::string found_text = describeToken(found);
    throw core::ParseException(fmt::format("Expected {}, found {}", expected, found_text),
                               expected, found_text, found.position);
}

void Parser::requireCondition(const Expr& expr, const char* context) const {
    if (!isCondition(expr)) {
        std::string found_text = fmt::format("numeric expression '{}' at offset {}", describe(expr), expr.position);
        throw core::ParseException(
            fmt::format("Expected condition {}, found {}", context, found_text),
            "condition", found_text, expr.position);
    }
}

void Parser::requireNumeric(const Expr& expr, const char* context) const {
    if (isCondition(expr)) {
        std::string found_text = fmt::format("condition '{}' at offset {}", describe(expr), expr.position);
        throw core::ParseException(
            fmt::format("Expected numeric expression {}, found {}", context, found_text),
            "numeric expression", found_text, expr.position);
    }
}

// --- Grammar ---

Strategy Parser::parseStrategy() {
    Strategy strategy;

    if (check(TokenType::Entry)) {
        advance();
        expect(TokenType::Colon, "':' after ENTRY");
        strategy.entry = parseCondition("in ENTRY section");
    }

    if (check(TokenType::Exit)) {
        advance();
        expect(TokenType::Colon, "':' after EXIT");
        strategy.exit = parseCondition("in EXIT section");
    }

    if (!check(TokenType::EndOfInput)) {
        if (check(TokenType::Entry)) {
            fail(strategy.exit ? "end of input (ENTRY must precede EXIT)" : "end of input (duplicate ENTRY section)", peek());
        }
        if (check(TokenType::Exit)) {
            fail("end of input (duplicate EXIT section)", peek());
        }
        if (!strategy.entry && !strategy.exit) {
            fail("ENTRY or EXIT section", peek());
        }
        fail("AND, OR, EXIT or end of input", peek());
    }

    core::logging::getLogger()->debug("Parsed strategy: {}", describe(strategy));
    return strategy;
}

ExprPtr Parser::parseCondition(const char* context) {
    ExprPtr expr = parseOr();
    requireCondition(*expr, context);
    return expr;
}

ExprPtr Parser::parseOr() {
    std::size_t position = peek().position;
    ExprPtr first = parseAnd();
    if (!check(TokenType::Or)) {
        return first;
    }

    requireCondition(*first, "before OR");
    std::vector<ExprPtr> operands;
    operands.push_back(std::move(first));
    while (match(TokenType::Or)) {
        ExprPtr operand = parseAnd();
        requireCondition(*operand, "after OR");
        operands.push_back(std::move(operand));
    }
    return makeLogical(LogicalOp::Or, std::move(operands), position);
}

ExprPtr Parser::parseAnd() {
    std::size_t position = peek().position;
    ExprPtr first = parseComparison();
    if (!check(TokenType::And)) {
        return first;
    }

    requireCondition(*first, "before AND");
    std::vector<ExprPtr> operands;
    operands.push_back(std::move(first));
    while (match(TokenType::And)) {
        ExprPtr operand = parseComparison();
        requireCondition(*operand, "after AND");
        operands.push_back(std::move(operand));
    }
    return makeLogical(LogicalOp::And, std::move(operands), position);
}

// arith (comparator | cross-phrase) arith, at most once
ExprPtr Parser::parseComparison() {
    std::size_t position = peek().position;
    ExprPtr left = parseArith();

    TokenType type = peek().type;
    if (!isComparator(type) && !isCrossPhrase(type)) {
        return left;
    }

    const Token& op = advance();
    requireNumeric(*left, fmt::format("before '{}'", op.text).c_str());
    ExprPtr right = parseArith();
    requireNumeric(*right, fmt::format("after '{}'", op.text).c_str());

    if (isComparator(peek().type) || isCrossPhrase(peek().type)) {
        fail("AND, OR or end of condition (comparisons do not chain)", peek());
    }

    if (isCrossPhrase(type)) {
        CrossType cross = (type == TokenType::CrossesAbove) ? CrossType::CrossesAbove : CrossType::CrossesBelow;
        return makeCross(cross, std::move(left), std::move(right), position);
    }
    return makeComparison(toComparisonOp(type), std::move(left), std::move(right), position);
}

ExprPtr Parser::parseArith() {
    std::size_t position = peek().position;
    ExprPtr left = parseTerm();

    while (check(TokenType::Plus) || check(TokenType::Minus)) {
        const Token& op = advance();
        requireNumeric(*left, fmt::format("before '{}'", op.text).c_str());
        ArithmeticOp arith = (op.type == TokenType::Plus) ? ArithmeticOp::Add : ArithmeticOp::Subtract;
        ExprPtr right = parseTerm();
        requireNumeric(*right, fmt::format("after '{}'", op.text).c_str());
        left = makeBinary(arith, std::move(left), std::move(right), position);
    }
    return left;
}

ExprPtr Parser::parseTerm() {
    std::size_t position = peek().position;
    ExprPtr left = parsePrimary();

    while (check(TokenType::Star) || check(TokenType::Slash)) {
        const Token& op = advance();
        requireNumeric(*left, fmt::format("before '{}'", op.text).c_str());
        ArithmeticOp arith = (op.type == TokenType::Star) ? ArithmeticOp::Multiply : ArithmeticOp::Divide;
        ExprPtr right = parsePrimary();
        requireNumeric(*right, fmt::format("after '{}'", op.text).c_str());
        left = makeBinary(arith, std::move(left), std::move(right), position);
    }
    return left;
}

ExprPtr Parser::parsePrimary() {
    const Token& token = peek();

    switch (token.type) {
        case TokenType::Number: {
            advance();
            return makeNumber(numberValue(token), token.position);
        }
        case TokenType::Identifier: {
            advance();
            if (check(TokenType::LeftParen)) {
                std::string found_text = describeToken(token);
                throw core::ParseException(
                    fmt::format("Unknown function '{}' at offset {} (supported: SMA, RSI)", token.text, token.position),
                    "SMA or RSI", found_text, token.position);
            }
            if (!resolveField(token.text)) {
                std::string found_text = describeToken(token);
                throw core::ParseException(
                    fmt::format("Unknown field '{}' at offset {}", token.text, token.position),
                    "field (open, high, low, close, volume, optionally _yesterday or _last_week)",
                    found_text, token.position);
            }
            return makeIdentifier(token.text, token.position);
        }
        case TokenType::Function:
            return parseFunctionCall();
        case TokenType::LeftParen: {
            advance();
            ExprPtr inner = parseOr();
            expect(TokenType::RightParen, "')'");
            return inner;
        }
        default:
            fail("number, field, function call or '('", token);
    }
}

// SMA|RSI '(' field ',' integer ')'
ExprPtr Parser::parseFunctionCall() {
    const Token& name = advance();
    expect(TokenType::LeftParen, fmt::format("'(' after {}", name.text));

    ExprPtr field = parseArith();
    if (!std::holds_alternative<Identifier>(field->node)) {
        std::string found_text = fmt::format("'{}' at offset {}", describe(*field), field->position);
        throw core::ParseException(
            fmt::format("{} argument 1 must be a field, found {}", name.text, found_text),
            "field", found_text, field->position);
    }

    expect(TokenType::Comma, fmt::format("',' between {} arguments", name.text));

    ExprPtr window = parseArith();
    const auto* literal = std::get_if<Number>(&window->node);
    if (literal == nullptr || literal->value != std::floor(literal->value) || literal->value < 1.0 ||
        literal->value > static_cast<double>(std::numeric_limits<int>::max())) {
        std::string found_text = fmt::format("'{}' at offset {}", describe(*window), window->position);
        throw core::ParseException(
            fmt::format("{} argument 2 must be an integer window >= 1, found {}", name.text, found_text),
            "integer window", found_text, window->position);
    }

    if (check(TokenType::Comma)) {
        fail(fmt::format("')' ({} takes exactly 2 arguments)", name.text), peek());
    }
    expect(TokenType::RightParen, fmt::format("')' after {} arguments", name.text));

    return makeFunctionCall(name.text, std::move(field), std::move(window), name.position);
}

Strategy compile(const std::string& rule_text) {
    Lexer lexer(rule_text);
    Parser parser(lexer.tokenize());
    return parser.parseStrategy();
}

} // namespace rule_engine
