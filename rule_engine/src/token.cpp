#include "token.hpp"
#include <spdlog/fmt/fmt.h>

namespace rule_engine {

std::string tokentype_to_string(TokenType type) {
    switch (type) {
        case TokenType::Entry:        return "ENTRY";
        case TokenType::Exit:         return "EXIT";
        case TokenType::Colon:        return ":";
        case TokenType::And:          return "AND";
        case TokenType::Or:           return "OR";
        case TokenType::CrossesAbove: return "crosses above";
        case TokenType::CrossesBelow: return "crosses below";
        case TokenType::Identifier:   return "identifier";
        case TokenType::Function:     return "function";
        case TokenType::Number:       return "number";
        case TokenType::Greater:      return ">";
        case TokenType::Less:         return "<";
        case TokenType::GreaterEqual: return ">=";
        case TokenType::LessEqual:    return "<=";
        case TokenType::EqualEqual:   return "==";
        case TokenType::Plus:         return "+";
        case TokenType::Minus:        return "-";
        case TokenType::Star:         return "*";
        case TokenType::Slash:        return "/";
        case TokenType::LeftParen:    return "(";
        case TokenType::RightParen:   return ")";
        case TokenType::Comma:        return ",";
        case TokenType::EndOfInput:   return "end of input";
    }
    return "unknown";
}

std::string describeToken(const Token& token) {
    if (token.type == TokenType::EndOfInput) {
        return tokentype_to_string(token.type);
    }
    return fmt::format("'{}' at offset {}", token.text, token.position);
}

} // namespace rule_engine
