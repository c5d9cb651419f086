#pragma once

#include <cstddef>
#include <string>

namespace rule_engine {

    enum class TokenType {
        Entry,          // ENTRY (section keyword)
        Exit,           // EXIT (section keyword)
        Colon,
        And,
        Or,
        CrossesAbove,   // "crosses above"
        CrossesBelow,   // "crosses below"
        Identifier,     // field names, lower-cased
        Function,       // SMA / RSI, upper-cased
        Number,         // literal text including any K/M suffix
        Greater,
        Less,
        GreaterEqual,
        LessEqual,
        EqualEqual,
        Plus,
        Minus,
        Star,
        Slash,
        LeftParen,
        RightParen,
        Comma,
        EndOfInput
    };

    struct Token {
        TokenType type = TokenType::EndOfInput;
        std::string text;
        std::size_t position = 0; // Byte offset into the rule text
    };

    std::string tokentype_to_string(TokenType type);

    // "'>' at offset 12", "end of input"
    std::string describeToken(const Token& token);

} // namespace rule_engine
