#pragma once

#include "token.hpp"
#include <string>
#include <vector>

namespace rule_engine {

    // Splits rule text into tokens. The returned sequence always ends with an
    // EndOfInput token. Throws core::LexException on an unrecognized lexeme.
    class Lexer {
    public:
        explicit Lexer(std::string source);

        std::vector<Token> tokenize();

    private:
        std::string source_;
        std::size_t pos_ = 0;

        void skipWhitespace();
        Token lexNumber();
        Token lexWord();
        Token lexSymbol();
        std::string readWord();
    };

} // namespace rule_engine
