#pragma once

#include "ast.hpp"
#include "token.hpp"
#include <string>
#include <vector>

namespace rule_engine {

    // Recursive-descent parser over a token stream produced by Lexer.
    // Precedence, loosest first: OR, AND, comparison/cross (non-chaining), + -, * /, primary.
    // Any grammar violation throws core::ParseException; no partial AST is returned.
    class Parser {
    public:
        explicit Parser(std::vector<Token> tokens);

        Strategy parseStrategy();

    private:
        std::vector<Token> tokens_;
        std::size_t current_ = 0;

        ExprPtr parseOr();
        ExprPtr parseAnd();
        ExprPtr parseComparison();
        ExprPtr parseArith();
        ExprPtr parseTerm();
        ExprPtr parsePrimary();
        ExprPtr parseFunctionCall();
        ExprPtr parseCondition(const char* context);

        const Token& peek() const;
        const Token& advance();
        bool check(TokenType type) const;
        bool match(TokenType type);
        const Token& expect(TokenType type, const std::string& expected);

        [[noreturn]] void fail(const std::string& expected, const Token& found) const;
        void requireCondition(const Expr& expr, const char* context) const;
        void requireNumeric(const Expr& expr, const char* context) const;
    };

    // Converts a Number token's text ("20", "1.5", "1K", "2M") to its scaled value
    double numberValue(const Token& token);

    // Lex + parse in one step
    Strategy compile(const std::string& rule_text);

} // namespace rule_engine
