#include "lexer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>

namespace rule_engine {

namespace { // File-local helpers

    bool isWordStart(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    bool isWordChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool isDigit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string toUpper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }

} // end anonymous namespace

Lexer::Lexer(std::string source)
    : source_(std::move(source)) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    pos_ = 0;

    while (true) {
        skipWhitespace();
        if (pos_ >= source_.size()) {
            tokens.push_back(Token{TokenType::EndOfInput, "", pos_});
            break;
        }

        char c = source_[pos_];
        if (isDigit(c)) {
            tokens.push_back(lexNumber());
        } else if (isWordStart(c)) {
            tokens.push_back(lexWord());
        } else {
            tokens.push_back(lexSymbol());
        }
    }

    core::logging::getLogger()->trace("Lexer produced {} tokens from {} characters", tokens.size(), source_.size());
    return tokens;
}

void Lexer::skipWhitespace() {
    while (pos_ < source_.size() && std::isspace(static_cast<unsigned char>(source_[pos_]))) {
        ++pos_;
    }
}

std::string Lexer::readWord() {
    std::size_t start = pos_;
    while (pos_ < source_.size() && isWordChar(source_[pos_])) {
        ++pos_;
    }
    return source_.substr(start, pos_ - start);
}

// digits ('.' digits)? followed directly by an optional K/M scale suffix
Token Lexer::lexNumber() {
    std::size_t start = pos_;
    while (pos_ < source_.size() && isDigit(source_[pos_])) {
        ++pos_;
    }

    if (pos_ < source_.size() && source_[pos_] == '.') {
        if (pos_ + 1 >= source_.size() || !isDigit(source_[pos_ + 1])) {
            std::string lexeme = source_.substr(start, pos_ + 1 - start);
            throw core::LexException(fmt::format("Malformed number '{}' at offset {}", lexeme, start), lexeme, start);
        }
        ++pos_; // consume '.'
        while (pos_ < source_.size() && isDigit(source_[pos_])) {
            ++pos_;
        }
    }

    std::size_t suffix_start = pos_;
    std::string suffix = readWord();
    if (!suffix.empty()) {
        std::string upper = toUpper(suffix);
        if (upper != "K" && upper != "M") {
            std::string lexeme = source_.substr(start, pos_ - start);
            throw core::LexException(
                fmt::format("Invalid numeric suffix '{}' in '{}' at offset {} (expected K or M)", suffix, lexeme, suffix_start),
                lexeme, start);
        }
        std::string digits = source_.substr(start, suffix_start - start);
        return Token{TokenType::Number, digits + upper, start};
    }

    return Token{TokenType::Number, source_.substr(start, pos_ - start), start};
}

Token Lexer::lexWord() {
    std::size_t start = pos_;
    std::string word = readWord();
    std::string lower = toLower(word);

    if (lower == "entry") return Token{TokenType::Entry, "ENTRY", start};
    if (lower == "exit")  return Token{TokenType::Exit, "EXIT", start};
    if (lower == "and")   return Token{TokenType::And, "AND", start};
    if (lower == "or")    return Token{TokenType::Or, "OR", start};
    if (lower == "sma" || lower == "rsi") return Token{TokenType::Function, toUpper(word), start};

    if (lower == "crosses") {
        skipWhitespace();
        std::size_t direction_start = pos_;
        std::string direction = toLower(readWord());
        if (direction == "above") return Token{TokenType::CrossesAbove, "crosses above", start};
        if (direction == "below") return Token{TokenType::CrossesBelow, "crosses below", start};

        std::string lexeme = source_.substr(start, pos_ - start);
        if (direction.empty()) {
            lexeme = word;
        }
        throw core::LexException(
            fmt::format("Expected 'above' or 'below' after 'crosses' at offset {}, found '{}'",
                        direction_start, direction.empty() ? std::string("nothing") : direction),
            lexeme, start);
    }

    return Token{TokenType::Identifier, lower, start};
}

Token Lexer::lexSymbol() {
    std::size_t start = pos_;
    char c = source_[pos_];
    char next = (pos_ + 1 < source_.size()) ? source_[pos_ + 1] : '\0';

    // two-char comparators first
    if (c == '>' && next == '=') { pos_ += 2; return Token{TokenType::GreaterEqual, ">=", start}; }
    if (c == '<' && next == '=') { pos_ += 2; return Token{TokenType::LessEqual, "<=", start}; }
    if (c == '=' && next == '=') { pos_ += 2; return Token{TokenType::EqualEqual, "==", start}; }

    ++pos_;
    switch (c) {
        case '>': return Token{TokenType::Greater, ">", start};
        case '<': return Token{TokenType::Less, "<", start};
        case '+': return Token{TokenType::Plus, "+", start};
        case '-': return Token{TokenType::Minus, "-", start};
        case '*': return Token{TokenType::Star, "*", start};
        case '/': return Token{TokenType::Slash, "/", start};
        case '(': return Token{TokenType::LeftParen, "(", start};
        case ')': return Token{TokenType::RightParen, ")", start};
        case ',': return Token{TokenType::Comma, ",", start};
        case ':': return Token{TokenType::Colon, ":", start};
        default: break;
    }

    std::string lexeme(1, c);
    throw core::LexException(fmt::format("Unrecognized lexeme '{}' at offset {}", lexeme, start), lexeme, start);
}

} // namespace rule_engine
