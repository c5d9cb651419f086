#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace core {

    class RuleBacktesterException : public std::runtime_error {
    public:
        explicit RuleBacktesterException(const std::string& message)
            : std::runtime_error(message) {}

        explicit RuleBacktesterException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public RuleBacktesterException {
    public: using RuleBacktesterException::RuleBacktesterException; };

    class DataLoadException : public RuleBacktesterException {
    public: using RuleBacktesterException::RuleBacktesterException; };

    class IndicatorCalculationException : public RuleBacktesterException {
    public: using RuleBacktesterException::RuleBacktesterException; };

    // Input series missing a required field, or signals misaligned with prices
    class DataException : public RuleBacktesterException {
    public: using RuleBacktesterException::RuleBacktesterException; };

    // Unknown field, malformed node or undefined arithmetic while evaluating an AST
    class EvaluationException : public RuleBacktesterException {
    public: using RuleBacktesterException::RuleBacktesterException; };

    // Unrecognized lexeme in rule text
    class LexException : public RuleBacktesterException {
    public:
        LexException(const std::string& message, std::string lexeme, std::size_t offset)
            : RuleBacktesterException(message), lexeme_(std::move(lexeme)), offset_(offset) {}

        const std::string& lexeme() const { return lexeme_; }
        std::size_t offset() const { return offset_; }

    private:
        std::string lexeme_;
        std::size_t offset_;
    };

    // Grammar violation: carries what the parser wanted and what it got
    class ParseException : public RuleBacktesterException {
    public:
        ParseException(const std::string& message, std::string expected, std::string found, std::size_t offset)
            : RuleBacktesterException(message),
              expected_(std::move(expected)), found_(std::move(found)), offset_(offset) {}

        const std::string& expected() const { return expected_; }
        const std::string& found() const { return found_; }
        std::size_t offset() const { return offset_; }

    private:
        std::string expected_;
        std::string found_;
        std::size_t offset_;
    };

} // namespace core
