// parser_test.cpp: grammar, precedence and parse errors

#include <gtest/gtest.h>

#include "ast.hpp"
#include "exceptions.hpp"
#include "parser.hpp"

#include <stdexcept>
#include <string>
#include <variant>

using namespace rule_engine;

namespace {

template <typename NodeT>
const NodeT& as(const ExprPtr& expr) {
    if (!expr) {
        throw std::runtime_error("missing expression");
    }
    const auto* node = std::get_if<NodeT>(&expr->node);
    if (node == nullptr) {
        throw std::runtime_error("unexpected node kind in " + describe(*expr));
    }
    return *node;
}

double numberOf(const ExprPtr& expr) {
    return as<Number>(expr).value;
}

}  // namespace

// ===========================================================================
// 1. Reference examples
// ===========================================================================
class ParserTest : public ::testing::Test {};

TEST_F(ParserTest, SimpleComparison) {
    Strategy s = compile("ENTRY: close > 100");
    ASSERT_TRUE(s.entry != nullptr);
    EXPECT_TRUE(s.exit == nullptr);

    const auto& cmp = as<Comparison>(s.entry);
    EXPECT_EQ(cmp.op, ComparisonOp::GT);
    EXPECT_EQ(as<Identifier>(cmp.left).name, "close");
    EXPECT_DOUBLE_EQ(numberOf(cmp.right), 100.0);
}

TEST_F(ParserTest, ThousandSuffix) {
    Strategy s = compile("ENTRY: volume > 1K");
    EXPECT_DOUBLE_EQ(numberOf(as<Comparison>(s.entry).right), 1000.0);
}

TEST_F(ParserTest, MillionSuffix) {
    Strategy s = compile("ENTRY: volume > 1M");
    EXPECT_DOUBLE_EQ(numberOf(as<Comparison>(s.entry).right), 1000000.0);
}

TEST_F(ParserTest, FractionalScaledLiteral) {
    Strategy s = compile("ENTRY: volume > 2.5K");
    EXPECT_DOUBLE_EQ(numberOf(as<Comparison>(s.entry).right), 2500.0);
}

TEST_F(ParserTest, AndOfTwoComparisons) {
    Strategy s = compile("ENTRY: close > SMA(close,20) AND volume > 1000000");
    const auto& logical = as<Logical>(s.entry);
    EXPECT_EQ(logical.op, LogicalOp::And);
    ASSERT_EQ(logical.operands.size(), 2u);

    const auto& first = as<Comparison>(logical.operands[0]);
    const auto& sma = as<FunctionCall>(first.right);
    EXPECT_EQ(sma.name, "SMA");
    ASSERT_EQ(sma.arguments.size(), 2u);
    EXPECT_EQ(as<Identifier>(sma.arguments[0]).name, "close");
    EXPECT_DOUBLE_EQ(numberOf(sma.arguments[1]), 20.0);

    const auto& second = as<Comparison>(logical.operands[1]);
    EXPECT_DOUBLE_EQ(numberOf(second.right), 1000000.0);
}

TEST_F(ParserTest, CrossAbove) {
    Strategy s = compile("ENTRY: close crosses above SMA(close,20)");
    const auto& cross = as<Cross>(s.entry);
    EXPECT_EQ(cross.type, CrossType::CrossesAbove);
    EXPECT_EQ(as<Identifier>(cross.left).name, "close");
    EXPECT_EQ(as<FunctionCall>(cross.right).name, "SMA");
}

TEST_F(ParserTest, OrWithScaledRightOperand) {
    Strategy s = compile("ENTRY: close > 100 OR volume > 1M");
    const auto& logical = as<Logical>(s.entry);
    EXPECT_EQ(logical.op, LogicalOp::Or);
    ASSERT_EQ(logical.operands.size(), 2u);
    EXPECT_DOUBLE_EQ(numberOf(as<Comparison>(logical.operands[1]).right), 1000000.0);
}

TEST_F(ParserTest, UnknownSectionKeywordFails) {
    EXPECT_THROW(compile("INVALID: close > 100"), core::ParseException);
}

TEST_F(ParserTest, MissingRightOperandFails) {
    EXPECT_THROW(compile("ENTRY: close >"), core::ParseException);
}

// ===========================================================================
// 2. Sections
// ===========================================================================
TEST_F(ParserTest, EntryAndExitSections) {
    Strategy s = compile("ENTRY: close > open\nEXIT: close < open");
    ASSERT_TRUE(s.entry != nullptr);
    ASSERT_TRUE(s.exit != nullptr);
    EXPECT_EQ(as<Comparison>(s.exit).op, ComparisonOp::LT);
}

TEST_F(ParserTest, ExitOnly) {
    Strategy s = compile("exit: rsi(close, 14) > 70");
    EXPECT_TRUE(s.entry == nullptr);
    ASSERT_TRUE(s.exit != nullptr);
    EXPECT_EQ(as<FunctionCall>(as<Comparison>(s.exit).left).name, "RSI");
}

TEST_F(ParserTest, EmptyTextHasNoSections) {
    Strategy s = compile("");
    EXPECT_TRUE(s.entry == nullptr);
    EXPECT_TRUE(s.exit == nullptr);
}

TEST_F(ParserTest, ExitBeforeEntryFails) {
    EXPECT_THROW(compile("EXIT: close < 1 ENTRY: close > 1"), core::ParseException);
}

TEST_F(ParserTest, DuplicateSectionFails) {
    EXPECT_THROW(compile("ENTRY: close > 1 ENTRY: close > 2"), core::ParseException);
    EXPECT_THROW(compile("EXIT: close > 1 EXIT: close > 2"), core::ParseException);
}

TEST_F(ParserTest, MissingColonFails) {
    EXPECT_THROW(compile("ENTRY close > 1"), core::ParseException);
}

TEST_F(ParserTest, WhitespaceBeforeColonAccepted) {
    EXPECT_NO_THROW(compile("ENTRY : close > 1"));
}

// ===========================================================================
// 3. Precedence and grouping
// ===========================================================================
TEST_F(ParserTest, AndBindsTighterThanOr) {
    Strategy s = compile("ENTRY: close > 1 OR close > 2 AND close > 3");
    const auto& orNode = as<Logical>(s.entry);
    EXPECT_EQ(orNode.op, LogicalOp::Or);
    ASSERT_EQ(orNode.operands.size(), 2u);
    EXPECT_NO_THROW(as<Comparison>(orNode.operands[0]));
    const auto& andNode = as<Logical>(orNode.operands[1]);
    EXPECT_EQ(andNode.op, LogicalOp::And);
    EXPECT_EQ(andNode.operands.size(), 2u);
}

TEST_F(ParserTest, RepeatedAndFoldsIntoOneNode) {
    Strategy s = compile("ENTRY: close > 1 AND close > 2 AND close > 3");
    EXPECT_EQ(as<Logical>(s.entry).operands.size(), 3u);
}

TEST_F(ParserTest, ParenthesesOverrideLogicalPrecedence) {
    Strategy s = compile("ENTRY: (close > 1 OR close > 2) AND volume > 3");
    const auto& andNode = as<Logical>(s.entry);
    EXPECT_EQ(andNode.op, LogicalOp::And);
    EXPECT_EQ(as<Logical>(andNode.operands[0]).op, LogicalOp::Or);
}

TEST_F(ParserTest, MultiplicationBindsTighterThanAddition) {
    Strategy s = compile("ENTRY: close > open + high * 2");
    const auto& sum = as<Binary>(as<Comparison>(s.entry).right);
    EXPECT_EQ(sum.op, ArithmeticOp::Add);
    EXPECT_EQ(as<Identifier>(sum.left).name, "open");
    EXPECT_EQ(as<Binary>(sum.right).op, ArithmeticOp::Multiply);
}

TEST_F(ParserTest, ArithmeticIsLeftAssociative) {
    Strategy s = compile("ENTRY: close > open - high - low");
    const auto& outer = as<Binary>(as<Comparison>(s.entry).right);
    EXPECT_EQ(outer.op, ArithmeticOp::Subtract);
    EXPECT_EQ(as<Identifier>(outer.right).name, "low");
    EXPECT_EQ(as<Binary>(outer.left).op, ArithmeticOp::Subtract);
}

TEST_F(ParserTest, ParenthesesOverrideArithmeticPrecedence) {
    Strategy s = compile("ENTRY: close > (open + high) * 2");
    const auto& product = as<Binary>(as<Comparison>(s.entry).right);
    EXPECT_EQ(product.op, ArithmeticOp::Multiply);
    EXPECT_EQ(as<Binary>(product.left).op, ArithmeticOp::Add);
}

TEST_F(ParserTest, PercentageOffsetBaseline) {
    Strategy s = compile("ENTRY: close > close_last_week * 1.05");
    const auto& product = as<Binary>(as<Comparison>(s.entry).right);
    EXPECT_EQ(as<Identifier>(product.left).name, "close_last_week");
    EXPECT_DOUBLE_EQ(numberOf(product.right), 1.05);
}

TEST_F(ParserTest, NodePositionsPointAtFirstToken) {
    Strategy s = compile("ENTRY: close > 100 AND volume > 1M");
    const auto& logical = as<Logical>(s.entry);
    EXPECT_EQ(s.entry->position, 7u);
    EXPECT_EQ(logical.operands[1]->position, 23u);
}

// ===========================================================================
// 4. Structural and type errors
// ===========================================================================
TEST_F(ParserTest, ChainedComparisonFails) {
    EXPECT_THROW(compile("ENTRY: 1 < close < 2"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close crosses above open > 1"), core::ParseException);
}

TEST_F(ParserTest, NumericSectionRootFails) {
    EXPECT_THROW(compile("ENTRY: close"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close + 1"), core::ParseException);
}

TEST_F(ParserTest, NumericOperandOfAndFails) {
    EXPECT_THROW(compile("ENTRY: close > 1 AND volume"), core::ParseException);
}

TEST_F(ParserTest, ConditionInsideArithmeticFails) {
    EXPECT_THROW(compile("ENTRY: (close > 1) + 2 > 3"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > (open > 1)"), core::ParseException);
}

TEST_F(ParserTest, UnmatchedParenthesisFails) {
    EXPECT_THROW(compile("ENTRY: (close > 1"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > 1)"), core::ParseException);
}

TEST_F(ParserTest, UnaryMinusIsNotAccepted) {
    EXPECT_THROW(compile("ENTRY: close > -1"), core::ParseException);
}

TEST_F(ParserTest, UnknownFieldFails) {
    try {
        compile("ENTRY: price > 100");
        FAIL() << "expected ParseException";
    } catch (const core::ParseException& e) {
        EXPECT_EQ(e.offset(), 7u);
        EXPECT_NE(e.found().find("price"), std::string::npos);
    }
}

TEST_F(ParserTest, UnknownSuffixFails) {
    EXPECT_THROW(compile("ENTRY: close_tomorrow > 1"), core::ParseException);
}

TEST_F(ParserTest, UnknownFunctionFails) {
    try {
        compile("ENTRY: close > EMA(close, 20)");
        FAIL() << "expected ParseException";
    } catch (const core::ParseException& e) {
        EXPECT_EQ(e.expected(), "SMA or RSI");
        EXPECT_EQ(e.offset(), 15u);
    }
}

TEST_F(ParserTest, FunctionArgumentRules) {
    EXPECT_THROW(compile("ENTRY: close > SMA(close)"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > SMA(close, 20, 3)"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > SMA(20, close)"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > SMA(close, 2.5)"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > SMA(close, 0)"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > SMA(close, open)"), core::ParseException);
    EXPECT_THROW(compile("ENTRY: close > SMA close, 20"), core::ParseException);
}

TEST_F(ParserTest, FunctionOfShiftedFieldIsAccepted) {
    Strategy s = compile("ENTRY: close > SMA(close_yesterday, 5)");
    const auto& call = as<FunctionCall>(as<Comparison>(s.entry).right);
    EXPECT_EQ(as<Identifier>(call.arguments[0]).name, "close_yesterday");
}

TEST_F(ParserTest, ParseExceptionReportsExpectedAndFound) {
    try {
        compile("ENTRY: close >");
        FAIL() << "expected ParseException";
    } catch (const core::ParseException& e) {
        EXPECT_EQ(e.found(), "end of input");
        EXPECT_EQ(e.offset(), 14u);
        EXPECT_FALSE(e.expected().empty());
    }
}

TEST_F(ParserTest, LexErrorsSurfaceThroughCompile) {
    EXPECT_THROW(compile("ENTRY: close > 100 & volume > 1"), core::LexException);
}
