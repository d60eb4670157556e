#include <gtest/gtest.h>
#include <rollexpr/errors.hpp>
#include <rollexpr/parser.hpp>

#include <string>
#include <variant>

namespace {

using rollexpr::BinaryOp;
using rollexpr::BinOp;
using rollexpr::Budget;
using rollexpr::DiceRoll;

rollexpr::NodePtr build(const std::string& s, const Budget& b = Budget{}) {
    return rollexpr::parse(s, b);
}

TEST(Parser, SubtractionIsLeftAssociative) {
    auto root = build("1 - 2 - 3");
    const auto* top = std::get_if<BinaryOp>(&root->expr);
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->op, BinOp::Sub);
    EXPECT_NE(std::get_if<BinaryOp>(&top->lhs->expr), nullptr);
    EXPECT_NE(std::get_if<rollexpr::NumberLiteral>(&top->rhs->expr), nullptr);
    EXPECT_EQ(root->height, 3);
}

TEST(Parser, PowerIsRightAssociative) {
    auto root = build("2**3**2");
    const auto* top = std::get_if<BinaryOp>(&root->expr);
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->op, BinOp::Pow);
    EXPECT_NE(std::get_if<rollexpr::NumberLiteral>(&top->lhs->expr), nullptr);
    const auto* rhs = std::get_if<BinaryOp>(&top->rhs->expr);
    ASSERT_NE(rhs, nullptr);
    EXPECT_EQ(rhs->op, BinOp::Pow);
}

TEST(Parser, PowerBindsTighterThanLeadingMinus) {
    auto root = build("-2**2");
    const auto* neg = std::get_if<rollexpr::UnaryOp>(&root->expr);
    ASSERT_NE(neg, nullptr);
    EXPECT_EQ(neg->op, rollexpr::UnOp::Neg);
    EXPECT_NE(std::get_if<BinaryOp>(&neg->operand->expr), nullptr);
}

TEST(Parser, MultiplicationBeforeShiftBeforeBitwise) {
    auto root = build("1 | 2 << 3 * 4");
    const auto* top = std::get_if<BinaryOp>(&root->expr);
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(top->op, BinOp::BitOr);
    const auto* shift = std::get_if<BinaryOp>(&top->rhs->expr);
    ASSERT_NE(shift, nullptr);
    EXPECT_EQ(shift->op, BinOp::Shl);
    const auto* mul = std::get_if<BinaryOp>(&shift->rhs->expr);
    ASSERT_NE(mul, nullptr);
    EXPECT_EQ(mul->op, BinOp::Mul);
}

TEST(Parser, DiceTermsBecomeLeaves) {
    auto root = build("3d6");
    const auto* d = std::get_if<DiceRoll>(&root->expr);
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->count, 3);
    EXPECT_EQ(d->low, 1);
    EXPECT_EQ(d->high, 6);
    EXPECT_EQ(d->label, "3d6");

    auto ranged = build("d{-5,-1}");
    const auto* r = std::get_if<DiceRoll>(&ranged->expr);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->kind, rollexpr::DiceKind::Ranged);
    EXPECT_EQ(r->count, 1);
    EXPECT_EQ(r->low, -5);
    EXPECT_EQ(r->high, -1);
}

TEST(Parser, PoolThresholdDefaultIsConfigurable) {
    auto root = build("4wod");
    EXPECT_EQ(std::get<DiceRoll>(root->expr).threshold, 8);

    auto custom = rollexpr::parse("4wod", Budget{}, 6);
    EXPECT_EQ(std::get<DiceRoll>(custom->expr).threshold, 6);

    auto explicit_threshold = rollexpr::parse("4wod9", Budget{}, 6);
    EXPECT_EQ(std::get<DiceRoll>(explicit_threshold->expr).threshold, 9);
}

TEST(Parser, FunctionCallsAndConstants) {
    auto root = build("max(1, 2d6, 3)");
    const auto* call = std::get_if<rollexpr::FunctionCall>(&root->expr);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->name, "max");
    EXPECT_EQ(call->args.size(), 3u);

    auto pi = build("pi");
    const auto* lit = std::get_if<rollexpr::NumberLiteral>(&pi->expr);
    ASSERT_NE(lit, nullptr);
    EXPECT_NEAR(lit->value, 3.14159265, 1e-8);
}

TEST(Parser, UnknownNamesFailAtParseTime) {
    try {
        build("1 + unknown_fn(1)");
        FAIL() << "expected UnknownFunctionError";
    } catch (const rollexpr::UnknownFunctionError& e) {
        EXPECT_EQ(e.name, "unknown_fn");
        EXPECT_EQ(e.position, 4u);
    }
    EXPECT_THROW(build("x + 1"), rollexpr::UnknownFunctionError);
    EXPECT_THROW(build("eval(1)"), rollexpr::UnknownFunctionError);
}

TEST(Parser, ArityCheckedAgainstRegistry) {
    try {
        build("sqrt(1, 2)");
        FAIL() << "expected ArityError";
    } catch (const rollexpr::ArityError& e) {
        EXPECT_EQ(e.name, "sqrt");
        EXPECT_EQ(e.expected_min, 1);
        EXPECT_EQ(e.expected_max, 1);
        EXPECT_EQ(e.got, 2);
    }
    EXPECT_THROW(build("max()"), rollexpr::ArityError);
    EXPECT_THROW(build("pow(2)"), rollexpr::ArityError);
    EXPECT_NO_THROW(build("max(1, 2, 3, 4, 5)"));
}

TEST(Parser, SyntaxErrorsCarryPosition) {
    try {
        build("(1+2");
        FAIL() << "expected SyntaxError";
    } catch (const rollexpr::SyntaxError& e) {
        EXPECT_EQ(e.position, 4u);
        EXPECT_EQ(e.expected, "')'");
        EXPECT_EQ(e.found, "end of input");
    }

    try {
        build("1 2");
        FAIL() << "expected SyntaxError";
    } catch (const rollexpr::SyntaxError& e) {
        EXPECT_EQ(e.position, 2u);
        EXPECT_EQ(e.found, "'2'");
    }

    EXPECT_THROW(build(""), rollexpr::SyntaxError);
    EXPECT_THROW(build("   "), rollexpr::SyntaxError);
    EXPECT_THROW(build("1 +"), rollexpr::SyntaxError);
    EXPECT_THROW(build("1)"), rollexpr::SyntaxError);
    EXPECT_THROW(build("* 2"), rollexpr::SyntaxError);
    EXPECT_THROW(build("max(1,)"), rollexpr::SyntaxError);
    EXPECT_THROW(build("max(1 2)"), rollexpr::SyntaxError);
    EXPECT_THROW(build("1 == not 2"), rollexpr::SyntaxError);
    EXPECT_THROW(build("3d6 4"), rollexpr::SyntaxError);
}

TEST(Parser, NestingDepthIsBounded) {
    std::string parens = std::string(100, '(') + "1" + std::string(100, ')');
    EXPECT_THROW(build(parens), rollexpr::DepthExceededError);

    std::string negations = std::string(100, '-') + "1";
    EXPECT_THROW(build(negations), rollexpr::BudgetExceededError);

    // a long left-leaning chain is deep even without recursion
    std::string sum = "1";
    for (int i = 0; i < 69; ++i) sum += "+1";
    EXPECT_THROW(build(sum), rollexpr::DepthExceededError);

    std::string shallow = std::string(20, '(') + "1" + std::string(20, ')');
    EXPECT_NO_THROW(build(shallow));
}

TEST(Parser, DepthLimitFollowsBudget) {
    Budget b;
    b.max_ast_depth = 3;
    EXPECT_NO_THROW(build("1 + 2 * 3", b));
    EXPECT_THROW(build("1 + 2 * (3 - 4)", b), rollexpr::DepthExceededError);
}

TEST(Parser, NodeCountIsBounded) {
    Budget b;
    b.max_expansion_count = 5;
    try {
        build("1 + 2 + 3 + 4", b);
        FAIL() << "expected BudgetExceededError";
    } catch (const rollexpr::BudgetExceededError& e) {
        EXPECT_EQ(e.limit, "max_expansion_count");
    }
    auto root = build("1 + 2 + 3", b);
    EXPECT_EQ(rollexpr::node_count(*root), 5u);

    EXPECT_EQ(rollexpr::node_count(*build("max(1, -2d6, 3)")), 5u);
}

TEST(Parser, DiceTermErrorsSurfaceDuringParse) {
    EXPECT_THROW(build("0d6"), rollexpr::DiceTermError);
    EXPECT_THROW(build("2d0"), rollexpr::DiceTermError);
    EXPECT_THROW(build("2d"), rollexpr::DiceTermError);
    EXPECT_THROW(build("2d{5,1}"), rollexpr::DiceTermError);
    EXPECT_THROW(build("3wod1"), rollexpr::DiceTermError);
    EXPECT_THROW(build("3wod11"), rollexpr::DiceTermError);

    try {
        build("1001d6");
        FAIL() << "expected BudgetExceededError";
    } catch (const rollexpr::BudgetExceededError& e) {
        EXPECT_EQ(e.limit, "max_total_dice");
        EXPECT_EQ(e.requested, 1001);
    }
    EXPECT_THROW(build("1d100001"), rollexpr::BudgetExceededError);
    EXPECT_THROW(build("1d{-200000,1}"), rollexpr::BudgetExceededError);
    EXPECT_THROW(build("99999999999999999999999d6"), rollexpr::BudgetExceededError);
}

} // namespace
