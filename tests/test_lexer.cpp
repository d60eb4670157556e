#include <gtest/gtest.h>
#include <rollexpr/lexer.hpp>

#include <string>
#include <vector>

namespace {

using rollexpr::DiceKind;
using rollexpr::TokKind;

std::vector<TokKind> kinds(const std::string& s) {
    std::vector<TokKind> out;
    for (const auto& t : rollexpr::tokenize(s)) out.push_back(t.kind);
    return out;
}

TEST(Lexer, DiceTermIsOneToken) {
    auto toks = rollexpr::tokenize("3d6 + 2");
    ASSERT_EQ(toks.size(), 4u);

    EXPECT_EQ(toks[0].kind, TokKind::Dice);
    EXPECT_EQ(toks[0].dice.kind, DiceKind::Standard);
    EXPECT_EQ(toks[0].dice.count, "3");
    EXPECT_EQ(toks[0].dice.sides, "6");
    EXPECT_EQ(toks[0].text, "3d6");
    EXPECT_EQ(toks[0].pos, 0u);

    EXPECT_EQ(toks[1].kind, TokKind::Plus);
    EXPECT_EQ(toks[1].pos, 4u);
    EXPECT_EQ(toks[2].kind, TokKind::Number);
    EXPECT_DOUBLE_EQ(toks[2].number, 2.0);
    EXPECT_EQ(toks[3].kind, TokKind::End);
    EXPECT_EQ(toks[3].pos, 7u);
}

TEST(Lexer, DiceVariants) {
    auto ranged = rollexpr::tokenize("2d{-5,-1}");
    EXPECT_EQ(ranged[0].dice.kind, DiceKind::Ranged);
    EXPECT_EQ(ranged[0].dice.count, "2");
    EXPECT_EQ(ranged[0].dice.sides, "");
    EXPECT_EQ(ranged[0].dice.lo, "-5");
    EXPECT_EQ(ranged[0].dice.hi, "-1");
    EXPECT_EQ(ranged[1].kind, TokKind::End);

    auto labelled = rollexpr::tokenize("4d6{ 2, 7 }");
    EXPECT_EQ(labelled[0].dice.kind, DiceKind::Ranged);
    EXPECT_EQ(labelled[0].dice.sides, "6");
    EXPECT_EQ(labelled[0].dice.lo, "2");
    EXPECT_EQ(labelled[0].dice.hi, "7");

    auto pool = rollexpr::tokenize("4wod8");
    EXPECT_EQ(pool[0].dice.kind, DiceKind::Pool);
    EXPECT_EQ(pool[0].dice.count, "4");
    EXPECT_EQ(pool[0].dice.sides, "8");

    auto bare = rollexpr::tokenize("d20 + wod");
    EXPECT_EQ(bare[0].kind, TokKind::Dice);
    EXPECT_EQ(bare[0].dice.count, "");
    EXPECT_EQ(bare[0].dice.sides, "20");
    EXPECT_EQ(bare[2].kind, TokKind::Dice);
    EXPECT_EQ(bare[2].dice.kind, DiceKind::Pool);
    EXPECT_EQ(bare[2].dice.sides, "");
}

TEST(Lexer, MissingSidesStillLexesAsDice) {
    auto toks = rollexpr::tokenize("2d + 1");
    EXPECT_EQ(toks[0].kind, TokKind::Dice);
    EXPECT_EQ(toks[0].dice.sides, "");
}

TEST(Lexer, MultiCharOperatorsAreGreedy) {
    std::vector<TokKind> want = {
        TokKind::Number, TokKind::StarStar, TokKind::Number, TokKind::SlashSlash, TokKind::Number,
        TokKind::Shl,    TokKind::Number,   TokKind::Le,     TokKind::Number,     TokKind::NotEq,
        TokKind::Number, TokKind::Shr,      TokKind::Number, TokKind::Ge,         TokKind::Number,
        TokKind::EqEq,   TokKind::Number,   TokKind::End,
    };
    EXPECT_EQ(kinds("2**3 // 4 << 1 <= 5 != 6 >> 1 >= 0 == 1"), want);

    std::vector<TokKind> single = {
        TokKind::Number, TokKind::Star, TokKind::Number, TokKind::Slash, TokKind::Number,
        TokKind::Lt,     TokKind::Number, TokKind::Gt,   TokKind::Number, TokKind::End,
    };
    EXPECT_EQ(kinds("2*3/4<1>0"), single);
}

TEST(Lexer, KeywordsAndIdentifiers) {
    std::vector<TokKind> want = {
        TokKind::Number, TokKind::And, TokKind::Not, TokKind::Number, TokKind::Or,
        TokKind::Ident,  TokKind::LParen, TokKind::Number, TokKind::Comma, TokKind::Number,
        TokKind::RParen, TokKind::End,
    };
    EXPECT_EQ(kinds("1 and not 0 or max(1, 2)"), want);

    auto toks = rollexpr::tokenize("android");
    EXPECT_EQ(toks[0].kind, TokKind::Ident);
    EXPECT_EQ(toks[0].text, "android");

    // 'd' not followed by a digit or brace is an ordinary name
    auto d = rollexpr::tokenize("dx");
    EXPECT_EQ(d[0].kind, TokKind::Ident);
}

TEST(Lexer, DecimalNumbers) {
    auto toks = rollexpr::tokenize("1.5 + .25");
    EXPECT_EQ(toks[0].kind, TokKind::Number);
    EXPECT_DOUBLE_EQ(toks[0].number, 1.5);
    EXPECT_DOUBLE_EQ(toks[2].number, 0.25);
}

TEST(Lexer, UnexpectedCharacterReportsPosition) {
    try {
        rollexpr::tokenize("2 $ 3");
        FAIL() << "expected LexError";
    } catch (const rollexpr::LexError& e) {
        EXPECT_EQ(e.position, 2u);
        EXPECT_EQ(e.character, '$');
    }

    EXPECT_THROW(rollexpr::tokenize("a = 1"), rollexpr::LexError);
    EXPECT_THROW(rollexpr::tokenize("!1"), rollexpr::LexError);
    EXPECT_THROW(rollexpr::tokenize("__import__('os')"), rollexpr::LexError);
}

TEST(Lexer, MalformedRange) {
    EXPECT_THROW(rollexpr::tokenize("2d{1,}"), rollexpr::SyntaxError);
    EXPECT_THROW(rollexpr::tokenize("2d{1 2}"), rollexpr::SyntaxError);
    EXPECT_THROW(rollexpr::tokenize("2d{1,2"), rollexpr::SyntaxError);
}

} // namespace
