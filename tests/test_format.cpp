#include <gtest/gtest.h>
#include <rollexpr/roll.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace {

using rollexpr::Budget;
using rollexpr::ScriptedSource;

std::string show(const std::string& expr, std::vector<std::int64_t> draws) {
    ScriptedSource src(std::move(draws));
    return rollexpr::format(rollexpr::roll(expr, Budget{}, src));
}

TEST(Format, NumbersLoseTrailingZeros) {
    EXPECT_EQ(rollexpr::format_number(3.0), "3");
    EXPECT_EQ(rollexpr::format_number(10.0), "10");
    EXPECT_EQ(rollexpr::format_number(2.5), "2.5");
    EXPECT_EQ(rollexpr::format_number(3.14159), "3.14");
    EXPECT_EQ(rollexpr::format_number(-1.005, 1), "-1");
    EXPECT_EQ(rollexpr::format_number(1.0 / 3.0, 4), "0.3333");
    EXPECT_EQ(rollexpr::format_number(-0.0), "0");
    EXPECT_EQ(rollexpr::format_number(-0.001), "0");
    EXPECT_EQ(rollexpr::format_number(7.25, 0), "7");
}

TEST(Format, PlainArithmetic) {
    EXPECT_EQ(show("1/3", {}), "0.33");
    EXPECT_EQ(show("(1+2)*3", {}), "9");
}

TEST(Format, StandardDice) {
    EXPECT_EQ(show("3d6", {1, 6, 4}), "11\n3d6 [1, 6, 4] = 11");
    EXPECT_EQ(show("2d{-5,-1} + 1", {-3, -1}), "-3\n2d{-5,-1} [-3, -1] = -4");
}

TEST(Format, PoolMarksDroppedAndPenaltyDraws) {
    EXPECT_EQ(show("4wod8", {1, 8, 9, 3}), "1\n4wod8 [!1, 8, 9, ~~3~~] = 1");
    EXPECT_EQ(show("3wod", {3, 3, 10}), "1\n3wod [~~3~~, ~~3~~, 10] = 1");
}

TEST(Format, OneLinePerDiceTerm) {
    std::string s = show("1d20 + 2d4", {17, 1, 3});
    EXPECT_EQ(s, "21\n1d20 [17] = 17\n2d4 [1, 3] = 4");
}

TEST(Format, WarningsAreAppended) {
    std::string s = show("2**60", {});
    EXPECT_EQ(s.rfind("1152921504606846976\n", 0), 0u);
    EXPECT_NE(s.find("\nwarning: "), std::string::npos);
}

TEST(Format, NeverFailsOnSuccessfulRolls) {
    const char* exprs[] = {
        "1d20", "4d6 + 2", "2wod7 - 1d{-3,3}", "max(3d6, 2d8) // 2", "d100 / 7",
        "(1d6 << 2) | 1", "not 1d2 == 1", "sqrt(1d100) * pi", "10wod",
    };
    rollexpr::EngineSource<> rng(7);
    for (const char* e : exprs) {
        rollexpr::EvalResult r = rollexpr::roll(e, Budget{}, rng);
        EXPECT_NO_THROW({
            std::string s = rollexpr::format(r);
            EXPECT_FALSE(s.empty());
        }) << e;
    }
}

} // namespace
