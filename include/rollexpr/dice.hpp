#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "rollexpr/ast.hpp"
#include "rollexpr/config.hpp"
#include "rollexpr/random.hpp"
#include "rollexpr/token.hpp"

namespace rollexpr {

inline constexpr int kPoolSides = 10;

/// Evidence of one evaluated dice term. kept, dropped and penalties
/// partition raw by value.
struct RollEvent {
    std::string label;
    DiceKind kind{DiceKind::Standard};
    std::int64_t low{1};
    std::int64_t high{6};
    int threshold{0};                 // Pool only
    std::vector<std::int64_t> raw;    // every draw, in order
    std::vector<std::int64_t> kept;
    std::vector<std::int64_t> dropped;
    std::vector<std::int64_t> penalties; // natural ones of a pool roll
    std::int64_t subtotal{0};
};

/// Build a validated DiceRoll from a Dice token.
/// Throws DiceTermError for malformed terms and BudgetExceededError when the
/// term alone is larger than the budget allows.
DiceRoll recognize_dice(const Token& t, const Budget& budget, int default_pool_threshold = kDefaultPoolThreshold);

/// Draw d.count values from src and score them.
RollEvent roll_dice(const DiceRoll& d, RandomSource& src);

} // namespace rollexpr
