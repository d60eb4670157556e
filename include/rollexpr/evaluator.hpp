#pragma once
#include <string>
#include <vector>

#include "rollexpr/ast.hpp"
#include "rollexpr/config.hpp"
#include "rollexpr/dice.hpp"
#include "rollexpr/random.hpp"

namespace rollexpr {

struct EvalResult {
    double value{0.0};
    std::vector<RollEvent> events;     // one per dice term, in source order
    std::vector<std::string> warnings;
};

/// Walk the tree post-order, drawing from src exactly once per die.
/// Throws EvalError subclasses, ArityError, or BudgetExceededError when the
/// dice drawn over the whole expression would exceed budget.max_total_dice.
EvalResult evaluate(const Node& ast, RandomSource& src, const Budget& budget);

} // namespace rollexpr
