#pragma once

#include <string_view>

#include <rollexpr/config.hpp>
#include <rollexpr/errors.hpp>
#include <rollexpr/evaluator.hpp>
#include <rollexpr/format.hpp>
#include <rollexpr/random.hpp>

namespace rollexpr {

/// Tokenize, parse and evaluate an untrusted expression such as "2d20 + 3".
/// Throws a rollexpr::Error on bad input; nothing is drawn from src unless
/// the expression parsed.
EvalResult roll(std::string_view expression, const Budget& budget, RandomSource& src);
EvalResult roll(std::string_view expression, const Config& config, RandomSource& src);

/// A single six-sided die, for hosts invoked without an expression.
EvalResult roll_default(RandomSource& src);

} // namespace rollexpr
