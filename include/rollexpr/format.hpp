#pragma once
#include <string>
#include "rollexpr/config.hpp"
#include "rollexpr/evaluator.hpp"

namespace rollexpr {

/// v rounded to `precision` decimals, without trailing fractional zeros.
std::string format_number(double v, int precision = kDefaultPrecision);

/// Display text for a result:
///
///     11
///     3d6 [1, 6, 4] = 11
///     4wod8 [!1, 8, 9, ~~3~~] = 1
///
/// Dropped draws are struck through, natural-one penalties carry a '!'.
/// Warnings follow as "warning: ..." lines.
std::string format(const EvalResult& result, int precision = kDefaultPrecision);

} // namespace rollexpr
