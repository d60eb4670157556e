#include <rollexpr/roll.hpp>
#include <rollexpr/parser.hpp>

namespace rollexpr {

static constexpr std::string_view kDefaultExpression = "1d6";

EvalResult roll(std::string_view expression, const Config& config, RandomSource& src) {
    NodePtr ast = parse(expression, config.budget, config.default_pool_threshold);
    return evaluate(*ast, src, config.budget);
}

EvalResult roll(std::string_view expression, const Budget& budget, RandomSource& src) {
    Config config;
    config.budget = budget;
    return roll(expression, config, src);
}

EvalResult roll_default(RandomSource& src) {
    return roll(kDefaultExpression, Config{}, src);
}

} // namespace rollexpr
