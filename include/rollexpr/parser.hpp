#pragma once
#include <string_view>
#include <vector>
#include "rollexpr/ast.hpp"
#include "rollexpr/config.hpp"
#include "rollexpr/token.hpp"

namespace rollexpr {

// Build the AST for a complete expression. Throws SyntaxError,
// UnknownFunctionError, ArityError, DiceTermError, BudgetExceededError
// (DepthExceededError for nesting). Never touches a randomness source.
NodePtr parse(const std::vector<Token>& tokens, const Budget& budget,
              int default_pool_threshold = kDefaultPoolThreshold);

// tokenize + parse
NodePtr parse(std::string_view input, const Budget& budget,
              int default_pool_threshold = kDefaultPoolThreshold);

} // namespace rollexpr
