#include "rollexpr/errors.hpp"
#include <sstream>
#include <utility>

namespace rollexpr {

static std::string at(std::size_t position) {
    return " at position " + std::to_string(position);
}

static std::string lex_message(std::size_t position, char c) {
    std::string msg = "Unexpected character '";
    msg += c;
    msg += "'";
    return msg + at(position);
}

LexError::LexError(std::size_t position_, char character_)
    : ParseError(lex_message(position_, character_)), position(position_), character(character_) {}

SyntaxError::SyntaxError(std::size_t position_, std::string expected_, std::string found_)
    : ParseError("Expected " + expected_ + " but found " + found_ + at(position_)),
      position(position_), expected(std::move(expected_)), found(std::move(found_)) {}

UnknownFunctionError::UnknownFunctionError(std::string name_, std::size_t position_)
    : ParseError("Unknown function or name '" + name_ + "'" + at(position_)),
      name(std::move(name_)), position(position_) {}

DiceTermError::DiceTermError(std::string reason_, std::size_t position_)
    : Error("Invalid dice term: " + reason_ + at(position_)),
      reason(std::move(reason_)), position(position_) {}

static std::string arity_message(const std::string& name, int lo, int hi, int got) {
    std::string expected;
    if (hi < 0) expected = "at least " + std::to_string(lo);
    else if (lo == hi) expected = std::to_string(lo);
    else expected = std::to_string(lo) + " to " + std::to_string(hi);
    return name + "() takes " + expected + " argument" + (lo == 1 && hi == 1 ? "" : "s") +
           ", got " + std::to_string(got);
}

ArityError::ArityError(std::string name_, int expected_min_, int expected_max_, int got_)
    : Error(arity_message(name_, expected_min_, expected_max_, got_)),
      name(std::move(name_)), expected_min(expected_min_), expected_max(expected_max_), got(got_) {}

BudgetExceededError::BudgetExceededError(std::string limit_, std::int64_t allowed_, std::int64_t requested_)
    : Error("Limit " + limit_ + " exceeded: " + std::to_string(requested_) + " requested, " +
            std::to_string(allowed_) + " allowed"),
      limit(std::move(limit_)), allowed(allowed_), requested(requested_) {}

DepthExceededError::DepthExceededError(std::int64_t allowed_, std::size_t position_)
    : BudgetExceededError("max_ast_depth", allowed_, allowed_ + 1), position(position_) {}

DivisionByZeroError::DivisionByZeroError(std::string op_)
    : EvalError("Division by zero in '" + op_ + "'"), op(std::move(op_)) {}

static std::string type_message(const std::string& op, double operand) {
    std::ostringstream os;
    os << "Operator '" << op << "' requires integer operands, got " << operand;
    return os.str();
}

TypeError::TypeError(std::string op_, double operand_)
    : EvalError(type_message(op_, operand_)), op(std::move(op_)), operand(operand_) {}

DomainError::DomainError(std::string operation_)
    : EvalError("Math domain error in " + operation_), operation(std::move(operation_)) {}

} // namespace rollexpr
