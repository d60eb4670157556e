#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rollexpr {

/// Base of everything the library throws for bad input.
struct Error : std::runtime_error { using std::runtime_error::runtime_error; };

// -----------------------------
// parse stage
// -----------------------------
struct ParseError : Error { using Error::Error; };

struct LexError : ParseError {
    LexError(std::size_t position, char character);
    std::size_t position;
    char character;
};

struct SyntaxError : ParseError {
    SyntaxError(std::size_t position, std::string expected, std::string found);
    std::size_t position;
    std::string expected;
    std::string found;
};

struct UnknownFunctionError : ParseError {
    UnknownFunctionError(std::string name, std::size_t position);
    std::string name;
    std::size_t position;
};

// -----------------------------
// dice terms, arity, limits
// -----------------------------
struct DiceTermError : Error {
    DiceTermError(std::string reason, std::size_t position);
    std::string reason;
    std::size_t position;
};

struct ArityError : Error {
    // expected_max < 0 means "no upper bound"
    ArityError(std::string name, int expected_min, int expected_max, int got);
    std::string name;
    int expected_min;
    int expected_max;
    int got;
};

struct BudgetExceededError : Error {
    BudgetExceededError(std::string limit, std::int64_t allowed, std::int64_t requested);
    std::string limit; // which Budget field was hit
    std::int64_t allowed;
    std::int64_t requested;
};

struct DepthExceededError : BudgetExceededError {
    DepthExceededError(std::int64_t allowed, std::size_t position);
    std::size_t position;
};

// -----------------------------
// evaluation stage
// -----------------------------
struct EvalError : Error { using Error::Error; };

struct DivisionByZeroError : EvalError {
    explicit DivisionByZeroError(std::string op);
    std::string op;
};

struct TypeError : EvalError {
    TypeError(std::string op, double operand);
    std::string op;
    double operand;
};

/// Non-finite or otherwise undefined numeric result (overflow, sqrt(-1), bad shift).
struct DomainError : EvalError {
    explicit DomainError(std::string operation);
    std::string operation;
};

} // namespace rollexpr
