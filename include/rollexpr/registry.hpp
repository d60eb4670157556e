#pragma once
#include <optional>
#include <string_view>
#include <vector>

#include "rollexpr/ast.hpp"
#include "rollexpr/token.hpp"

namespace rollexpr {

inline constexpr int kVariadic = -1;

/// An allow-listed math function. Implementations are pure and never see
/// anything but their numeric arguments.
struct FunctionInfo {
    std::string_view name;
    int min_args;
    int max_args; // kVariadic: no upper bound
    double (*fn)(const std::vector<double>& args);

    bool accepts(int argc) const { return argc >= min_args && (max_args == kVariadic || argc <= max_args); }
};

struct ConstantInfo {
    std::string_view name;
    double value;
};

struct BinaryOpInfo {
    BinOp op;
    std::string_view symbol;
    int precedence; // larger binds tighter
    bool right_assoc;
};

struct UnaryOpInfo {
    UnOp op;
    std::string_view symbol;
    int precedence; // precedence of the operand parsed after the operator
};

// Precedence levels shared by parser and registry.
namespace prec {
inline constexpr int Or = 1;
inline constexpr int And = 2;
inline constexpr int Not = 3;
inline constexpr int Compare = 4;
inline constexpr int BitOr = 5;
inline constexpr int BitXor = 6;
inline constexpr int BitAnd = 7;
inline constexpr int Shift = 8;
inline constexpr int Additive = 9;
inline constexpr int Multiplicative = 10;
inline constexpr int Unary = 11;
inline constexpr int Power = 12;
} // namespace prec

const FunctionInfo* find_function(std::string_view name);
const ConstantInfo* find_constant(std::string_view name);

/// Operator a token denotes in binary position, if any.
const BinaryOpInfo* binary_operator(TokKind k);
/// Operator a token denotes in prefix position, if any.
const UnaryOpInfo* unary_operator(TokKind k);

std::string_view symbol(BinOp op);
std::string_view symbol(UnOp op);

/// Numeric semantics. Throw DivisionByZeroError, TypeError or DomainError.
double apply(BinOp op, double a, double b);
double apply(UnOp op, double a);
double call(const FunctionInfo& f, const std::vector<double>& args);

} // namespace rollexpr
