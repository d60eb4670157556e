#include "rollexpr/registry.hpp"
#include "rollexpr/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace rollexpr {

// -----------------------------
// functions
// -----------------------------
using Args = std::vector<double>;

static const std::vector<FunctionInfo> kFunctions = {
    {"abs",   1, 1, [](const Args& a) { return std::fabs(a[0]); }},
    {"floor", 1, 1, [](const Args& a) { return std::floor(a[0]); }},
    {"ceil",  1, 1, [](const Args& a) { return std::ceil(a[0]); }},
    {"round", 1, 1, [](const Args& a) { return std::nearbyint(a[0]); }}, // ties to even
    {"trunc", 1, 1, [](const Args& a) { return std::trunc(a[0]); }},
    {"sqrt",  1, 1, [](const Args& a) { return std::sqrt(a[0]); }},
    {"exp",   1, 1, [](const Args& a) { return std::exp(a[0]); }},
    {"log",   1, 1, [](const Args& a) { return std::log(a[0]); }},
    {"log2",  1, 1, [](const Args& a) { return std::log2(a[0]); }},
    {"log10", 1, 1, [](const Args& a) { return std::log10(a[0]); }},
    {"sin",   1, 1, [](const Args& a) { return std::sin(a[0]); }},
    {"cos",   1, 1, [](const Args& a) { return std::cos(a[0]); }},
    {"tan",   1, 1, [](const Args& a) { return std::tan(a[0]); }},
    {"asin",  1, 1, [](const Args& a) { return std::asin(a[0]); }},
    {"acos",  1, 1, [](const Args& a) { return std::acos(a[0]); }},
    {"atan",  1, 1, [](const Args& a) { return std::atan(a[0]); }},
    {"pow",   2, 2, [](const Args& a) { return std::pow(a[0], a[1]); }},
    {"atan2", 2, 2, [](const Args& a) { return std::atan2(a[0], a[1]); }},
    {"hypot", 2, 2, [](const Args& a) { return std::hypot(a[0], a[1]); }},
    {"min",   1, kVariadic, [](const Args& a) { return *std::min_element(a.begin(), a.end()); }},
    {"max",   1, kVariadic, [](const Args& a) { return *std::max_element(a.begin(), a.end()); }},
};

static const ConstantInfo kConstants[] = {
    {"pi",  3.14159265358979323846},
    {"e",   2.71828182845904523536},
    {"tau", 6.28318530717958647692},
};

const FunctionInfo* find_function(std::string_view name) {
    for (const auto& f : kFunctions) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

const ConstantInfo* find_constant(std::string_view name) {
    for (const auto& c : kConstants) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

double call(const FunctionInfo& f, const std::vector<double>& args) {
    const int argc = static_cast<int>(args.size());
    if (!f.accepts(argc)) throw ArityError(std::string(f.name), f.min_args, f.max_args, argc);

    if (f.name == "pow" && args[0] == 0.0 && args[1] < 0.0) throw DivisionByZeroError("pow");

    double r = f.fn(args);
    if (!std::isfinite(r)) throw DomainError(std::string(f.name) + "()");
    return r;
}

// -----------------------------
// operators
// -----------------------------
static const BinaryOpInfo kBinary[] = {
    {BinOp::Or,       "or",  prec::Or,             false},
    {BinOp::And,      "and", prec::And,            false},
    {BinOp::Lt,       "<",   prec::Compare,        false},
    {BinOp::Le,       "<=",  prec::Compare,        false},
    {BinOp::Gt,       ">",   prec::Compare,        false},
    {BinOp::Ge,       ">=",  prec::Compare,        false},
    {BinOp::Eq,       "==",  prec::Compare,        false},
    {BinOp::Ne,       "!=",  prec::Compare,        false},
    {BinOp::BitOr,    "|",   prec::BitOr,          false},
    {BinOp::BitXor,   "^",   prec::BitXor,         false},
    {BinOp::BitAnd,   "&",   prec::BitAnd,         false},
    {BinOp::Shl,      "<<",  prec::Shift,          false},
    {BinOp::Shr,      ">>",  prec::Shift,          false},
    {BinOp::Add,      "+",   prec::Additive,       false},
    {BinOp::Sub,      "-",   prec::Additive,       false},
    {BinOp::Mul,      "*",   prec::Multiplicative, false},
    {BinOp::Div,      "/",   prec::Multiplicative, false},
    {BinOp::FloorDiv, "//",  prec::Multiplicative, false},
    {BinOp::Mod,      "%",   prec::Multiplicative, false},
    {BinOp::Pow,      "**",  prec::Power,          true},
};

static const UnaryOpInfo kUnary[] = {
    {UnOp::Not,    "not", prec::Not},
    {UnOp::Neg,    "-",   prec::Unary},
    {UnOp::Pos,    "+",   prec::Unary},
    {UnOp::Invert, "~",   prec::Unary},
};

static std::optional<BinOp> binop_for(TokKind k) {
    switch (k) {
        case TokKind::Plus:       return BinOp::Add;
        case TokKind::Minus:      return BinOp::Sub;
        case TokKind::Star:       return BinOp::Mul;
        case TokKind::Slash:      return BinOp::Div;
        case TokKind::SlashSlash: return BinOp::FloorDiv;
        case TokKind::Percent:    return BinOp::Mod;
        case TokKind::StarStar:   return BinOp::Pow;
        case TokKind::Amp:        return BinOp::BitAnd;
        case TokKind::Pipe:       return BinOp::BitOr;
        case TokKind::Caret:      return BinOp::BitXor;
        case TokKind::Shl:        return BinOp::Shl;
        case TokKind::Shr:        return BinOp::Shr;
        case TokKind::Lt:         return BinOp::Lt;
        case TokKind::Le:         return BinOp::Le;
        case TokKind::Gt:         return BinOp::Gt;
        case TokKind::Ge:         return BinOp::Ge;
        case TokKind::EqEq:       return BinOp::Eq;
        case TokKind::NotEq:      return BinOp::Ne;
        case TokKind::And:        return BinOp::And;
        case TokKind::Or:         return BinOp::Or;
        default:                  return std::nullopt;
    }
}

static std::optional<UnOp> unop_for(TokKind k) {
    switch (k) {
        case TokKind::Minus: return UnOp::Neg;
        case TokKind::Plus:  return UnOp::Pos;
        case TokKind::Tilde: return UnOp::Invert;
        case TokKind::Not:   return UnOp::Not;
        default:             return std::nullopt;
    }
}

const BinaryOpInfo* binary_operator(TokKind k) {
    auto op = binop_for(k);
    if (!op) return nullptr;
    for (const auto& i : kBinary) {
        if (i.op == *op) return &i;
    }
    return nullptr;
}

const UnaryOpInfo* unary_operator(TokKind k) {
    auto op = unop_for(k);
    if (!op) return nullptr;
    for (const auto& i : kUnary) {
        if (i.op == *op) return &i;
    }
    return nullptr;
}

std::string_view symbol(BinOp op) {
    for (const auto& i : kBinary) {
        if (i.op == op) return i.symbol;
    }
    return "?";
}

std::string_view symbol(UnOp op) {
    for (const auto& i : kUnary) {
        if (i.op == op) return i.symbol;
    }
    return "?";
}

// -----------------------------
// numeric semantics
// -----------------------------
static std::int64_t to_integer(std::string_view op, double v) {
    // 2^63 is exactly representable; anything at or beyond it does not fit
    constexpr double limit = 9223372036854775808.0;
    if (std::trunc(v) != v) throw TypeError(std::string(op), v);
    if (v < -limit || v >= limit) throw DomainError("'" + std::string(op) + "' (operand does not fit in 64 bits)");
    return static_cast<std::int64_t>(v);
}

static double checked(std::string_view op, double r) {
    if (!std::isfinite(r)) throw DomainError("'" + std::string(op) + "'");
    return r;
}

static int shift_count(std::string_view op, double b) {
    std::int64_t n = to_integer(op, b);
    if (n < 0) throw DomainError("'" + std::string(op) + "' (negative shift count)");
    return n > 63 ? 63 : static_cast<int>(n);
}

static double shift_left(double a, double b) {
    std::int64_t x = to_integer("<<", a);
    int n = shift_count("<<", b);
    if (x == 0) return 0.0;
    if (x > (std::numeric_limits<std::int64_t>::max() >> n) ||
        x < -(std::numeric_limits<std::int64_t>::max() >> n) - 1) {
        throw DomainError("'<<' (result does not fit in 64 bits)");
    }
    // only -1 survives a shift by 63
    if (n == 63) return static_cast<double>(std::numeric_limits<std::int64_t>::min());
    return static_cast<double>(x * (std::int64_t{1} << n));
}

static double shift_right(double a, double b) {
    std::int64_t x = to_integer(">>", a);
    int n = shift_count(">>", b);
    // floor semantics for negative values, without relying on arithmetic shift
    if (x >= 0) return static_cast<double>(x >> n);
    return static_cast<double>(-((-(x + 1)) >> n) - 1);
}

// Floor of a / b computed from the exact remainder, so 7.5 // 0.1 is 74
// even though 7.5 / 0.1 rounds up to 75.
static double floor_div(double a, double b) {
    double mod = std::fmod(a, b);
    double div = (a - mod) / b;
    if (mod != 0.0 && ((b < 0.0) != (mod < 0.0))) div -= 1.0;
    if (div == 0.0) return std::copysign(0.0, a / b);
    double q = std::floor(div);
    if (div - q > 0.5) q += 1.0;
    return q;
}

static double truth(bool b) { return b ? 1.0 : 0.0; }

double apply(BinOp op, double a, double b) {
    const std::string_view sym = symbol(op);
    switch (op) {
        case BinOp::Add: return checked(sym, a + b);
        case BinOp::Sub: return checked(sym, a - b);
        case BinOp::Mul: return checked(sym, a * b);
        case BinOp::Div:
            if (b == 0.0) throw DivisionByZeroError(std::string(sym));
            return checked(sym, a / b);
        case BinOp::FloorDiv:
            if (b == 0.0) throw DivisionByZeroError(std::string(sym));
            return checked(sym, floor_div(a, b));
        case BinOp::Mod: {
            if (b == 0.0) throw DivisionByZeroError(std::string(sym));
            double r = std::fmod(a, b);
            if (r != 0.0 && ((r < 0.0) != (b < 0.0))) r += b; // sign follows the divisor
            return r;
        }
        case BinOp::Pow:
            if (a == 0.0 && b < 0.0) throw DivisionByZeroError(std::string(sym));
            return checked(sym, std::pow(a, b));

        case BinOp::BitAnd: return static_cast<double>(to_integer(sym, a) & to_integer(sym, b));
        case BinOp::BitOr:  return static_cast<double>(to_integer(sym, a) | to_integer(sym, b));
        case BinOp::BitXor: return static_cast<double>(to_integer(sym, a) ^ to_integer(sym, b));
        case BinOp::Shl:    return shift_left(a, b);
        case BinOp::Shr:    return shift_right(a, b);

        case BinOp::Lt: return truth(a < b);
        case BinOp::Le: return truth(a <= b);
        case BinOp::Gt: return truth(a > b);
        case BinOp::Ge: return truth(a >= b);
        case BinOp::Eq: return truth(a == b);
        case BinOp::Ne: return truth(a != b);

        case BinOp::And: return truth(a != 0.0 && b != 0.0);
        case BinOp::Or:  return truth(a != 0.0 || b != 0.0);
    }
    throw EvalError("Unsupported binary operator");
}

double apply(UnOp op, double a) {
    const std::string_view sym = symbol(op);
    switch (op) {
        case UnOp::Neg:    return -a;
        case UnOp::Pos:    return a;
        case UnOp::Invert: return static_cast<double>(~to_integer(sym, a));
        case UnOp::Not:    return truth(a == 0.0);
    }
    throw EvalError("Unsupported unary operator");
}

} // namespace rollexpr
