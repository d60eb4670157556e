#pragma once
#include <cstddef>
#include <string>

namespace rollexpr {

enum class TokKind {
    Number,
    Ident,
    Dice,

    Plus, Minus, Star, Slash, SlashSlash, Percent, StarStar,
    Amp, Pipe, Caret, Tilde, Shl, Shr,
    Lt, Le, Gt, Ge, EqEq, NotEq,
    And, Or, Not,

    LParen, RParen,
    Comma,
    End,
};

enum class DiceKind {
    Standard, // XdY
    Ranged,   // XdY{lo,hi}, Xd{lo,hi}
    Pool,     // XwodY
};

// Raw digit groups of a dice token; empty when omitted in the source.
// Converted and validated by the dice-term recognizer, not the lexer.
struct DiceGroups {
    DiceKind kind{DiceKind::Standard};
    std::string count{};
    std::string sides{}; // sides for d, threshold for wod
    std::string lo{};    // signed, ranged only
    std::string hi{};
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};     // source text of the token
    double number{0.0};     // Number
    std::size_t pos{0};     // byte offset into the source
    DiceGroups dice{};      // Dice
};

/// Human-readable name of a token kind, used in syntax errors.
const char* kind_name(TokKind k);

/// Token description for error messages: its source text, or "end of input".
std::string describe(const Token& t);

} // namespace rollexpr
