#include "rollexpr/lexer.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace rollexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

const char* kind_name(TokKind k) {
    switch (k) {
        case TokKind::Number:     return "number";
        case TokKind::Ident:      return "identifier";
        case TokKind::Dice:       return "dice term";
        case TokKind::Plus:       return "'+'";
        case TokKind::Minus:      return "'-'";
        case TokKind::Star:       return "'*'";
        case TokKind::Slash:      return "'/'";
        case TokKind::SlashSlash: return "'//'";
        case TokKind::Percent:    return "'%'";
        case TokKind::StarStar:   return "'**'";
        case TokKind::Amp:        return "'&'";
        case TokKind::Pipe:       return "'|'";
        case TokKind::Caret:      return "'^'";
        case TokKind::Tilde:      return "'~'";
        case TokKind::Shl:        return "'<<'";
        case TokKind::Shr:        return "'>>'";
        case TokKind::Lt:         return "'<'";
        case TokKind::Le:         return "'<='";
        case TokKind::Gt:         return "'>'";
        case TokKind::Ge:         return "'>='";
        case TokKind::EqEq:       return "'=='";
        case TokKind::NotEq:      return "'!='";
        case TokKind::And:        return "'and'";
        case TokKind::Or:         return "'or'";
        case TokKind::Not:        return "'not'";
        case TokKind::LParen:     return "'('";
        case TokKind::RParen:     return "')'";
        case TokKind::Comma:      return "','";
        case TokKind::End:        return "end of input";
    }
    return "token";
}

std::string describe(const Token& t) {
    if (t.kind == TokKind::End) return "end of input";
    return "'" + t.text + "'";
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::make(TokKind kind, std::size_t start, std::size_t len) {
    i_ = start + len;
    Token t{kind};
    t.text = std::string(s_.substr(start, len));
    t.pos = start;
    return t;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) {
        Token t{TokKind::End};
        t.pos = s_.size();
        return t;
    }

    const std::size_t start = i_;
    const char c = s_[i_];

    // two-character operators first
    switch (c) {
        case '*': return at(1, '*') ? make(TokKind::StarStar, start, 2) : make(TokKind::Star, start, 1);
        case '/': return at(1, '/') ? make(TokKind::SlashSlash, start, 2) : make(TokKind::Slash, start, 1);
        case '<':
            if (at(1, '<')) return make(TokKind::Shl, start, 2);
            if (at(1, '=')) return make(TokKind::Le, start, 2);
            return make(TokKind::Lt, start, 1);
        case '>':
            if (at(1, '>')) return make(TokKind::Shr, start, 2);
            if (at(1, '=')) return make(TokKind::Ge, start, 2);
            return make(TokKind::Gt, start, 1);
        case '=':
            if (at(1, '=')) return make(TokKind::EqEq, start, 2);
            throw LexError(start, c);
        case '!':
            if (at(1, '=')) return make(TokKind::NotEq, start, 2);
            throw LexError(start, c);
        case '+': return make(TokKind::Plus, start, 1);
        case '-': return make(TokKind::Minus, start, 1);
        case '%': return make(TokKind::Percent, start, 1);
        case '&': return make(TokKind::Amp, start, 1);
        case '|': return make(TokKind::Pipe, start, 1);
        case '^': return make(TokKind::Caret, start, 1);
        case '~': return make(TokKind::Tilde, start, 1);
        case '(': return make(TokKind::LParen, start, 1);
        case ')': return make(TokKind::RParen, start, 1);
        case ',': return make(TokKind::Comma, start, 1);
        default: break;
    }

    if (is_digit(c) || (c == '.' && i_ + 1 < s_.size() && is_digit(s_[i_ + 1]))) {
        return lex_number_or_dice(start);
    }

    if (is_ident_start(c)) return lex_word(start);

    throw LexError(start, c);
}

std::string Lexer::read_digits() {
    std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;
    return std::string(s_.substr(start, i_ - start));
}

std::string Lexer::read_signed_int() {
    std::string sign;
    if (at(0, '-') || at(0, '+')) {
        sign = std::string(1, s_[i_]);
        ++i_;
    }
    std::string digits = read_digits();
    if (digits.empty()) return "";
    return sign + digits;
}

// At i_: does a 'd' or "wod" dice marker start here?
bool Lexer::dice_follows() const {
    if (at(0, 'd')) {
        if (i_ + 1 >= s_.size()) return true;
        char n = s_[i_ + 1];
        return is_digit(n) || n == '{' || !is_ident_char(n);
    }
    if (at(0, 'w') && at(1, 'o') && at(2, 'd')) {
        if (i_ + 3 >= s_.size()) return true;
        char n = s_[i_ + 3];
        return is_digit(n) || !is_ident_char(n);
    }
    return false;
}

Token Lexer::lex_number_or_dice(std::size_t start) {
    std::string count = read_digits();
    if (!count.empty() && dice_follows()) return finish_dice(start, std::move(count));

    // plain number: digits [. digits]
    if (at(0, '.')) {
        ++i_;
        read_digits();
    }
    std::string text(s_.substr(start, i_ - start));
    double v = std::strtod(text.c_str(), nullptr);
    if (!std::isfinite(v)) throw SyntaxError(start, "a finite number", "'" + text + "'");

    Token t{TokKind::Number};
    t.text = std::move(text);
    t.number = v;
    t.pos = start;
    return t;
}

Token Lexer::lex_word(std::size_t start) {
    // countless dice ("d20", "d{1,4}", "wod8") need a digit or brace after a bare 'd'
    if (at(0, 'd') && i_ + 1 < s_.size() && (is_digit(s_[i_ + 1]) || s_[i_ + 1] == '{')) {
        return finish_dice(start, "");
    }
    if (at(0, 'w') && at(1, 'o') && at(2, 'd') && dice_follows()) {
        return finish_dice(start, "");
    }

    ++i_;
    while (!is_end() && is_ident_char(s_[i_])) ++i_;
    Token t{TokKind::Ident};
    t.text = std::string(s_.substr(start, i_ - start));
    t.pos = start;

    if (t.text == "and") t.kind = TokKind::And;
    else if (t.text == "or") t.kind = TokKind::Or;
    else if (t.text == "not") t.kind = TokKind::Not;
    return t;
}

Token Lexer::finish_dice(std::size_t start, std::string count) {
    Token t{TokKind::Dice};
    t.pos = start;
    t.dice.count = std::move(count);

    if (at(0, 'w')) {
        i_ += 3; // "wod"
        t.dice.kind = DiceKind::Pool;
        t.dice.sides = read_digits();
    } else {
        ++i_; // 'd'
        t.dice.kind = DiceKind::Standard;
        t.dice.sides = read_digits();

        if (at(0, '{')) {
            ++i_;
            t.dice.kind = DiceKind::Ranged;
            auto bound = [&](char terminator, const char* what) {
                skip_ws();
                std::size_t p = i_;
                std::string v = read_signed_int();
                if (v.empty()) {
                    std::string found = is_end() ? "end of input" : "'" + std::string(1, s_[p]) + "'";
                    throw SyntaxError(p, what, found);
                }
                skip_ws();
                if (!at(0, terminator)) {
                    std::string found = is_end() ? "end of input" : "'" + std::string(1, s_[i_]) + "'";
                    throw SyntaxError(i_, std::string("'") + terminator + "'", found);
                }
                ++i_;
                return v;
            };
            t.dice.lo = bound(',', "lower range bound");
            t.dice.hi = bound('}', "upper range bound");
        }
    }

    t.text = std::string(s_.substr(start, i_ - start));
    return t;
}

std::vector<Token> tokenize(std::string_view text) {
    Lexer lex(text);
    std::vector<Token> out;
    for (;;) {
        out.push_back(lex.next());
        if (out.back().kind == TokKind::End) break;
    }
    return out;
}

} // namespace rollexpr
