#pragma once
#include <string_view>
#include <vector>
#include "rollexpr/errors.hpp"
#include "rollexpr/token.hpp"

namespace rollexpr {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    bool at(std::size_t k, char c) const { return i_ + k < s_.size() && s_[i_ + k] == c; }

    Token make(TokKind kind, std::size_t start, std::size_t len);
    Token lex_number_or_dice(std::size_t start);
    Token lex_word(std::size_t start);
    bool dice_follows() const;
    Token finish_dice(std::size_t start, std::string count);
    std::string read_digits();
    std::string read_signed_int();

    std::string_view s_;
    std::size_t i_{0};
};

/// Split text into tokens, always terminated by an End token.
/// Throws LexError on a character that starts no token.
std::vector<Token> tokenize(std::string_view text);

} // namespace rollexpr
