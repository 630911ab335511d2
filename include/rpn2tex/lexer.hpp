#pragma once
#include <string_view>
#include <vector>
#include "rpn2tex/error.hpp"
#include "rpn2tex/token.hpp"

namespace rpn2tex {

// Scans RPN text one token at a time. Legal input is digits, '.', space,
// tab, newline and the operators + - * /. A '-' immediately followed by a
// digit starts a negative number instead of a Minus token.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    // Returns Eof (repeatedly) once the input is exhausted.
    // Throws LexError at the first illegal character.
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    char peek() const { return is_end() ? '\0' : s_[i_]; }
    void advance();
    Token scan_number(std::size_t start, int line, int column);
    std::size_t char_width(std::size_t i) const;

    std::string_view s_;
    std::size_t i_{0};
    int line_{1};
    int column_{1};
};

/// Tokenize the whole input. The result always ends with exactly one Eof.
/// Throws LexError on the first unexpected character.
std::vector<Token> tokenize(std::string_view text);

} // namespace rpn2tex
