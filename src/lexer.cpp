#include "rpn2tex/lexer.hpp"
#include "rpn2tex/log.hpp"
#include <cctype>
#include <utility>

namespace rpn2tex {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Byte length of the UTF-8 sequence starting at i, so error messages quote
// whole characters. Malformed or truncated sequences count what is present.
std::size_t Lexer::char_width(std::size_t i) const {
    const auto lead = static_cast<unsigned char>(s_[i]);
    std::size_t n = 1;
    if (lead >= 0xC0 && lead < 0xE0) n = 2;
    else if (lead >= 0xE0 && lead < 0xF0) n = 3;
    else if (lead >= 0xF0 && lead < 0xF8) n = 4;

    std::size_t len = 1;
    while (len < n && i + len < s_.size() &&
           (static_cast<unsigned char>(s_[i + len]) & 0xC0) == 0x80)
        ++len;
    return len;
}

void Lexer::advance() {
    if (s_[i_] == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    ++i_;
}

void Lexer::skip_ws() {
    while (!is_end() && is_ws(s_[i_])) advance();
}

// Digits, then optionally '.' and more digits. The caller has already
// consumed a leading '-' when there is one; start marks where it began.
Token Lexer::scan_number(std::size_t start, int line, int column) {
    while (!is_end() && is_digit(s_[i_])) advance();
    if (peek() == '.' && i_ + 1 < s_.size() && is_digit(s_[i_ + 1])) {
        advance(); // '.'
        while (!is_end() && is_digit(s_[i_])) advance();
    }
    return {TokKind::Number, std::string(s_.substr(start, i_ - start)), line, column};
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::Eof, "", line_, column_};

    const std::size_t start = i_;
    const int line = line_;
    const int column = column_;
    const char c = s_[i_];

    switch (c) {
        case '+': advance(); return {TokKind::Plus, "+", line, column};
        case '*': advance(); return {TokKind::Mult, "*", line, column};
        case '/': advance(); return {TokKind::Div, "/", line, column};
        case '-':
            advance();
            if (is_digit(peek())) return scan_number(start, line, column);
            return {TokKind::Minus, "-", line, column};
        default: break;
    }

    if (is_digit(c)) return scan_number(start, line, column);

    throw LexError("Unexpected character '" + std::string(s_.substr(start, char_width(start))) + "'",
                   line, column);
}

std::vector<Token> tokenize(std::string_view text) {
    Lexer lex(text);
    std::vector<Token> out;
    for (;;) {
        Token t = lex.next();
        RPN2TEX_LOG_TRACE("lexer", to_string(t));
        const bool done = t.kind == TokKind::Eof;
        out.push_back(std::move(t));
        if (done) break;
    }
    return out;
}

} // namespace rpn2tex
