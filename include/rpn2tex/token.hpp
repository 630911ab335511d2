#pragma once
#include <string>

namespace rpn2tex {

enum class TokKind {
    Number,
    Plus, Minus, Mult, Div,
    Eof,
};

struct Token {
    TokKind kind{TokKind::Eof};
    std::string text{}; // exact source text; empty for Eof
    int line{1};        // 1-based position of the first character
    int column{1};
};

inline bool is_operator(TokKind k) {
    return k == TokKind::Plus || k == TokKind::Minus || k == TokKind::Mult || k == TokKind::Div;
}

// "NUMBER", "PLUS", ... for logs and test failure output
const char* to_string(TokKind k);

// Token(NUMBER, '3.14', 1:1)
std::string to_string(const Token& t);

} // namespace rpn2tex
