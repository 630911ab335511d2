#include "rpn2tex/token.hpp"

namespace rpn2tex {

const char* to_string(TokKind k) {
    switch (k) {
        case TokKind::Number: return "NUMBER";
        case TokKind::Plus:   return "PLUS";
        case TokKind::Minus:  return "MINUS";
        case TokKind::Mult:   return "MULT";
        case TokKind::Div:    return "DIV";
        case TokKind::Eof:    return "EOF";
    }
    return "?";
}

std::string to_string(const Token& t) {
    return std::string("Token(") + to_string(t.kind) + ", '" + t.text + "', " +
           std::to_string(t.line) + ":" + std::to_string(t.column) + ")";
}

} // namespace rpn2tex
