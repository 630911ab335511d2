#include "rpn2tex/parser.hpp"
#include "rpn2tex/lexer.hpp"
#include "rpn2tex/log.hpp"
#include <utility>

namespace rpn2tex {

static char op_char(TokKind k) {
    switch (k) {
        case TokKind::Plus:  return '+';
        case TokKind::Minus: return '-';
        case TokKind::Mult:  return '*';
        case TokKind::Div:   return '/';
        default:             break;
    }
    throw std::invalid_argument(std::string("Not an operator token: ") + to_string(k));
}

Expr parse(const std::vector<Token>& tokens) {
    std::vector<Expr> st;
    st.reserve(tokens.size());

    auto pop = [&]() -> Expr {
        Expr e = std::move(st.back());
        st.pop_back();
        return e;
    };

    // Position for end-of-input errors; a well-formed stream ends in Eof,
    // a bare vector falls back to the last token seen.
    int end_line = 1;
    int end_column = 1;

    for (const auto& t : tokens) {
        end_line = t.line;
        end_column = t.column;
        if (t.kind == TokKind::Eof) break;

        if (t.kind == TokKind::Number) {
            st.push_back(make_number(t.text, t.line, t.column));
            continue;
        }

        const char op = op_char(t.kind);
        if (st.size() < 2) {
            throw ParseError(std::string("Operator '") + op + "' requires two operands", t.line, t.column);
        }
        Expr right = pop();
        Expr left = pop();
        RPN2TEX_LOG_TRACE("parser", "reduce '" << op << "' at " << t.line << ":" << t.column
                                                << ", depth " << st.size() + 1);
        st.push_back(make_binary(op, std::move(left), std::move(right), t.line, t.column));
    }

    if (st.empty()) throw ParseError("Empty expression", end_line, end_column);
    if (st.size() > 1) {
        throw ParseError("Invalid RPN: " + std::to_string(st.size()) +
                             " values remain on stack (missing operators?)",
                         end_line, end_column);
    }

    Expr root = pop();
    RPN2TEX_LOG_DEBUG("parser", to_string(root));
    return root;
}

Expr parse(std::string_view text) {
    return parse(tokenize(text));
}

} // namespace rpn2tex
