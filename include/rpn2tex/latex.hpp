#pragma once
#include <string>
#include <string_view>
#include "rpn2tex/ast.hpp"

namespace rpn2tex {

/// + and - bind at 1, * and / at 2. Throws std::invalid_argument otherwise.
int precedence(char op);

/// "+", "-", "\times", "\div". Throws std::invalid_argument otherwise.
std::string_view latex_symbol(char op);

/// Whether child must be wrapped in "( ... )" under a parent operator of
/// the given precedence. Lower-precedence children always are; at equal
/// precedence only a right-hand '-' or '/' child is.
bool needs_parens(const Expr& child, int parent_precedence, bool is_right);

/// Render as inline math: "$" + infix + "$", operators padded by one
/// space, groups as "( inner )", number text verbatim.
std::string render(const Expr& ast);

/// tokenize + parse + render. Throws LexError / ParseError.
std::string convert(std::string_view text);

} // namespace rpn2tex
