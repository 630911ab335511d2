#pragma once
#include <string_view>
#include <vector>
#include "rpn2tex/ast.hpp"
#include "rpn2tex/error.hpp"
#include "rpn2tex/token.hpp"

namespace rpn2tex {

// Reduce an RPN token stream (ending in Eof) to a single tree.
// Throws ParseError when an operator lacks two operands, when the input
// is empty, or when more than one value is left at Eof.
Expr parse(const std::vector<Token>& tokens);

// tokenize + parse. LexError propagates unchanged.
Expr parse(std::string_view text);

} // namespace rpn2tex
