#include "rpn2tex/latex.hpp"
#include "rpn2tex/parser.hpp"

#include <stdexcept>
#include <vector>

namespace rpn2tex {

[[noreturn]] static void bad_operator(char op) {
    throw std::invalid_argument(std::string("Unknown operator '") + op + "'");
}

int precedence(char op) {
    switch (op) {
        case '+':
        case '-': return 1;
        case '*':
        case '/': return 2;
        default:  bad_operator(op);
    }
}

std::string_view latex_symbol(char op) {
    switch (op) {
        case '+': return "+";
        case '-': return "-";
        case '*': return "\\times";
        case '/': return "\\div";
        default:  bad_operator(op);
    }
}

bool needs_parens(const Expr& child, int parent_precedence, bool is_right) {
    if (child.is_number()) return false;

    const char op = child.as_binary().op;
    const int p = precedence(op);
    if (p < parent_precedence) return true;
    // a - (b - c) and a / (b / c) lose their meaning without the group
    return p == parent_precedence && is_right && (op == '-' || op == '/');
}

// In-order walk with an explicit stack; chains of any length render
// without deep recursion.
std::string render(const Expr& ast) {
    // A subtree to render, or literal text when node is null.
    struct RenderItem {
        const Expr* node;
        std::string_view text;
    };

    std::string out = "$";
    std::vector<RenderItem> work;
    work.push_back({&ast, {}});

    while (!work.empty()) {
        const RenderItem item = work.back();
        work.pop_back();

        if (!item.node) {
            out += item.text;
            continue;
        }
        if (item.node->is_number()) {
            out += item.node->as_number().value;
            continue;
        }

        const BinaryOp& b = item.node->as_binary();
        const int p = precedence(b.op);
        const bool wrap_left = needs_parens(*b.left, p, false);
        const bool wrap_right = needs_parens(*b.right, p, true);

        // pushed in reverse of output order
        if (wrap_right) work.push_back({nullptr, " )"});
        work.push_back({b.right.get(), {}});
        if (wrap_right) work.push_back({nullptr, "( "});
        work.push_back({nullptr, " "});
        work.push_back({nullptr, latex_symbol(b.op)});
        work.push_back({nullptr, " "});
        if (wrap_left) work.push_back({nullptr, " )"});
        work.push_back({b.left.get(), {}});
        if (wrap_left) work.push_back({nullptr, "( "});
    }

    out += '$';
    return out;
}

std::string convert(std::string_view text) {
    return render(parse(text));
}

} // namespace rpn2tex
