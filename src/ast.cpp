#include "rpn2tex/ast.hpp"

#include <utility>
#include <vector>

namespace rpn2tex {

// Children are detached onto a local stack before each node goes away, so
// no destructor call ever sees more than one level of the tree.
Expr::~Expr() {
    auto* b = std::get_if<BinaryOp>(&node);
    if (!b) return;

    std::vector<ExprPtr> pending;
    if (b->left) pending.push_back(std::move(b->left));
    if (b->right) pending.push_back(std::move(b->right));

    while (!pending.empty()) {
        ExprPtr e = std::move(pending.back());
        pending.pop_back();
        if (auto* child = std::get_if<BinaryOp>(&e->node)) {
            if (child->left) pending.push_back(std::move(child->left));
            if (child->right) pending.push_back(std::move(child->right));
        }
    }
}

int Expr::line() const {
    return std::visit([](const auto& n) { return n.line; }, node);
}

int Expr::column() const {
    return std::visit([](const auto& n) { return n.column; }, node);
}

Expr make_number(std::string value, int line, int column) {
    return Expr{Number{std::move(value), line, column}};
}

Expr make_binary(char op, Expr left, Expr right, int line, int column) {
    BinaryOp b;
    b.op = op;
    b.left = std::make_unique<Expr>(std::move(left));
    b.right = std::make_unique<Expr>(std::move(right));
    b.line = line;
    b.column = column;
    return Expr{std::move(b)};
}

static std::string pos(int line, int column) {
    return std::to_string(line) + ":" + std::to_string(column);
}

std::string to_string(const Expr& e) {
    // A subtree still to print, or literal text when node is null.
    struct DumpItem {
        const Expr* node;
        std::string text;
    };

    std::string out;
    std::vector<DumpItem> work;
    work.push_back({&e, {}});

    while (!work.empty()) {
        DumpItem item = std::move(work.back());
        work.pop_back();

        if (!item.node) {
            out += item.text;
            continue;
        }
        if (item.node->is_number()) {
            const Number& n = item.node->as_number();
            out += "Number('" + n.value + "', " + pos(n.line, n.column) + ")";
            continue;
        }

        const BinaryOp& b = item.node->as_binary();
        work.push_back({nullptr, ", " + pos(b.line, b.column) + ")"});
        work.push_back({b.right.get(), {}});
        work.push_back({nullptr, ", "});
        work.push_back({b.left.get(), {}});
        out += std::string("BinaryOp('") + b.op + "', ";
    }
    return out;
}

} // namespace rpn2tex
