#pragma once
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace rpn2tex {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

// Numeric literal, kept as the exact source text ("3.14", "-2").
struct Number {
    std::string value;
    int line{1};
    int column{1};
};

// op is one of + - * /. Position is the operator token's.
struct BinaryOp {
    char op{'+'};
    ExprPtr left;
    ExprPtr right;
    int line{1};
    int column{1};
};

/// Immutable expression tree. Children are exclusively owned, so a tree
/// can be moved but not copied. Destruction is iterative, so arbitrarily
/// deep trees are safe to drop.
struct Expr {
    std::variant<Number, BinaryOp> node;

    Expr(Number n) : node(std::move(n)) {}
    Expr(BinaryOp b) : node(std::move(b)) {}
    Expr(Expr&&) noexcept = default;
    Expr& operator=(Expr&&) noexcept = default;
    ~Expr();

    bool is_number() const { return std::holds_alternative<Number>(node); }
    const Number& as_number() const { return std::get<Number>(node); }
    const BinaryOp& as_binary() const { return std::get<BinaryOp>(node); }

    int line() const;
    int column() const;
};

Expr make_number(std::string value, int line, int column);
Expr make_binary(char op, Expr left, Expr right, int line, int column);

// Number('5', 1:1) / BinaryOp('+', <left>, <right>, 1:5)
std::string to_string(const Expr& e);

} // namespace rpn2tex
