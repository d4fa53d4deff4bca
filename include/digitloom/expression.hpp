/**
 * Closed expression grammar over catalogue constants.
 *
 *      expr    := term   (('+' | '-') term)*
 *      term    := unary  (('*' | '/') unary)*
 *      unary   := '-' unary | power
 *      power   := primary ('^' ['-'] integer)?
 *      primary := number | constant-name | '(' expr ')'
 *
 * A parsed expression is a tree of Constant | Literal | Binary nodes.
 * Unary minus becomes (0 - x). Number literals are exact rationals.
 */

#pragma once

#include <memory>
#include <string>
#include <variant>

#include "digitloom/arith.hpp"
#include "digitloom/constants.hpp"

namespace digitloom {

enum class BinaryOperator {
    Add,
    Subtract,
    Multiply,
    Divide,
    Power
};

struct Expression;
using ExpressionPtr = std::shared_ptr<const Expression>;

struct ConstantNode {
    ConstantId id;
};

struct LiteralNode {
    Rational value;
};

struct BinaryNode {
    BinaryOperator op;
    ExpressionPtr left;
    ExpressionPtr right;
};

struct Expression {
    std::variant<ConstantNode, LiteralNode, BinaryNode> node;
};

// Throws InvalidExpression with the offending character offset.
ExpressionPtr parse_expression(const std::string& text);

// Canonical, fully parenthesized rendering.
std::string to_string(const Expression& expr);

// True when the tree holds no constants (its value is an exact rational).
bool is_rational(const Expression& expr);

// Exact value of a constant-free tree. Throws InvalidExpression otherwise.
Rational rational_value(const Expression& expr);

// Evaluates a tree to a requested relative precision, propagating
// precision per node: products and quotients widen their children by a few
// bits, sums re-evaluate their children with as many extra bits as the
// measured cancellation.
class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(ConstantEvaluator& constants);

    // Relative error below 2^-bits. Throws PrecisionExhausted when a
    // subexpression cancels to zero.
    BigFloat evaluate(const Expression& expr, mpfr_prec_t bits);

private:
    BigFloat evaluate_binary(const BinaryNode& node, mpfr_prec_t bits);
    BigFloat evaluate_sum(const BinaryNode& node, mpfr_prec_t bits);

    ConstantEvaluator& constants_;
};

} // namespace digitloom
