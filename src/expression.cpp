#include "digitloom/expression.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "digitloom/error.hpp"

namespace digitloom {

namespace {

const int MAX_DEPTH = 64;
const size_t MAX_NODES = 4096;
const long MAX_EXPONENT = 4096;

ExpressionPtr make_literal(Rational value) {
    return std::make_shared<const Expression>(Expression{LiteralNode{std::move(value)}});
}

ExpressionPtr make_binary(BinaryOperator op, ExpressionPtr left, ExpressionPtr right) {
    return std::make_shared<const Expression>(
        Expression{BinaryNode{op, std::move(left), std::move(right)}});
}

bool is_identifier_char(unsigned char c, bool first) {
    if (c >= 0x80) return true;  //  UTF-8 names such as π
    if (std::isalpha(c) || c == '_') return true;
    return !first && std::isdigit(c);
}

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    ExpressionPtr parse() {
        skip_space();
        if (pos_ >= text_.size()) fail("empty expression");
        ExpressionPtr out = parse_expr(0);
        skip_space();
        if (pos_ < text_.size()) fail(std::string("unexpected '") + text_[pos_] + "'");
        return out;
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw InvalidExpression(message, pos_);
    }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) pos_++;
    }

    bool accept(char c) {
        skip_space();
        if (pos_ < text_.size() && text_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    void count_node() {
        if (++nodes_ > MAX_NODES) fail("expression too large");
    }

    ExpressionPtr parse_expr(int depth) {
        ExpressionPtr left = parse_term(depth);
        for (;;) {
            if (accept('+')) {
                count_node();
                left = make_binary(BinaryOperator::Add, left, parse_term(depth));
            } else if (accept('-')) {
                count_node();
                left = make_binary(BinaryOperator::Subtract, left, parse_term(depth));
            } else {
                return left;
            }
        }
    }

    ExpressionPtr parse_term(int depth) {
        ExpressionPtr left = parse_unary(depth);
        for (;;) {
            if (accept('*')) {
                count_node();
                left = make_binary(BinaryOperator::Multiply, left, parse_unary(depth));
            } else if (accept('/')) {
                count_node();
                size_t at = pos_;
                ExpressionPtr right = parse_unary(depth);
                if (is_rational(*right) && rational_value(*right).is_zero()) {
                    throw InvalidExpression("division by zero", at);
                }
                left = make_binary(BinaryOperator::Divide, left, right);
            } else {
                return left;
            }
        }
    }

    ExpressionPtr parse_unary(int depth) {
        if (depth > MAX_DEPTH) fail("expression nested too deeply");
        if (accept('-')) {
            count_node();
            return make_binary(BinaryOperator::Subtract, make_literal(Rational(0)), parse_unary(depth + 1));
        }
        return parse_power(depth);
    }

    ExpressionPtr parse_power(int depth) {
        ExpressionPtr base = parse_primary(depth);
        if (!accept('^')) return base;

        count_node();
        skip_space();
        size_t at = pos_;
        bool negative = accept('-');
        skip_space();
        size_t start = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) pos_++;
        if (start == pos_) fail("exponent must be an integer");
        if (pos_ < text_.size() && text_[pos_] == '.') fail("exponent must be an integer");

        std::string digits = text_.substr(start, pos_ - start);
        if (digits.size() > 6 || std::stol(digits) > MAX_EXPONENT) {
            throw InvalidExpression("exponent too large", at);
        }
        long exponent = std::stol(digits) * (negative ? -1 : 1);

        if (exponent < 0 && is_rational(*base) && rational_value(*base).is_zero()) {
            throw InvalidExpression("zero raised to a negative power", at);
        }
        return make_binary(BinaryOperator::Power, base, make_literal(Rational(exponent)));
    }

    ExpressionPtr parse_primary(int depth) {
        skip_space();
        if (pos_ >= text_.size()) fail("unexpected end of expression");

        count_node();
        unsigned char c = static_cast<unsigned char>(text_[pos_]);

        if (c == '(') {
            pos_++;
            ExpressionPtr inner = parse_expr(depth + 1);
            if (!accept(')')) fail("expected ')'");
            return inner;
        }

        if (std::isdigit(c) || c == '.') {
            size_t start = pos_;
            while (pos_ < text_.size() &&
                   (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
                pos_++;
            }
            std::string number = text_.substr(start, pos_ - start);
            if (std::count(number.begin(), number.end(), '.') > 1 || number.front() == '.') {
                throw InvalidExpression("malformed number '" + number + "'", start);
            }
            try {
                return make_literal(Rational::parse_decimal(number));
            } catch (const std::invalid_argument&) {
                throw InvalidExpression("malformed number '" + number + "'", start);
            }
        }

        if (is_identifier_char(c, true)) {
            size_t start = pos_;
            while (pos_ < text_.size() &&
                   is_identifier_char(static_cast<unsigned char>(text_[pos_]), pos_ == start)) {
                pos_++;
            }
            std::string name = text_.substr(start, pos_ - start);
            ConstantId id;
            if (!find_constant(name, id)) {
                throw InvalidExpression("unknown constant '" + name + "'", start);
            }
            return std::make_shared<const Expression>(Expression{ConstantNode{id}});
        }

        fail(std::string("unexpected '") + text_[pos_] + "'");
    }

    const std::string& text_;
    size_t pos_ = 0;
    size_t nodes_ = 0;
};

const char* operator_symbol(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add:      return "+";
        case BinaryOperator::Subtract: return "-";
        case BinaryOperator::Multiply: return "*";
        case BinaryOperator::Divide:   return "/";
        case BinaryOperator::Power:    return "^";
    }
    return "?";
}

long exponent_of(const BinaryNode& node) {
    const LiteralNode& literal = std::get<LiteralNode>(node.right->node);
    return mpz_get_si(literal.value.numerator().get());
}

} // namespace

ExpressionPtr parse_expression(const std::string& text) {
    Parser parser(text);
    return parser.parse();
}

std::string to_string(const Expression& expr) {
    if (const ConstantNode* constant = std::get_if<ConstantNode>(&expr.node)) {
        return constant_name(constant->id);
    }
    if (const LiteralNode* literal = std::get_if<LiteralNode>(&expr.node)) {
        Rational value = literal->value;
        value.canonicalize();
        if (mpz_cmp_ui(value.denominator().get(), 1) == 0) {
            return value.numerator().to_string();
        }
        return value.numerator().to_string() + "/" + value.denominator().to_string();
    }
    const BinaryNode& binary = std::get<BinaryNode>(expr.node);
    return "(" + to_string(*binary.left) + " " + operator_symbol(binary.op) + " " +
           to_string(*binary.right) + ")";
}

bool is_rational(const Expression& expr) {
    if (std::holds_alternative<ConstantNode>(expr.node)) return false;
    if (std::holds_alternative<LiteralNode>(expr.node)) return true;
    const BinaryNode& binary = std::get<BinaryNode>(expr.node);
    return is_rational(*binary.left) && is_rational(*binary.right);
}

Rational rational_value(const Expression& expr) {
    if (const LiteralNode* literal = std::get_if<LiteralNode>(&expr.node)) {
        return literal->value;
    }
    if (std::holds_alternative<ConstantNode>(expr.node)) {
        throw InvalidExpression("expression is not rational", 0);
    }

    const BinaryNode& binary = std::get<BinaryNode>(expr.node);
    try {
        if (binary.op == BinaryOperator::Power) {
            return rational_value(*binary.left).pow(exponent_of(binary));
        }
        Rational left = rational_value(*binary.left);
        Rational right = rational_value(*binary.right);
        switch (binary.op) {
            case BinaryOperator::Add:      return left + right;
            case BinaryOperator::Subtract: return left - right;
            case BinaryOperator::Multiply: return left * right;
            case BinaryOperator::Divide:   return left / right;
            case BinaryOperator::Power:    break;
        }
    } catch (const std::domain_error& e) {
        throw InvalidExpression(e.what(), 0);
    }
    throw InvalidExpression("unhandled operator", 0);
}

////////////////////////////////////////////////////////////////////////////////
//  Evaluation

ExpressionEvaluator::ExpressionEvaluator(ConstantEvaluator& constants) : constants_(constants) {}

BigFloat ExpressionEvaluator::evaluate(const Expression& expr, mpfr_prec_t bits) {
    if (const ConstantNode* constant = std::get_if<ConstantNode>(&expr.node)) {
        return constants_.evaluate(constant->id, bits + 2);
    }
    if (is_rational(expr)) {
        Rational value = rational_value(expr);
        BigFloat out(bits + 2);
        value.to_float(out);
        return out;
    }
    return evaluate_binary(std::get<BinaryNode>(expr.node), bits);
}

BigFloat ExpressionEvaluator::evaluate_binary(const BinaryNode& node, mpfr_prec_t bits) {
    switch (node.op) {
        case BinaryOperator::Add:
        case BinaryOperator::Subtract:
            return evaluate_sum(node, bits);

        case BinaryOperator::Multiply:
        case BinaryOperator::Divide: {
            BigFloat a = evaluate(*node.left, bits + 4);
            BigFloat b = evaluate(*node.right, bits + 4);
            BigFloat out(bits + 4);
            if (node.op == BinaryOperator::Multiply) {
                mpfr_mul(out.get(), a.get(), b.get(), MPFR_RNDN);
            } else {
                if (b.is_zero()) throw InvalidExpression("division by zero", 0);
                mpfr_div(out.get(), a.get(), b.get(), MPFR_RNDN);
            }
            return out;
        }

        case BinaryOperator::Power: {
            long exponent = exponent_of(node);
            mpfr_prec_t extra = 4 + static_cast<mpfr_prec_t>(std::ceil(std::log2(std::labs(exponent) + 1.0)));
            BigFloat a = evaluate(*node.left, bits + extra);
            if (a.is_zero() && exponent < 0) {
                throw InvalidExpression("zero raised to a negative power", 0);
            }
            BigFloat out(bits + 4);
            mpfr_pow_si(out.get(), a.get(), exponent, MPFR_RNDN);
            return out;
        }
    }
    throw InvalidExpression("unhandled operator", 0);
}

BigFloat ExpressionEvaluator::evaluate_sum(const BinaryNode& node, mpfr_prec_t bits) {
    mpfr_prec_t extra = 4;

    for (int attempt = 0; attempt < 4; attempt++) {
        BigFloat a = evaluate(*node.left, bits + extra);
        BigFloat b = evaluate(*node.right, bits + extra);
        BigFloat out(bits + extra + 2);
        if (node.op == BinaryOperator::Add) {
            mpfr_add(out.get(), a.get(), b.get(), MPFR_RNDN);
        } else {
            mpfr_sub(out.get(), a.get(), b.get(), MPFR_RNDN);
        }

        if (out.is_zero()) {
            extra = extra * 2 + 64;
            continue;
        }

        //  Leading bits lost to cancellation.
        long top = out.exponent();
        if (!a.is_zero()) top = std::max(top, a.exponent());
        if (!b.is_zero()) top = std::max(top, b.exponent());
        mpfr_prec_t loss = static_cast<mpfr_prec_t>(top - out.exponent());

        if (loss + 4 <= extra) {
            return out;
        }
        extra = loss + 8;
    }

    throw PrecisionExhausted("expression cancels to zero or below the working precision",
                             "(" + to_string(*node.left) + ") " + (node.op == BinaryOperator::Add ? "+" : "-") +
                                 " (" + to_string(*node.right) + ")");
}

} // namespace digitloom
