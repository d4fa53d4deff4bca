#include "digitloom/constant_spec.hpp"

namespace digitloom {

namespace {

bool constant_uses_pi(ConstantId id) {
    return id == ConstantId::Pi || id == ConstantId::Tau || id == ConstantId::Zeta2 ||
           id == ConstantId::Catalan;
}

bool expression_uses_pi(const Expression& expr) {
    if (const ConstantNode* constant = std::get_if<ConstantNode>(&expr.node)) {
        return constant_uses_pi(constant->id);
    }
    if (const BinaryNode* binary = std::get_if<BinaryNode>(&expr.node)) {
        return expression_uses_pi(*binary->left) || expression_uses_pi(*binary->right);
    }
    return false;
}

} // namespace

ConstantSpec::ConstantSpec(ConstantId id, ExpressionPtr expression, Base base, uint64_t digits)
    : id_(id), expression_(std::move(expression)), base_(base), digits_(digits) {}

ConstantSpec ConstantSpec::constant(ConstantId id, Base base, uint64_t digits) {
    return ConstantSpec(id, nullptr, base, digits);
}

ConstantSpec ConstantSpec::expression(const std::string& text, Base base, uint64_t digits) {
    ExpressionPtr tree = parse_expression(text);
    if (const ConstantNode* constant = std::get_if<ConstantNode>(&tree->node)) {
        return ConstantSpec(constant->id, nullptr, base, digits);
    }
    return ConstantSpec(ConstantId::Pi, std::move(tree), base, digits);
}

ConstantSpec ConstantSpec::parse(const std::string& text, int base, uint64_t digits) {
    Base b = to_base(base);
    ConstantId id;
    if (find_constant(text, id)) {
        return constant(id, b, digits);
    }
    return expression(text, b, digits);
}

bool ConstantSpec::uses_pi() const {
    return is_expression() ? expression_uses_pi(*expression_) : constant_uses_pi(id_);
}

bool ConstantSpec::is_rational() const {
    return is_expression() && digitloom::is_rational(*expression_);
}

std::string ConstantSpec::descriptor() const {
    if (is_expression()) {
        return "expr:" + to_string(*expression_);
    }
    return constant_name(id_);
}

ConstantSpec ConstantSpec::with_digits(uint64_t digits) const {
    return ConstantSpec(id_, expression_, base_, digits);
}

} // namespace digitloom
