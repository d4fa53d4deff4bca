#pragma once

#include <cstdint>
#include <string>

#include "digitloom/arith.hpp"
#include "digitloom/constants.hpp"
#include "digitloom/expression.hpp"

namespace digitloom {

// What to compute: a catalogue constant or an expression over them, the
// output base and the number of fractional digits (or UNBOUNDED).
// Immutable once built.
class ConstantSpec {
public:
    static constexpr uint64_t UNBOUNDED = UINT64_MAX;

    static ConstantSpec constant(ConstantId id, Base base, uint64_t digits);
    // Throws InvalidExpression. An expression that is a single constant
    // name becomes that constant.
    static ConstantSpec expression(const std::string& text, Base base, uint64_t digits);
    // A constant name if one matches, an expression otherwise. Throws
    // UnsupportedBase for bases other than 10 and 16.
    static ConstantSpec parse(const std::string& text, int base, uint64_t digits);

    bool is_expression() const { return expression_ != nullptr; }
    // Only meaningful when !is_expression().
    ConstantId id() const { return id_; }
    const ExpressionPtr& expression_tree() const { return expression_; }

    Base base() const { return base_; }
    uint64_t digits() const { return digits_; }
    bool unbounded() const { return digits_ == UNBOUNDED; }

    bool is_pi() const { return !is_expression() && id_ == ConstantId::Pi; }
    // True when evaluation needs pi (tau, zeta2, catalan, expressions using them).
    bool uses_pi() const;
    // True for constant-free expressions.
    bool is_rational() const;

    // "pi", "expr:(pi ^ 2)"; recorded in container headers.
    std::string descriptor() const;

    // Same constant and base with a different digit count.
    ConstantSpec with_digits(uint64_t digits) const;

private:
    ConstantSpec(ConstantId id, ExpressionPtr expression, Base base, uint64_t digits);

    ConstantId id_;
    ExpressionPtr expression_;
    Base base_;
    uint64_t digits_;
};

} // namespace digitloom
