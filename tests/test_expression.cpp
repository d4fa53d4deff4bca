#include <string>

#include <gtest/gtest.h>

#include "digitloom/compute.hpp"
#include "digitloom/constant_spec.hpp"
#include "digitloom/error.hpp"
#include "digitloom/expression.hpp"
#include "test_support.hpp"

using namespace digitloom;

class ExpressionTest : public test::DigitloomTest {
protected:
    static std::string canonical(const std::string& text) {
        return to_string(*parse_expression(text));
    }

    static size_t error_offset(const std::string& text) {
        try {
            parse_expression(text);
        } catch (const InvalidExpression& e) {
            return e.offset();
        }
        ADD_FAILURE() << "'" << text << "' parsed";
        return std::string::npos;
    }

    DigitSequence compute(const std::string& text, uint64_t digits, Base base = Base::Decimal) {
        DigitComputer computer(config_);
        return computer.compute_with_retry(ConstantSpec::expression(text, base, digits),
                                           PiAlgorithm::BinarySplitting);
    }
};

TEST_F(ExpressionTest, Precedence) {
    EXPECT_EQ(canonical("1 + 2 * 3"), "(1 + (2 * 3))");
    EXPECT_EQ(canonical("pi^2/6"), "((pi ^ 2) / 6)");
    EXPECT_EQ(canonical("-pi"), "(0 - pi)");
    EXPECT_EQ(canonical("(e - 1) * (e + 1)"), "((e - 1) * (e + 1))");
    EXPECT_EQ(canonical("2 ^ -3"), "(2 ^ -3)");
    EXPECT_EQ(canonical("0.25"), "1/4");
}

TEST_F(ExpressionTest, NamesAndAliases) {
    EXPECT_EQ(canonical("PI"), "pi");
    EXPECT_EQ(canonical("\xcf\x80 * 2"), "(pi * 2)");
    EXPECT_EQ(canonical("golden_ratio"), "phi");
    EXPECT_EQ(canonical("apery + log2"), "(zeta3 + ln2)");
}

TEST_F(ExpressionTest, RationalValues) {
    ExpressionPtr expr = parse_expression("1 + 2 * 3");
    EXPECT_TRUE(is_rational(*expr));
    Rational value = rational_value(*expr);
    value.canonicalize();
    EXPECT_EQ(value.numerator(), BigInt(7));

    Rational half = rational_value(*parse_expression("2^-1"));
    half.canonicalize();
    EXPECT_EQ(half.numerator(), BigInt(1));
    EXPECT_EQ(half.denominator(), BigInt(2));

    EXPECT_FALSE(is_rational(*parse_expression("pi + 1")));
    EXPECT_THROW(rational_value(*parse_expression("pi + 1")), InvalidExpression);
}

TEST_F(ExpressionTest, ErrorOffsets) {
    EXPECT_EQ(error_offset(""), 0u);
    EXPECT_EQ(error_offset("pi + "), 5u);
    EXPECT_EQ(error_offset("pi + foo"), 5u);
    EXPECT_EQ(error_offset("1/0"), 2u);
    EXPECT_EQ(error_offset("pi^1.5"), 4u);
    EXPECT_EQ(error_offset("(pi"), 3u);
    EXPECT_EQ(error_offset("pi pi"), 3u);
    EXPECT_EQ(error_offset("1..2"), 0u);
    EXPECT_EQ(error_offset("0^-1"), 2u);
    EXPECT_EQ(error_offset("pi ^ 99999"), 5u);
}

TEST_F(ExpressionTest, NestingIsBounded) {
    std::string deep(200, '(');
    deep += "1";
    deep += std::string(200, ')');
    EXPECT_THROW(parse_expression(deep), InvalidExpression);
}

TEST_F(ExpressionTest, EvaluatesAgainstKnownConstants) {
    EXPECT_EQ(compute("pi^2/6", 30).fractional_string(), test::ZETA2_DIGITS);
    EXPECT_EQ(compute("2*pi", 38).to_string(), std::string("6.") + test::TAU_DIGITS);
    EXPECT_EQ(compute("e - 2", 50).to_string(), "0." + std::string(test::E_DIGITS).substr(0, 50));
    EXPECT_EQ(compute("(1 + sqrt2) - 1", 40).fractional_string(), std::string(test::SQRT2_DIGITS).substr(0, 40));
}

TEST_F(ExpressionTest, NegativeAndLargeValues) {
    DigitSequence negative = compute("-pi", 10);
    EXPECT_EQ(negative.to_string(), "-3.1415926535");

    DigitSequence large = compute("pi * 1000000", 10);
    EXPECT_EQ(large.to_string(), "3141592.6535897932");
}

TEST_F(ExpressionTest, RationalExpressionsAreExact) {
    EXPECT_EQ(compute("1/3", 12).to_string(), "0.333333333333");
    EXPECT_EQ(compute("7/2", 4).to_string(), "3.5000");
    EXPECT_EQ(compute("1/4", 3, Base::Hexadecimal).to_string(), "0.400");
}

TEST_F(ExpressionTest, CancellationToZeroExhaustsPrecision) {
    EXPECT_THROW(compute("pi - pi", 10), PrecisionExhausted);
}
