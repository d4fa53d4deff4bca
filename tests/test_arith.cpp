#include <stdexcept>

#include <gtest/gtest.h>

#include "digitloom/arith.hpp"
#include "digitloom/error.hpp"
#include "test_support.hpp"

using namespace digitloom;

class ArithTest : public test::DigitloomTest {};

TEST_F(ArithTest, BasesAreDecimalAndHexOnly) {
    EXPECT_EQ(to_base(10), Base::Decimal);
    EXPECT_EQ(to_base(16), Base::Hexadecimal);
    EXPECT_EQ(radix(Base::Hexadecimal), 16);

    try {
        to_base(2);
        FAIL() << "base 2 accepted";
    } catch (const UnsupportedBase& e) {
        EXPECT_EQ(e.base(), 2);
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedBase);
    }
    EXPECT_THROW(to_base(8), UnsupportedBase);
}

TEST_F(ArithTest, ModPow) {
    EXPECT_EQ(mod_pow(2, 10, 1000), 24u);
    EXPECT_EQ(mod_pow(7, 0, 13), 1u);
    EXPECT_EQ(mod_pow(7, 5, 1), 0u);
    // 2^64 = (2^64 - 1) + 1
    EXPECT_EQ(mod_pow(2, 64, UINT64_MAX), 1u);
    EXPECT_EQ(mod_pow(16, 3, 4097), 4096u);
}

TEST_F(ArithTest, BigIntArithmetic) {
    BigInt a("123456789012345678901234567890");
    BigInt b(10);
    EXPECT_EQ((a * b).to_string(), "1234567890123456789012345678900");
    EXPECT_EQ((a - a).sign(), 0);
    EXPECT_EQ(BigInt(255).to_string(16), "ff");
    EXPECT_EQ(BigInt(256).bit_length(), 9u);

    BigInt moved(std::move(a));
    EXPECT_EQ(moved.to_string(), "123456789012345678901234567890");
}

TEST_F(ArithTest, RationalParseDecimal) {
    Rational r = Rational::parse_decimal("3.1416");
    EXPECT_EQ(r.numerator(), BigInt(3927));
    EXPECT_EQ(r.denominator(), BigInt(1250));

    Rational half = Rational::parse_decimal("-0.5");
    EXPECT_EQ(half.numerator(), BigInt(-1));
    EXPECT_EQ(half.denominator(), BigInt(2));
    EXPECT_EQ(half.sign(), -1);

    EXPECT_TRUE(Rational::parse_decimal("42").is_integer());
    EXPECT_THROW(Rational::parse_decimal("1."), std::invalid_argument);
    EXPECT_THROW(Rational::parse_decimal(""), std::invalid_argument);
}

TEST_F(ArithTest, RationalArithmeticReducesOnlyOnRequest) {
    Rational sum = Rational(1, 3) + Rational(1, 6);
    EXPECT_EQ(sum.denominator(), BigInt(18));
    sum.canonicalize();
    EXPECT_EQ(sum.numerator(), BigInt(1));
    EXPECT_EQ(sum.denominator(), BigInt(2));

    Rational p = Rational(2, 3).pow(-2);
    p.canonicalize();
    EXPECT_EQ(p.numerator(), BigInt(9));
    EXPECT_EQ(p.denominator(), BigInt(4));

    Rational negative_den(BigInt(1), BigInt(-2));
    negative_den.canonicalize();
    EXPECT_EQ(negative_den.numerator(), BigInt(-1));
    EXPECT_EQ(negative_den.denominator(), BigInt(2));

    EXPECT_THROW(Rational(1, 2) / Rational(0), std::domain_error);
    EXPECT_THROW(Rational(0).pow(-1), std::domain_error);
    EXPECT_THROW(Rational(1, 0), std::domain_error);
}

TEST_F(ArithTest, RationalToFloat) {
    BigFloat f(64);
    Rational(1, 4).to_float(f);
    EXPECT_EQ(mpfr_cmp_d(f.get(), 0.25), 0);
}

TEST_F(ArithTest, BigFloatKeepsItsPrecision) {
    BigFloat a(300);
    mpfr_set_ui(a.get(), 3, MPFR_RNDN);
    BigFloat b = a;
    EXPECT_EQ(b.precision(), 300);
    EXPECT_EQ(b.exponent(), 2);

    b.round_to(100);
    EXPECT_EQ(b.precision(), 100);
    EXPECT_EQ(mpfr_cmp_ui(b.get(), 3), 0);
    EXPECT_TRUE(BigFloat(64).is_zero());
}

TEST_F(ArithTest, PrecisionBudget) {
    PrecisionBudget budget(100, Base::Decimal, 15);
    EXPECT_EQ(budget.working_digits(), 115u);
    // ceil(115 log2 10) + 1
    EXPECT_EQ(budget.fraction_bits(), 384);

    PrecisionBudget wider = budget.widened(40);
    EXPECT_EQ(wider.digits(), 100u);
    EXPECT_EQ(wider.guard_digits(), 55u);
    EXPECT_EQ(budget.guard_digits(), 15u);

    EXPECT_EQ(digits_to_bits(16, Base::Hexadecimal), 65);
    EXPECT_EQ(bits_to_digits(64, Base::Hexadecimal), 16u);
    EXPECT_EQ(bits_to_digits(0, Base::Decimal), 0u);
}

TEST_F(ArithTest, FixedPointChargesIntegerBits) {
    BigFloat value(256);
    mpfr_set_d(value.get(), 1.5, MPFR_RNDN);
    FixedPoint fp = make_fixed_point(value, Base::Hexadecimal, 256);
    // one integer bit, two rounding bits: floor(253 / 4)
    EXPECT_EQ(fp.correct_digits, 63u);
    EXPECT_FALSE(fp.exact);
}
