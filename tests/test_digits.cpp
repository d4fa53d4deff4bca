#include <string>

#include <gtest/gtest.h>

#include "digitloom/digits.hpp"
#include "digitloom/error.hpp"
#include "test_support.hpp"

using namespace digitloom;

class DigitsTest : public test::DigitloomTest {
protected:
    FixedPoint pi_fixed(mpfr_prec_t bits, Base base = Base::Decimal) {
        BigFloat pi(bits);
        mpfr_const_pi(pi.get(), MPFR_RNDN);
        return make_fixed_point(pi, base, bits);
    }

    std::string render(const std::vector<uint8_t>& digits) {
        std::string out;
        for (uint8_t d : digits) out += digit_char(d);
        return out;
    }
};

TEST_F(DigitsTest, DigitCharacters) {
    EXPECT_EQ(digit_char(0), '0');
    EXPECT_EQ(digit_char(9), '9');
    EXPECT_EQ(digit_char(10), 'a');
    EXPECT_EQ(digit_char(15), 'f');

    uint8_t d = 0;
    EXPECT_TRUE(digit_value('7', Base::Decimal, d));
    EXPECT_EQ(d, 7);
    EXPECT_TRUE(digit_value('B', Base::Hexadecimal, d));
    EXPECT_EQ(d, 11);
    EXPECT_FALSE(digit_value('a', Base::Decimal, d));
    EXPECT_FALSE(digit_value('g', Base::Hexadecimal, d));
}

TEST_F(DigitsTest, SequenceRendering) {
    DigitSequence seq;
    seq.integer_part = "3";
    seq.digits = {1, 4, 1};
    EXPECT_EQ(seq.to_string(), "3.141");
    EXPECT_EQ(seq.fractional_string(), "141");

    seq.negative = true;
    seq.digits.clear();
    EXPECT_EQ(seq.to_string(), "-3");
}

TEST_F(DigitsTest, PiFromMpfr) {
    DigitExtractor extractor;
    DigitSequence seq = extractor.extract(pi_fixed(400), 100);
    EXPECT_EQ(seq.integer_part, "3");
    EXPECT_FALSE(seq.negative);
    EXPECT_EQ(seq.fractional_string(), test::PI_DIGITS);

    DigitSequence hex = extractor.extract(pi_fixed(256, Base::Hexadecimal), 50);
    EXPECT_EQ(hex.to_string(), std::string("3.") + test::PI_HEX);
}

TEST_F(DigitsTest, NegativeValues) {
    BigFloat value(400);
    mpfr_const_pi(value.get(), MPFR_RNDN);
    mpfr_neg(value.get(), value.get(), MPFR_RNDN);

    DigitExtractor extractor;
    DigitSequence seq = extractor.extract(make_fixed_point(value, Base::Decimal, 400), 10);
    EXPECT_TRUE(seq.negative);
    EXPECT_EQ(seq.to_string(), "-3.1415926535");
}

TEST_F(DigitsTest, WindowMatchesPrefix) {
    DigitExtractor extractor;
    std::vector<uint8_t> window = extractor.extract_window(pi_fixed(400), 50, 20);
    EXPECT_EQ(render(window), std::string(test::PI_DIGITS).substr(50, 20));
}

TEST_F(DigitsTest, RefusesToSpendTheGuard) {
    DigitExtractor extractor(2);
    FixedPoint fp = pi_fixed(400);
    ASSERT_LT(fp.correct_digits, 200u);
    EXPECT_THROW(extractor.extract(fp, fp.correct_digits - 1), PrecisionExhausted);
    EXPECT_NO_THROW(extractor.extract(fp, fp.correct_digits - 2));
}

TEST_F(DigitsTest, BoundaryValueIsNotCertified) {
    //  0.5 known only approximately: its first digit could be 4 or 5.
    BigFloat half(200);
    mpfr_set_d(half.get(), 0.5, MPFR_RNDN);
    DigitExtractor extractor;
    EXPECT_THROW(extractor.extract(make_fixed_point(half, Base::Decimal, 200), 1), PrecisionExhausted);

    DigitSequence exact = extractor.extract(make_fixed_point(half, Base::Decimal, 200, true), 5);
    EXPECT_EQ(exact.to_string(), "0.50000");
}

TEST_F(DigitsTest, ExactRationals) {
    DigitExtractor extractor;
    EXPECT_EQ(extractor.extract(Rational(1, 3), Base::Decimal, 20).to_string(), "0.33333333333333333333");
    EXPECT_EQ(extractor.extract(Rational(22, 7), Base::Decimal, 6).to_string(), "3.142857");
    EXPECT_EQ(extractor.extract(Rational(-1, 8), Base::Decimal, 5).to_string(), "-0.12500");
    EXPECT_EQ(extractor.extract(Rational(1, 8), Base::Hexadecimal, 3).to_string(), "0.200");
    EXPECT_EQ(extractor.extract(Rational(255, 1), Base::Hexadecimal, 2).to_string(), "ff.00");
    EXPECT_EQ(extractor.extract(Rational(1, 1000), Base::Decimal, 2).to_string(), "0.00");

    DigitSequence none = extractor.extract(Rational(-1, 3), Base::Decimal, 0);
    EXPECT_EQ(none.to_string(), "0");
    EXPECT_FALSE(none.negative);
}
