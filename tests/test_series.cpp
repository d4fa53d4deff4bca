#include <cmath>
#include <string>

#include <gtest/gtest.h>

#include "digitloom/compute.hpp"
#include "digitloom/constant_spec.hpp"
#include "digitloom/constants.hpp"
#include "digitloom/digits.hpp"
#include "digitloom/error.hpp"
#include "digitloom/series.hpp"
#include "test_support.hpp"

using namespace digitloom;

namespace {

// |a - b| < 2^-bits |b|
bool close_to(const BigFloat& a, const BigFloat& b, mpfr_prec_t bits) {
    BigFloat diff(a.precision() + 64);
    mpfr_sub(diff.get(), a.get(), b.get(), MPFR_RNDN);
    if (mpfr_zero_p(diff.get())) return true;
    return mpfr_get_exp(diff.get()) <= mpfr_get_exp(b.get()) - bits;
}

// MPFR's own routine for each catalogue constant.
void mpfr_reference(ConstantId id, BigFloat& out) {
    switch (id) {
        case ConstantId::Pi: mpfr_const_pi(out.get(), MPFR_RNDN); break;
        case ConstantId::Tau:
            mpfr_const_pi(out.get(), MPFR_RNDN);
            mpfr_mul_2ui(out.get(), out.get(), 1, MPFR_RNDN);
            break;
        case ConstantId::E:
            mpfr_set_ui(out.get(), 1, MPFR_RNDN);
            mpfr_exp(out.get(), out.get(), MPFR_RNDN);
            break;
        case ConstantId::Sqrt2: mpfr_sqrt_ui(out.get(), 2, MPFR_RNDN); break;
        case ConstantId::Phi:
            mpfr_sqrt_ui(out.get(), 5, MPFR_RNDN);
            mpfr_add_ui(out.get(), out.get(), 1, MPFR_RNDN);
            mpfr_div_2ui(out.get(), out.get(), 1, MPFR_RNDN);
            break;
        case ConstantId::EulerGamma: mpfr_const_euler(out.get(), MPFR_RNDN); break;
        case ConstantId::Zeta3: mpfr_zeta_ui(out.get(), 3, MPFR_RNDN); break;
        case ConstantId::Catalan: mpfr_const_catalan(out.get(), MPFR_RNDN); break;
        case ConstantId::Ln2: mpfr_const_log2(out.get(), MPFR_RNDN); break;
        case ConstantId::Zeta2: mpfr_zeta_ui(out.get(), 2, MPFR_RNDN); break;
    }
}

class NeverConverges : public Series {
public:
    const char* name() const override { return "divergent"; }
    void reset(mpfr_prec_t) override {}
    void next_term(mpfr_ptr out, uint64_t) override { mpfr_set_ui(out, 1, MPFR_RNDN); }
    double tail_log2(uint64_t, double) const override { return HUGE_VAL; }
};

} // namespace

class SeriesTest : public test::DigitloomTest {
protected:
    std::string fractional(ConstantId id, uint64_t digits, PiAlgorithm pi_algorithm = PiAlgorithm::Series) {
        DigitComputer computer(config_);
        return computer.compute_with_retry(ConstantSpec::constant(id, Base::Decimal, digits), pi_algorithm)
            .fractional_string();
    }
};

TEST_F(SeriesTest, EMatchesMpfr) {
    SeriesEngine engine(config_);
    BigFloat e = engine.e(400);

    BigFloat reference(500);
    mpfr_set_ui(reference.get(), 1, MPFR_RNDN);
    mpfr_exp(reference.get(), reference.get(), MPFR_RNDN);
    EXPECT_TRUE(close_to(e, reference, 400));
}

TEST_F(SeriesTest, Ln2MatchesMpfr) {
    SeriesEngine engine(config_);
    BigFloat ln2 = engine.ln2(300);

    BigFloat reference(400);
    mpfr_const_log2(reference.get(), MPFR_RNDN);
    EXPECT_TRUE(close_to(ln2, reference, 300));
}

TEST_F(SeriesTest, ChudnovskyPiMatchesMpfr) {
    SeriesEngine engine(config_);
    BigFloat pi = engine.pi(1000);

    BigFloat reference(1100);
    mpfr_const_pi(reference.get(), MPFR_RNDN);
    EXPECT_TRUE(close_to(pi, reference, 1000));
}

TEST_F(SeriesTest, ReferenceDigits) {
    EXPECT_EQ(fractional(ConstantId::Pi, 100), test::PI_DIGITS);
    EXPECT_EQ(fractional(ConstantId::E, 100), test::E_DIGITS);
    EXPECT_EQ(fractional(ConstantId::Sqrt2, 65), test::SQRT2_DIGITS);
    EXPECT_EQ(fractional(ConstantId::Phi, 79), test::PHI_DIGITS);
    EXPECT_EQ(fractional(ConstantId::EulerGamma, 50), test::GAMMA_DIGITS);
    EXPECT_EQ(fractional(ConstantId::Zeta3, 50), test::ZETA3_DIGITS);
    EXPECT_EQ(fractional(ConstantId::Catalan, 40), test::CATALAN_DIGITS);
    EXPECT_EQ(fractional(ConstantId::Ln2, 50), test::LN2_DIGITS);
    EXPECT_EQ(fractional(ConstantId::Zeta2, 30), test::ZETA2_DIGITS);
    EXPECT_EQ(fractional(ConstantId::Tau, 38), test::TAU_DIGITS);
}

TEST_F(SeriesTest, EveryConstantMatchesMpfrInBothBases) {
    DigitComputer computer(config_);
    DigitExtractor extractor(config_.min_guard_digits);

    for (ConstantId id : all_constants()) {
        for (Base base : {Base::Decimal, Base::Hexadecimal}) {
            for (uint64_t digits : {uint64_t(1), uint64_t(1000), uint64_t(5000)}) {
                SCOPED_TRACE(std::string(constant_name(id)) + " base " + std::to_string(radix(base)) + " N " +
                             std::to_string(digits));

                DigitSequence computed =
                    computer.compute_with_retry(ConstantSpec::constant(id, base, digits), PiAlgorithm::BinarySplitting);

                PrecisionBudget budget(digits, base, config_.guard_digits);
                mpfr_prec_t bits = budget.fraction_bits() + 128;
                BigFloat value(bits);
                mpfr_reference(id, value);
                DigitSequence expected = extractor.extract(make_fixed_point(value, base, bits), digits);

                EXPECT_EQ(computed.integer_part, expected.integer_part);
                ASSERT_EQ(computed.digits.size(), digits);
                EXPECT_EQ(computed.fractional_string(), expected.fractional_string());
            }
        }
    }
}

TEST_F(SeriesTest, IntegerParts) {
    DigitComputer computer(config_);
    EXPECT_EQ(computer.compute_with_retry(ConstantSpec::constant(ConstantId::Tau, Base::Decimal, 5),
                                          PiAlgorithm::Series).integer_part, "6");
    EXPECT_EQ(computer.compute_with_retry(ConstantSpec::constant(ConstantId::Ln2, Base::Decimal, 5),
                                          PiAlgorithm::Series).integer_part, "0");
    EXPECT_EQ(computer.compute_with_retry(ConstantSpec::constant(ConstantId::E, Base::Hexadecimal, 5),
                                          PiAlgorithm::Series).integer_part, "2");
}

TEST_F(SeriesTest, GammaAtHigherPrecision) {
    SeriesEngine engine(config_);
    BigFloat gamma = engine.euler_gamma(600);

    BigFloat reference(700);
    mpfr_const_euler(reference.get(), MPFR_RNDN);
    EXPECT_TRUE(close_to(gamma, reference, 600));
}

TEST_F(SeriesTest, DivergentSeriesExhaustsPrecision) {
    SeriesEngine engine(config_);
    NeverConverges series;
    EXPECT_THROW(engine.sum(series, 8), PrecisionExhausted);
}

TEST_F(SeriesTest, CancelledBeforeFirstTerm) {
    CancellationToken token;
    token.cancel();
    SeriesEngine engine(config_, &token);
    EXPECT_THROW(engine.e(1000), CancellationRequested);
}
