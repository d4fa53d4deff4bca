#include "digitloom/series.hpp"

#include <cmath>

#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"

namespace digitloom {

namespace {

// Extra working bits to absorb rounding over the summation.
const mpfr_prec_t SUM_GUARD_BITS = 64;

const unsigned long CHUD_A = 13591409;
const unsigned long CHUD_B = 545140134;
const unsigned long CHUD_C3_OVER_24 = 10939058860032000UL;

double term_bound_log2(mpfr_srcptr term) {
    if (mpfr_zero_p(term)) return -HUGE_VAL;
    return static_cast<double>(mpfr_get_exp(term));
}

} // namespace

SeriesEngine::SeriesEngine(const EngineConfig& config, const CancellationToken* cancel)
    : config_(config), cancel_(cancel) {}

SeriesSum SeriesEngine::sum(Series& series, mpfr_prec_t bits) {
    mpfr_prec_t precision = bits + SUM_GUARD_BITS;
    uint64_t max_terms = static_cast<uint64_t>(bits) * 64 + 10000;

    series.reset(precision);

    SeriesSum out;
    out.value = BigFloat(precision);
    BigFloat term(precision);

    for (uint64_t k = 0; k < max_terms; k++) {
        if ((k & 1023) == 0 && is_cancelled(cancel_)) {
            throw CancellationRequested();
        }

        series.next_term(term.get(), k);
        mpfr_add(out.value.get(), out.value.get(), term.get(), MPFR_RNDN);

        if (out.value.is_zero()) continue;

        double tail = series.tail_log2(k, term_bound_log2(term.get()));
        double target = static_cast<double>(out.value.exponent()) - static_cast<double>(bits) - 2.0;
        if (tail < target) {
            out.terms = k + 1;
            logging::get()->debug("series {}: {} terms for {} bits", series.name(), out.terms, bits);
            return out;
        }
    }

    throw PrecisionExhausted(std::string("series ") + series.name() + " did not converge",
                             std::to_string(max_terms) + " terms");
}

BigFloat SeriesEngine::e(mpfr_prec_t bits) {
    ExpSeries series;
    return sum(series, bits).value;
}

BigFloat SeriesEngine::ln2(mpfr_prec_t bits) {
    Ln2Series series;
    return sum(series, bits).value;
}

BigFloat SeriesEngine::pi(mpfr_prec_t bits) {
    ChudnovskySeries series;
    SeriesSum s = sum(series, bits + 8);

    mpfr_prec_t precision = s.value.precision();
    BigFloat out(precision);
    mpfr_sqrt_ui(out.get(), 10005, MPFR_RNDN);
    mpfr_mul_ui(out.get(), out.get(), 426880, MPFR_RNDN);
    mpfr_div(out.get(), out.get(), s.value.get(), MPFR_RNDN);
    return out;
}

BigFloat SeriesEngine::zeta3(mpfr_prec_t bits) {
    AperySeries series;
    BigFloat out = sum(series, bits + 4).value;
    mpfr_mul_ui(out.get(), out.get(), 5, MPFR_RNDN);
    mpfr_div_2ui(out.get(), out.get(), 1, MPFR_RNDN);
    return out;
}

BigFloat SeriesEngine::catalan(mpfr_prec_t bits, const BigFloat& pi) {
    CatalanSeries series;
    BigFloat s = sum(series, bits + 8).value;
    mpfr_prec_t precision = s.precision();

    //  pi/8 * ln(2 + sqrt(3))
    BigFloat log_term(precision);
    mpfr_sqrt_ui(log_term.get(), 3, MPFR_RNDN);
    mpfr_add_ui(log_term.get(), log_term.get(), 2, MPFR_RNDN);
    mpfr_log(log_term.get(), log_term.get(), MPFR_RNDN);
    mpfr_mul(log_term.get(), log_term.get(), pi.get(), MPFR_RNDN);
    mpfr_div_2ui(log_term.get(), log_term.get(), 3, MPFR_RNDN);

    //  3/8 * S
    mpfr_mul_ui(s.get(), s.get(), 3, MPFR_RNDN);
    mpfr_div_2ui(s.get(), s.get(), 3, MPFR_RNDN);

    mpfr_add(s.get(), s.get(), log_term.get(), MPFR_RNDN);
    return s;
}

BigFloat SeriesEngine::euler_gamma(mpfr_prec_t bits) {
    //  The truncation error is below pi e^(-4n); pick n so that is < 2^-(bits+8).
    uint64_t n = static_cast<uint64_t>(std::ceil((bits + 8) * std::log(2.0) / 4.0)) + 1;

    //  A/B is about ln n; subtracting ln n cancels a few leading bits.
    mpfr_prec_t inner_bits = bits + 16 + static_cast<mpfr_prec_t>(std::log2(static_cast<double>(n)));

    BrentMcMillanSeries series(n);
    BigFloat a = sum(series, inner_bits).value;
    mpfr_prec_t precision = a.precision();

    BigFloat out(precision);
    mpfr_div(out.get(), a.get(), series.weights().get(), MPFR_RNDN);

    BigFloat log_n(precision);
    mpfr_set_ui(log_n.get(), static_cast<unsigned long>(n), MPFR_RNDN);
    mpfr_log(log_n.get(), log_n.get(), MPFR_RNDN);
    mpfr_sub(out.get(), out.get(), log_n.get(), MPFR_RNDN);
    return out;
}

////////////////////////////////////////////////////////////////////////////////
//  e

void ExpSeries::reset(mpfr_prec_t precision) {
    term_ = BigFloat(precision);
    mpfr_set_ui(term_.get(), 1, MPFR_RNDN);
}

void ExpSeries::next_term(mpfr_ptr out, uint64_t k) {
    if (k > 0) {
        mpfr_div_ui(term_.get(), term_.get(), static_cast<unsigned long>(k), MPFR_RNDN);
    }
    mpfr_set(out, term_.get(), MPFR_RNDN);
}

double ExpSeries::tail_log2(uint64_t k, double term_log2) const {
    //  1/(k+1)! + 1/(k+2)! + ... <= (1/k!) / k
    if (k == 0) return 1.0;
    return term_log2 - std::log2(static_cast<double>(k));
}

////////////////////////////////////////////////////////////////////////////////
//  ln 2

void Ln2Series::reset(mpfr_prec_t precision) {
    power_ = BigFloat(precision);
    mpfr_set_ui(power_.get(), 1, MPFR_RNDN);
}

void Ln2Series::next_term(mpfr_ptr out, uint64_t k) {
    //  term k is 1/((k+1) 2^(k+1))
    mpfr_div_2ui(power_.get(), power_.get(), 1, MPFR_RNDN);
    mpfr_div_ui(out, power_.get(), static_cast<unsigned long>(k + 1), MPFR_RNDN);
}

double Ln2Series::tail_log2(uint64_t, double term_log2) const {
    //  Ratio below 1/2, so the tail is below the current term.
    return term_log2;
}

////////////////////////////////////////////////////////////////////////////////
//  Chudnovsky

void ChudnovskySeries::reset(mpfr_prec_t precision) {
    ratio_ = BigFloat(precision);
    mpfr_set_ui(ratio_.get(), 1, MPFR_RNDN);
}

void ChudnovskySeries::next_term(mpfr_ptr out, uint64_t k) {
    if (k > 0) {
        //  a_k = a_(k-1) * -(6k-5)(2k-1)(6k-1) / (k^3 C^3/24)
        unsigned long kk = static_cast<unsigned long>(k);
        mpfr_mul_ui(ratio_.get(), ratio_.get(), 6 * kk - 5, MPFR_RNDN);
        mpfr_mul_ui(ratio_.get(), ratio_.get(), 2 * kk - 1, MPFR_RNDN);
        mpfr_mul_ui(ratio_.get(), ratio_.get(), 6 * kk - 1, MPFR_RNDN);
        mpfr_div_ui(ratio_.get(), ratio_.get(), kk, MPFR_RNDN);
        mpfr_div_ui(ratio_.get(), ratio_.get(), kk, MPFR_RNDN);
        mpfr_div_ui(ratio_.get(), ratio_.get(), kk, MPFR_RNDN);
        mpfr_div_ui(ratio_.get(), ratio_.get(), CHUD_C3_OVER_24, MPFR_RNDN);
        mpfr_neg(ratio_.get(), ratio_.get(), MPFR_RNDN);
    }

    //  t_k = a_k (A + B k)
    mpfr_mul_ui(out, ratio_.get(), CHUD_B, MPFR_RNDN);
    mpfr_mul_ui(out, out, static_cast<unsigned long>(k), MPFR_RNDN);
    mpfr_t a_part;
    mpfr_init2(a_part, mpfr_get_prec(out));
    mpfr_mul_ui(a_part, ratio_.get(), CHUD_A, MPFR_RNDN);
    mpfr_add(out, out, a_part, MPFR_RNDN);
    mpfr_clear(a_part);
}

double ChudnovskySeries::tail_log2(uint64_t k, double term_log2) const {
    //  |a_(k+1)/a_k| < 2^-47 and (A + B(k+1))/(A + Bk) <= 41, so each
    //  further term shrinks by at least 2^-40.
    if (k == 0) return term_log2;
    return term_log2 - 40.0;
}

////////////////////////////////////////////////////////////////////////////////
//  Apery

void AperySeries::reset(mpfr_prec_t precision) {
    //  1/C(2,1)
    inverse_binomial_ = BigFloat(precision);
    mpfr_set_ui(inverse_binomial_.get(), 1, MPFR_RNDN);
    mpfr_div_2ui(inverse_binomial_.get(), inverse_binomial_.get(), 1, MPFR_RNDN);
}

void AperySeries::next_term(mpfr_ptr out, uint64_t k) {
    //  term k uses j = k+1: (-1)^(j+1) / (j^3 C(2j,j))
    unsigned long j = static_cast<unsigned long>(k + 1);
    if (k > 0) {
        //  1/C(2j,j) = 1/C(2j-2,j-1) * j / (2(2j-1))
        mpfr_mul_ui(inverse_binomial_.get(), inverse_binomial_.get(), j, MPFR_RNDN);
        mpfr_div_ui(inverse_binomial_.get(), inverse_binomial_.get(), 2 * (2 * j - 1), MPFR_RNDN);
    }
    mpfr_div_ui(out, inverse_binomial_.get(), j, MPFR_RNDN);
    mpfr_div_ui(out, out, j, MPFR_RNDN);
    mpfr_div_ui(out, out, j, MPFR_RNDN);
    if (k & 1) {
        mpfr_neg(out, out, MPFR_RNDN);
    }
}

double AperySeries::tail_log2(uint64_t, double term_log2) const {
    //  Alternating with ratio below 1/4.
    return term_log2 - 2.0;
}

////////////////////////////////////////////////////////////////////////////////
//  Catalan

void CatalanSeries::reset(mpfr_prec_t precision) {
    inverse_binomial_ = BigFloat(precision);
    mpfr_set_ui(inverse_binomial_.get(), 1, MPFR_RNDN);
}

void CatalanSeries::next_term(mpfr_ptr out, uint64_t k) {
    unsigned long kk = static_cast<unsigned long>(k);
    if (k > 0) {
        //  1/C(2k,k) = 1/C(2k-2,k-1) * k / (2(2k-1))
        mpfr_mul_ui(inverse_binomial_.get(), inverse_binomial_.get(), kk, MPFR_RNDN);
        mpfr_div_ui(inverse_binomial_.get(), inverse_binomial_.get(), 2 * (2 * kk - 1), MPFR_RNDN);
    }
    mpfr_div_ui(out, inverse_binomial_.get(), 2 * kk + 1, MPFR_RNDN);
    mpfr_div_ui(out, out, 2 * kk + 1, MPFR_RNDN);
}

double CatalanSeries::tail_log2(uint64_t, double term_log2) const {
    //  Ratio below 1/4: tail <= t/3.
    return term_log2 - 1.5;
}

////////////////////////////////////////////////////////////////////////////////
//  Brent-McMillan

void BrentMcMillanSeries::reset(mpfr_prec_t precision) {
    weight_ = BigFloat(precision);
    harmonic_ = BigFloat(precision);
    weights_sum_ = BigFloat(precision);
    mpfr_set_ui(weight_.get(), 1, MPFR_RNDN);
}

void BrentMcMillanSeries::next_term(mpfr_ptr out, uint64_t k) {
    if (k > 0) {
        //  w_k = w_(k-1) n^2 / k^2,  H_k = H_(k-1) + 1/k
        unsigned long kk = static_cast<unsigned long>(k);
        unsigned long nn = static_cast<unsigned long>(n_);
        mpfr_mul_ui(weight_.get(), weight_.get(), nn, MPFR_RNDN);
        mpfr_mul_ui(weight_.get(), weight_.get(), nn, MPFR_RNDN);
        mpfr_div_ui(weight_.get(), weight_.get(), kk, MPFR_RNDN);
        mpfr_div_ui(weight_.get(), weight_.get(), kk, MPFR_RNDN);

        mpfr_t inverse;
        mpfr_init2(inverse, harmonic_.precision());
        mpfr_set_ui(inverse, 1, MPFR_RNDN);
        mpfr_div_ui(inverse, inverse, kk, MPFR_RNDN);
        mpfr_add(harmonic_.get(), harmonic_.get(), inverse, MPFR_RNDN);
        mpfr_clear(inverse);
    }
    mpfr_add(weights_sum_.get(), weights_sum_.get(), weight_.get(), MPFR_RNDN);
    mpfr_mul(out, weight_.get(), harmonic_.get(), MPFR_RNDN);
}

double BrentMcMillanSeries::tail_log2(uint64_t k, double term_log2) const {
    //  Past k = 2n the weight ratio is below 1/4 and H grows by at most 3/2,
    //  so the tail is below 0.6 of the current term. B's tail is smaller
    //  still since H_k >= 1.
    if (k < 2 * n_) return HUGE_VAL;
    return term_log2;
}

} // namespace digitloom
