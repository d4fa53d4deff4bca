/**
 * Series Engine
 *
 * Sums a convergent series term by term until its closed-form tail bound
 * drops below one unit in the last requested bit. Each series supplies its
 * own terms and its own tail bound; the engine owns the loop, the working
 * precision and the stopping rule.
 */

#pragma once

#include <cstdint>

#include "digitloom/arith.hpp"
#include "digitloom/cancellation.hpp"
#include "digitloom/config.hpp"

namespace digitloom {

class Series {
public:
    virtual ~Series() = default;

    virtual const char* name() const = 0;

    // Called once before the first term with the working precision.
    virtual void reset(mpfr_prec_t precision) = 0;

    // Writes term k into out. k runs 0, 1, 2, ... without gaps.
    virtual void next_term(mpfr_ptr out, uint64_t k) = 0;

    // log2 of an upper bound on |t_(k+1) + t_(k+2) + ...| given that
    // |t_k| < 2^term_log2. HUGE_VAL when no bound holds yet at k.
    virtual double tail_log2(uint64_t k, double term_log2) const = 0;
};

struct SeriesSum {
    BigFloat value;
    uint64_t terms = 0;
};

class SeriesEngine {
public:
    explicit SeriesEngine(const EngineConfig& config, const CancellationToken* cancel = nullptr);

    // Sums to a relative error below 2^-bits. Throws PrecisionExhausted if
    // the tail bound never converges, CancellationRequested if stopped.
    SeriesSum sum(Series& series, mpfr_prec_t bits);

    // Individual constants, each with relative error below 2^-bits.
    BigFloat e(mpfr_prec_t bits);
    BigFloat ln2(mpfr_prec_t bits);
    BigFloat pi(mpfr_prec_t bits);
    BigFloat zeta3(mpfr_prec_t bits);
    BigFloat euler_gamma(mpfr_prec_t bits);
    // Catalan's constant needs pi; pass one accurate to at least bits.
    BigFloat catalan(mpfr_prec_t bits, const BigFloat& pi);

private:
    const EngineConfig& config_;
    const CancellationToken* cancel_;
};

////////////////////////////////////////////////////////////////////////////////
//  Series definitions

// e = sum 1/k!
class ExpSeries : public Series {
public:
    const char* name() const override { return "exp(1)"; }
    void reset(mpfr_prec_t precision) override;
    void next_term(mpfr_ptr out, uint64_t k) override;
    double tail_log2(uint64_t k, double term_log2) const override;

private:
    BigFloat term_;
};

// ln 2 = sum_{k>=1} 1/(k 2^k)
class Ln2Series : public Series {
public:
    const char* name() const override { return "ln(2)"; }
    void reset(mpfr_prec_t precision) override;
    void next_term(mpfr_ptr out, uint64_t k) override;
    double tail_log2(uint64_t k, double term_log2) const override;

private:
    BigFloat power_;
};

// Chudnovsky: 1/pi = 12/640320^(3/2) sum (-1)^k (6k)! (A + Bk) / ((3k)! (k!)^3 640320^(3k)).
// The engine sums S = sum a_k (A + Bk); pi = 426880 sqrt(10005) / S.
class ChudnovskySeries : public Series {
public:
    const char* name() const override { return "Chudnovsky"; }
    void reset(mpfr_prec_t precision) override;
    void next_term(mpfr_ptr out, uint64_t k) override;
    double tail_log2(uint64_t k, double term_log2) const override;

private:
    BigFloat ratio_;
};

// 2/5 zeta(3) = sum_{k>=1} (-1)^(k+1) / (k^3 C(2k,k))
class AperySeries : public Series {
public:
    const char* name() const override { return "Apery"; }
    void reset(mpfr_prec_t precision) override;
    void next_term(mpfr_ptr out, uint64_t k) override;
    double tail_log2(uint64_t k, double term_log2) const override;

private:
    BigFloat inverse_binomial_;
};

// Ramanujan: G = pi/8 ln(2 + sqrt 3) + 3/8 sum_{k>=0} 1/((2k+1)^2 C(2k,k)).
// This series is the sum part.
class CatalanSeries : public Series {
public:
    const char* name() const override { return "Catalan"; }
    void reset(mpfr_prec_t precision) override;
    void next_term(mpfr_ptr out, uint64_t k) override;
    double tail_log2(uint64_t k, double term_log2) const override;

private:
    BigFloat inverse_binomial_;
};

// Brent-McMillan: gamma = A/B - ln n + O(e^-4n) with
// A = sum (n^k/k!)^2 H_k and B = sum (n^k/k!)^2.
// Terms are those of A; B accumulates alongside and is read with weights().
class BrentMcMillanSeries : public Series {
public:
    explicit BrentMcMillanSeries(uint64_t n) : n_(n) {}

    const char* name() const override { return "Brent-McMillan"; }
    void reset(mpfr_prec_t precision) override;
    void next_term(mpfr_ptr out, uint64_t k) override;
    double tail_log2(uint64_t k, double term_log2) const override;

    uint64_t n() const { return n_; }
    const BigFloat& weights() const { return weights_sum_; }

private:
    uint64_t n_;
    BigFloat weight_;
    BigFloat harmonic_;
    BigFloat weights_sum_;
};

} // namespace digitloom
