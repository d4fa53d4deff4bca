/**
 * Binary-Splitting Engine for the Chudnovsky series.
 *
 * Over a term range [a, b) the engine keeps three exact integers
 *
 *      P(a,b) = p_a ... p_(b-1)
 *      Q(a,b) = q_a ... q_(b-1)
 *      T(a,b)   with T(0,b) / Q(0,b) the partial sum over [0, b)
 *
 * and merges two halves [a,m), [m,b) exactly:
 *
 *      P = P0 P1,   Q = Q0 Q1,   T = T0 Q1 + P0 T1
 *
 * Halves above a size threshold run as OpenMP tasks; the merge waits on
 * both (taskwait), which lets the waiting thread pick up other tasks. The
 * only rounding is the final division pi = 426880 sqrt(10005) Q / T.
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "digitloom/arith.hpp"
#include "digitloom/cancellation.hpp"
#include "digitloom/config.hpp"

namespace digitloom {

struct SplitTerms {
    BigInt p;
    BigInt q;
    BigInt t;
};

class BinarySplittingEngine {
public:
    explicit BinarySplittingEngine(const EngineConfig& config, const CancellationToken* cancel = nullptr);

    // Terms needed for a relative error below 2^-bits (each term adds
    // about 47.11 bits).
    static uint64_t terms_for_bits(mpfr_prec_t bits);

    // Exact P, Q, T over [a, b). Throws CancellationRequested if the token
    // fires; the check runs at every merge.
    SplitTerms split(uint64_t a, uint64_t b);

    // pi with relative error below 2^-bits.
    BigFloat pi(mpfr_prec_t bits);

    // Worker count used by the last split().
    int threads_used() const { return threads_used_; }

private:
    void split_range(SplitTerms& out, uint64_t a, uint64_t b);
    void leaf(SplitTerms& out, uint64_t a, uint64_t b) const;

    const EngineConfig& config_;
    const CancellationToken* cancel_;
    std::atomic<bool> aborted_{false};
    int threads_used_ = 1;
};

// out = left (+) right, consuming both.
void merge_split_terms(SplitTerms& out, SplitTerms&& left, SplitTerms&& right);

} // namespace digitloom
