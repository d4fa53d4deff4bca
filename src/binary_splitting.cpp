#include "digitloom/binary_splitting.hpp"

#include <chrono>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"

namespace digitloom {

namespace {

const unsigned long CHUD_A = 13591409;
const unsigned long CHUD_B = 545140134;
const unsigned long CHUD_C3_OVER_24 = 10939058860032000UL;

// log2(640320^3 / 1728)
const double BITS_PER_TERM = 47.110413;

void term(SplitTerms& out, uint64_t k) {
    if (k == 0) {
        mpz_set_ui(out.p.get(), 1);
        mpz_set_ui(out.q.get(), 1);
        mpz_set_ui(out.t.get(), CHUD_A);
        return;
    }

    unsigned long kk = static_cast<unsigned long>(k);

    //  p = (6k-5)(2k-1)(6k-1)
    mpz_set_ui(out.p.get(), 6 * kk - 5);
    mpz_mul_ui(out.p.get(), out.p.get(), 2 * kk - 1);
    mpz_mul_ui(out.p.get(), out.p.get(), 6 * kk - 1);

    //  q = k^3 C^3 / 24
    mpz_set_ui(out.q.get(), kk);
    mpz_mul_ui(out.q.get(), out.q.get(), kk);
    mpz_mul_ui(out.q.get(), out.q.get(), kk);
    mpz_mul_ui(out.q.get(), out.q.get(), CHUD_C3_OVER_24);

    //  t = (-1)^k p (A + Bk)
    mpz_set_ui(out.t.get(), CHUD_B);
    mpz_mul_ui(out.t.get(), out.t.get(), kk);
    mpz_add_ui(out.t.get(), out.t.get(), CHUD_A);
    mpz_mul(out.t.get(), out.t.get(), out.p.get());
    if (k & 1) {
        mpz_neg(out.t.get(), out.t.get());
    }
}

} // namespace

void merge_split_terms(SplitTerms& out, SplitTerms&& left, SplitTerms&& right) {
    //  T = T0 Q1 + P0 T1
    mpz_mul(out.t.get(), left.t.get(), right.q.get());
    mpz_mul(right.t.get(), left.p.get(), right.t.get());
    mpz_add(out.t.get(), out.t.get(), right.t.get());

    mpz_mul(out.p.get(), left.p.get(), right.p.get());
    mpz_mul(out.q.get(), left.q.get(), right.q.get());
}

BinarySplittingEngine::BinarySplittingEngine(const EngineConfig& config, const CancellationToken* cancel)
    : config_(config), cancel_(cancel) {}

uint64_t BinarySplittingEngine::terms_for_bits(mpfr_prec_t bits) {
    return static_cast<uint64_t>(static_cast<double>(bits) / BITS_PER_TERM) + 2;
}

void BinarySplittingEngine::leaf(SplitTerms& out, uint64_t a, uint64_t b) const {
    term(out, a);
    SplitTerms next;
    for (uint64_t k = a + 1; k < b; k++) {
        term(next, k);
        SplitTerms acc = std::move(out);
        out = SplitTerms();
        merge_split_terms(out, std::move(acc), std::move(next));
        next = SplitTerms();
    }
}

void BinarySplittingEngine::split_range(SplitTerms& out, uint64_t a, uint64_t b) {
    if (aborted_.load(std::memory_order_relaxed)) return;

    if (b - a <= config_.split_leaf_terms) {
        leaf(out, a, b);
        return;
    }

    uint64_t m = a + (b - a) / 2;

    SplitTerms left, right;
    if (b - a > config_.split_task_terms) {
        #pragma omp task shared(left)
        split_range(left, a, m);

        split_range(right, m, b);

        #pragma omp taskwait
    } else {
        split_range(left, a, m);
        split_range(right, m, b);
    }

    //  Merge barrier: both halves are done. Stop here if asked to.
    if (is_cancelled(cancel_)) {
        aborted_.store(true, std::memory_order_relaxed);
    }
    if (aborted_.load(std::memory_order_relaxed)) return;

    merge_split_terms(out, std::move(left), std::move(right));
}

SplitTerms BinarySplittingEngine::split(uint64_t a, uint64_t b) {
    SplitTerms out;
    if (b <= a) {
        mpz_set_ui(out.p.get(), 1);
        mpz_set_ui(out.q.get(), 1);
        mpz_set_ui(out.t.get(), 0);
        return out;
    }

    aborted_.store(false);

    int num_threads = 1;
    #ifdef _OPENMP
    num_threads = config_.threads > 0 ? static_cast<int>(config_.threads) : omp_get_max_threads();
    #endif
    threads_used_ = num_threads;

    #pragma omp parallel num_threads(num_threads)
    {
        #pragma omp single
        split_range(out, a, b);
    }

    if (aborted_.load() || is_cancelled(cancel_)) {
        throw CancellationRequested();
    }
    return out;
}

BigFloat BinarySplittingEngine::pi(mpfr_prec_t bits) {
    uint64_t terms = terms_for_bits(bits);

    auto start = std::chrono::steady_clock::now();
    SplitTerms s = split(0, terms);
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    logging::get()->debug("binary splitting: {} terms on {} threads in {:.3f}s",
                          terms, threads_used_, elapsed.count());

    mpfr_prec_t precision = bits + 32;
    BigFloat q(precision);
    BigFloat t(precision);
    BigFloat out(precision);
    mpfr_set_z(q.get(), s.q.get(), MPFR_RNDN);
    mpfr_set_z(t.get(), s.t.get(), MPFR_RNDN);

    mpfr_sqrt_ui(out.get(), 10005, MPFR_RNDN);
    mpfr_mul_ui(out.get(), out.get(), 426880, MPFR_RNDN);
    mpfr_mul(out.get(), out.get(), q.get(), MPFR_RNDN);
    mpfr_div(out.get(), out.get(), t.get(), MPFR_RNDN);
    return out;
}

} // namespace digitloom
