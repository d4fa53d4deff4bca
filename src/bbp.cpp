#include "digitloom/bbp.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"

namespace digitloom {

namespace {

// Below this many modular terms the parallel region costs more than it saves.
const uint64_t PARALLEL_MIN_TERMS = 1 << 14;

// Partial sums are reduced mod 1 once they pass 2^20.
const unsigned long REDUCE_ABOVE = 1UL << 20;

// Helper: compute {x} ensuring result in [0,1)
void frac_positive(mpfr_ptr x) {
    mpfr_frac(x, x, MPFR_RNDN);
    if (mpfr_sgn(x) < 0) {
        mpfr_add_ui(x, x, 1, MPFR_RNDN);
    }
}

mpfr_prec_t base_precision(uint64_t n) {
    return std::max<mpfr_prec_t>(128, static_cast<mpfr_prec_t>(std::log2(static_cast<double>(n) + 1.0)) + 128);
}

// log2 of the absolute error bound on {16^n pi} at the given precision:
// n+1 rounded terms of size up to 2^21, weighted by 4+2+1+1.
double error_log2(uint64_t n, mpfr_prec_t precision) {
    return -static_cast<double>(precision) + std::log2(static_cast<double>(n) + 2.0) + 24.0;
}

} // namespace

RandomAccessExtractor::RandomAccessExtractor(const EngineConfig& config) : config_(config) {}

void RandomAccessExtractor::series_frac(BigFloat& result, unsigned j, uint64_t n) {
    mpfr_prec_t precision = result.precision();
    mpfr_set_zero(result.get(), 1);

    int num_threads = 1;
    #ifdef _OPENMP
    if (n >= PARALLEL_MIN_TERMS) {
        num_threads = config_.threads > 0 ? static_cast<int>(config_.threads) : omp_get_max_threads();
    }
    #endif

    std::vector<BigFloat> partial_sums(num_threads, BigFloat(precision));

    #pragma omp parallel num_threads(num_threads) if (num_threads > 1)
    {
        int tid = 0;
        #ifdef _OPENMP
        tid = omp_get_thread_num();
        #endif

        BigFloat term(precision);
        mpfr_ptr sum = partial_sums[tid].get();

        #pragma omp for schedule(dynamic, 1024)
        for (uint64_t k = 0; k <= n; k++) {
            uint64_t denom = 8 * k + j;
            uint64_t numerator = mod_pow(16, n - k, denom);
            mpfr_set_ui(term.get(), static_cast<unsigned long>(numerator), MPFR_RNDN);
            mpfr_div_ui(term.get(), term.get(), static_cast<unsigned long>(denom), MPFR_RNDN);

            mpfr_add(sum, sum, term.get(), MPFR_RNDN);

            if (mpfr_cmp_ui(sum, REDUCE_ABOVE) > 0) {
                mpfr_frac(sum, sum, MPFR_RNDN);
            }
        }
    }

    for (int i = 0; i < num_threads; i++) {
        mpfr_add(result.get(), result.get(), partial_sums[i].get(), MPFR_RNDN);
    }
    frac_positive(result.get());

    //  Tail: 16^(n-k) / (8k+j) for k > n, until below 2^-(precision + 8).
    BigFloat power(precision);
    BigFloat term(precision);
    mpfr_set_ui(power.get(), 1, MPFR_RNDN);
    for (uint64_t k = n + 1;; k++) {
        mpfr_div_2ui(power.get(), power.get(), 4, MPFR_RNDN);
        mpfr_div_ui(term.get(), power.get(), static_cast<unsigned long>(8 * k + j), MPFR_RNDN);
        if (mpfr_get_exp(term.get()) < -(precision + 8)) break;
        mpfr_add(result.get(), result.get(), term.get(), MPFR_RNDN);
    }
    frac_positive(result.get());
}

bool RandomAccessExtractor::evaluate(uint64_t n, unsigned want, mpfr_prec_t precision,
                                     std::string& digits, double& confidence_bits) {
    BigFloat s1(precision), s4(precision), s5(precision), s6(precision);
    series_frac(s1, 1, n);
    series_frac(s4, 4, n);
    series_frac(s5, 5, n);
    series_frac(s6, 6, n);

    //  x = {4 S1 - 2 S4 - S5 - S6}
    BigFloat x(precision);
    mpfr_mul_ui(x.get(), s1.get(), 4, MPFR_RNDN);
    mpfr_mul_ui(s4.get(), s4.get(), 2, MPFR_RNDN);
    mpfr_sub(x.get(), x.get(), s4.get(), MPFR_RNDN);
    mpfr_sub(x.get(), x.get(), s5.get(), MPFR_RNDN);
    mpfr_sub(x.get(), x.get(), s6.get(), MPFR_RNDN);
    frac_positive(x.get());

    //  y = x 16^want; the digits are floor(y).
    mpfr_mul_2ui(x.get(), x.get(), 4 * want, MPFR_RNDN);
    unsigned long word = mpfr_get_ui(x.get(), MPFR_RNDZ);
    mpfr_sub_ui(x.get(), x.get(), word, MPFR_RNDN);

    //  Distance from the remainder to the nearest boundary.
    BigFloat distance(precision);
    mpfr_ui_sub(distance.get(), 1, x.get(), MPFR_RNDN);
    if (mpfr_cmp(distance.get(), x.get()) > 0) {
        mpfr_set(distance.get(), x.get(), MPFR_RNDN);
    }
    if (distance.is_zero()) return false;

    double scaled_error = error_log2(n, precision) + 4.0 * want;
    double margin = static_cast<double>(distance.exponent() - 1) - scaled_error;
    if (margin <= static_cast<double>(config_.bbp_guard_bits)) return false;

    digits.assign(want, '0');
    for (int i = static_cast<int>(want) - 1; i >= 0; i--) {
        digits[i] = "0123456789ABCDEF"[word & 15];
        word >>= 4;
    }
    confidence_bits = margin;
    return true;
}

int RandomAccessExtractor::digit_at(uint64_t offset) {
    HexSlice slice = extract(offset, 1);
    char c = slice.digits[0];
    return c <= '9' ? c - '0' : c - 'A' + 10;
}

HexSlice RandomAccessExtractor::extract(uint64_t start, uint64_t count) {
    HexSlice out;
    out.start = start;
    out.digits.reserve(count);
    out.confidence_bits = HUGE_VAL;

    uint64_t position = start;
    while (position < start + count) {
        mpfr_prec_t precision = base_precision(position);

        //  As many digits per evaluation as the precision leaves room for.
        double room = (precision - std::log2(static_cast<double>(position) + 2.0) - 24.0 -
                       config_.bbp_guard_bits - 8.0) / 4.0;
        unsigned want = static_cast<unsigned>(std::max(1.0, std::floor(room)));
        want = std::min<unsigned>(want, config_.bbp_digits_per_eval);
        want = static_cast<unsigned>(std::min<uint64_t>(want, start + count - position));

        std::string digits;
        double confidence = 0.0;
        while (!evaluate(position, want, precision, digits, confidence)) {
            precision *= 2;
            if (precision > static_cast<mpfr_prec_t>(config_.bbp_max_precision_bits)) {
                throw PrecisionExhausted("hex digit stays ambiguous at the precision cap",
                                         "offset " + std::to_string(position) + ", " +
                                             std::to_string(config_.bbp_max_precision_bits) + " bits");
            }
            logging::get()->debug("bbp: offset {} near a digit boundary, retrying at {} bits",
                                  position, precision);
        }

        out.digits += digits;
        out.confidence_bits = std::min(out.confidence_bits, confidence);
        position += want;
    }

    if (count == 0) out.confidence_bits = 0.0;
    return out;
}

} // namespace digitloom
