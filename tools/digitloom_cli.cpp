/**
 * digitloom-cli
 *
 * Computes digits of a catalogue constant or expression, verifies them,
 * cross-checks them against MPFR's own evaluation of the constant and
 * optionally writes them to a chunked container.
 *
 *   digitloom-cli <constant-or-expression> [digits] [base] [container]
 *
 * Tunables come from DIGITLOOM_* environment variables.
 */

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include <gmp.h>
#include <mpfr.h>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "digitloom/config.hpp"
#include "digitloom/constant_spec.hpp"
#include "digitloom/digits.hpp"
#include "digitloom/error.hpp"
#include "digitloom/export_sizes.hpp"
#include "digitloom/generator.hpp"
#include "digitloom/logging.hpp"

using namespace digitloom;

namespace {

void print_header() {
    std::cout << std::string(70, '=') << "\n";
    std::cout << "  DIGITLOOM: DIGITS OF MATHEMATICAL CONSTANTS\n";
    std::cout << "  GMP/MPFR arithmetic, OpenMP binary splitting, chunked containers\n";
    std::cout << std::string(70, '=') << "\n\n";

    #ifdef _OPENMP
    std::cout << "OpenMP enabled with " << omp_get_max_threads() << " threads\n";
    #else
    std::cout << "OpenMP not available (single-threaded)\n";
    #endif

    std::cout << "MPFR version: " << mpfr_get_version() << "\n";
    std::cout << "GMP version: " << gmp_version << "\n\n";
}

// MPFR's own value of a catalogue constant, for an independent check.
// False for constants MPFR has no direct routine for and for expressions.
bool reference_value(const ConstantSpec& spec, BigFloat& out) {
    if (spec.is_expression()) return false;
    switch (spec.id()) {
        case ConstantId::Pi:         mpfr_const_pi(out.get(), MPFR_RNDN); return true;
        case ConstantId::Tau:
            mpfr_const_pi(out.get(), MPFR_RNDN);
            mpfr_mul_2ui(out.get(), out.get(), 1, MPFR_RNDN);
            return true;
        case ConstantId::E:
            mpfr_set_ui(out.get(), 1, MPFR_RNDN);
            mpfr_exp(out.get(), out.get(), MPFR_RNDN);
            return true;
        case ConstantId::Sqrt2:      mpfr_sqrt_ui(out.get(), 2, MPFR_RNDN); return true;
        case ConstantId::EulerGamma: mpfr_const_euler(out.get(), MPFR_RNDN); return true;
        case ConstantId::Zeta3:      mpfr_zeta_ui(out.get(), 3, MPFR_RNDN); return true;
        case ConstantId::Catalan:    mpfr_const_catalan(out.get(), MPFR_RNDN); return true;
        case ConstantId::Ln2:        mpfr_const_log2(out.get(), MPFR_RNDN); return true;
        case ConstantId::Zeta2:      mpfr_zeta_ui(out.get(), 2, MPFR_RNDN); return true;
        case ConstantId::Phi:        break;
    }
    return false;
}

// Number of positions where the two sequences disagree, -1 if MPFR has no
// reference for the constant.
long cross_check(const ConstantSpec& spec, const DigitSequence& digits, const EngineConfig& config) {
    PrecisionBudget budget(digits.digits.size(), spec.base(), config.guard_digits);
    mpfr_prec_t bits = budget.fraction_bits() + 8;
    BigFloat value(bits);
    if (!reference_value(spec, value)) return -1;

    DigitExtractor extractor(config.min_guard_digits);
    DigitSequence reference = extractor.extract(make_fixed_point(value, spec.base(), bits), digits.digits.size());

    long errors = 0;
    for (size_t i = 0; i < digits.digits.size(); i++) {
        if (reference.digits[i] != digits.digits[i]) {
            errors++;
            if (errors <= 10) {
                std::cout << "  ERROR at position " << i + 1 << ": got " << digit_char(digits.digits[i])
                          << ", expected " << digit_char(reference.digits[i]) << "\n";
            }
        }
    }
    if (reference.integer_part != digits.integer_part) errors++;
    return errors;
}

std::string preview(const DigitSequence& digits, size_t width) {
    std::string text = digits.to_string();
    if (text.size() <= width) return text;
    return text.substr(0, width) + "...";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <constant-or-expression> [digits] [base] [container]\n";
        return 2;
    }

    try {
        EngineConfig config = EngineConfig::from_environment();
        logging::init(config.log_level);
        print_header();

        uint64_t count = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 1000;
        int base = argc > 3 ? std::atoi(argv[3]) : 10;

        Request request{ConstantSpec::parse(argv[1], base, count)};
        request.verify.enabled = true;
        if (argc > 4) {
            request.container = ContainerOptions();
            request.container->compression = CompressionId::Gzip;
            request.container_path = argv[4];
        }

        std::cout << "Computing " << count << " base-" << base << " digits of "
                  << request.spec.descriptor() << "\n";

        Generator generator(config);
        auto start = std::chrono::steady_clock::now();
        GenerationResult result = generator.run(request);
        auto end = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = end - start;

        std::cout << "Algorithm: " << algorithm_name(result.algorithm)
                  << (result.retried ? " (retried with a wider guard)" : "") << "\n";
        std::cout << "Value: " << preview(result.digits, 72) << "\n\n";

        bool ok = true;
        if (result.verification) {
            const VerificationReport& report = *result.verification;
            std::cout << "Verification (" << verification_method_name(report.method) << "): "
                      << report.samples.size() - report.mismatches() << "/" << report.samples.size()
                      << " samples match" << (report.passed ? "" : ", FAILED") << "\n";
            ok = ok && report.passed;
        }

        std::cout << "Cross-checking against MPFR...\n";
        long errors = cross_check(request.spec, result.digits, config);
        if (errors < 0) {
            std::cout << "  no MPFR reference for " << request.spec.descriptor() << "\n";
        } else if (errors == 0) {
            std::cout << "  all " << result.digits.digits.size() << " digits agree\n";
        } else {
            std::cout << "  " << errors << " errors found!\n";
            ok = false;
        }

        if (request.container) {
            SizeEstimate sizes = estimate_sizes(count, request.spec.base(), request.container->chunk_size,
                                                request.spec.descriptor(), result.digits.integer_part);
            std::cout << "Container: " << request.container_path << " (uncompressed estimate "
                      << sizes.container << " bytes, " << std::fixed << std::setprecision(0)
                      << sizes.information_bits << " bits of information)\n";
        }

        std::cout << "\n";
        std::cout << std::string(50, '-') << "\n";
        std::cout << "Total time: " << std::fixed << std::setprecision(2) << elapsed.count() << " seconds\n";
        return ok ? 0 : 1;
    } catch (const Error& e) {
        std::cerr << "digitloom: " << e.what() << "\n";
        return 2;
    }
}
