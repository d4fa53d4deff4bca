#pragma once

#include <map>
#include <string>
#include <vector>

#include "digitloom/arith.hpp"
#include "digitloom/cancellation.hpp"
#include "digitloom/config.hpp"

namespace digitloom {

enum class ConstantId {
    Pi,
    Tau,
    E,
    Sqrt2,
    Phi,
    EulerGamma,
    Zeta3,
    Catalan,
    Ln2,
    Zeta2
};

// Canonical lower-case name ("pi", "zeta3", ...).
const char* constant_name(ConstantId id);

// Case-insensitive lookup over canonical names and aliases.
bool find_constant(const std::string& name, ConstantId& id);

// Like find_constant but throws UnsupportedConstant.
ConstantId parse_constant(const std::string& name);

const std::vector<ConstantId>& all_constants();

enum class PiAlgorithm {
    BinarySplitting,
    Series
};

// Evaluates catalogue constants to a requested relative precision and
// caches them for the lifetime of the evaluator, so an expression that uses
// pi three times computes it once.
class ConstantEvaluator {
public:
    ConstantEvaluator(const EngineConfig& config, const CancellationToken* cancel = nullptr,
                      PiAlgorithm pi_algorithm = PiAlgorithm::BinarySplitting);

    // Relative error below 2^-bits.
    BigFloat evaluate(ConstantId id, mpfr_prec_t bits);

    PiAlgorithm pi_algorithm() const { return pi_algorithm_; }

private:
    BigFloat compute(ConstantId id, mpfr_prec_t bits);
    BigFloat pi(mpfr_prec_t bits);

    struct Cached {
        mpfr_prec_t bits;
        BigFloat value;
    };

    const BigFloat* lookup(ConstantId id, mpfr_prec_t bits) const;
    void store(ConstantId id, mpfr_prec_t bits, const BigFloat& value);

    const EngineConfig& config_;
    const CancellationToken* cancel_;
    PiAlgorithm pi_algorithm_;
    std::map<ConstantId, Cached> cache_;
};

} // namespace digitloom
