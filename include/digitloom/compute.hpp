/**
 * Bounded, non-streaming digit computation: evaluate a ConstantSpec to its
 * precision budget, then run the Digit Extractor over the result.
 */

#pragma once

#include <cstdint>

#include "digitloom/arith.hpp"
#include "digitloom/cancellation.hpp"
#include "digitloom/config.hpp"
#include "digitloom/constant_spec.hpp"
#include "digitloom/constants.hpp"
#include "digitloom/digits.hpp"

namespace digitloom {

class DigitComputer {
public:
    explicit DigitComputer(const EngineConfig& config, const CancellationToken* cancel = nullptr);

    // The value of spec to budget.working_digits() correct fractional digits.
    FixedPoint evaluate(const ConstantSpec& spec, PiAlgorithm pi_algorithm, const PrecisionBudget& budget);

    // One attempt with the given guard. Throws PrecisionExhausted when the
    // guard margin is consumed.
    DigitSequence compute(const ConstantSpec& spec, PiAlgorithm pi_algorithm, uint32_t guard_digits);

    // compute() at the configured guard, then once more with
    // retry_guard_digits added if the first attempt ran out of precision.
    DigitSequence compute_with_retry(const ConstantSpec& spec, PiAlgorithm pi_algorithm,
                                     bool* retried = nullptr);

private:
    const EngineConfig& config_;
    const CancellationToken* cancel_;
};

} // namespace digitloom
