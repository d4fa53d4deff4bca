#include "digitloom/compute.hpp"

#include "digitloom/error.hpp"
#include "digitloom/expression.hpp"
#include "digitloom/logging.hpp"

namespace digitloom {

namespace {

// Integer bits assumed before the value is known; catalogue constants are
// all below 8.
const mpfr_prec_t INTEGER_BITS_GUESS = 4;

} // namespace

DigitComputer::DigitComputer(const EngineConfig& config, const CancellationToken* cancel)
    : config_(config), cancel_(cancel) {}

FixedPoint DigitComputer::evaluate(const ConstantSpec& spec, PiAlgorithm pi_algorithm,
                                   const PrecisionBudget& budget) {
    ConstantEvaluator constants(config_, cancel_, pi_algorithm);
    ExpressionEvaluator expressions(constants);

    auto evaluate_at = [&](mpfr_prec_t bits) {
        if (spec.is_expression()) {
            return expressions.evaluate(*spec.expression_tree(), bits);
        }
        return constants.evaluate(spec.id(), bits);
    };

    mpfr_prec_t fraction_bits = budget.fraction_bits();
    mpfr_prec_t bits = fraction_bits + INTEGER_BITS_GUESS;
    BigFloat value = evaluate_at(bits);

    //  Large expression values eat into the fractional bits; redo with room
    //  for the integer part.
    if (!value.is_zero() && value.exponent() > INTEGER_BITS_GUESS) {
        bits = fraction_bits + value.exponent();
        logging::get()->debug("{}: integer part needs {} bits, re-evaluating at {} bits",
                              spec.descriptor(), value.exponent(), bits);
        value = evaluate_at(bits);
    }

    return make_fixed_point(std::move(value), budget.base(), bits);
}

DigitSequence DigitComputer::compute(const ConstantSpec& spec, PiAlgorithm pi_algorithm,
                                     uint32_t guard_digits) {
    if (spec.unbounded()) {
        throw InvalidRequest("an unbounded request needs the streaming path");
    }

    DigitExtractor extractor(config_.min_guard_digits);
    if (spec.is_rational()) {
        return extractor.extract(rational_value(*spec.expression_tree()), spec.base(), spec.digits());
    }

    PrecisionBudget budget(spec.digits(), spec.base(), guard_digits);
    FixedPoint value = evaluate(spec, pi_algorithm, budget);
    return extractor.extract(value, spec.digits());
}

DigitSequence DigitComputer::compute_with_retry(const ConstantSpec& spec, PiAlgorithm pi_algorithm,
                                                bool* retried) {
    if (retried) *retried = false;
    try {
        return compute(spec, pi_algorithm, config_.guard_digits);
    } catch (const PrecisionExhausted& e) {
        uint32_t guard = config_.guard_digits + config_.retry_guard_digits;
        logging::get()->warn("{} ({} digits, base {}): {}; retrying with {} guard digits",
                             spec.descriptor(), spec.digits(), radix(spec.base()), e.what(), guard);
        if (retried) *retried = true;
        return compute(spec, pi_algorithm, guard);
    }
}

} // namespace digitloom
