/**
 * Digit Extractor
 *
 * Turns a FixedPoint into base-b digits with the recurrence
 *
 *      d_k = floor(b f_(k-1)),   f_k = b f_(k-1) - d_k,   f_0 = frac(x)
 *
 * run a machine word at a time (b^W per step). The input's absolute error
 * is below b^-c where c = correct_digits; after N digits it has grown to
 * b^-(c-N). The N digits are certified only if the final remainder f_N
 * stays at least that far from 0 and 1; otherwise a neighbouring value
 * could round to different digits and PrecisionExhausted is thrown.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "digitloom/arith.hpp"

namespace digitloom {

struct DigitSequence {
    Base base = Base::Decimal;
    bool negative = false;
    // Integer part in base b, most significant first, without sign.
    std::string integer_part = "0";
    // Fractional digits, each in [0, b).
    std::vector<uint8_t> digits;
    // False when generation stopped before the requested length.
    bool complete = true;

    // "3.14159..." / "-0.5..."
    std::string to_string() const;
    // Only the fractional digits as characters 0-9a-f.
    std::string fractional_string() const;
};

char digit_char(uint8_t digit);
// Returns false for characters outside [0, base).
bool digit_value(char c, Base base, uint8_t& digit);

class DigitExtractor {
public:
    explicit DigitExtractor(uint32_t min_guard_digits = 2);

    // First count fractional digits plus the integer part.
    DigitSequence extract(const FixedPoint& value, uint64_t count) const;

    // Digits of an exact rational by integer division; never fails.
    DigitSequence extract(const Rational& value, Base base, uint64_t count) const;

    // Fractional digits [start, start + count) only.
    std::vector<uint8_t> extract_window(const FixedPoint& value, uint64_t start, uint64_t count) const;

private:
    // Runs the recurrence on frac in place, appending count digits.
    void run(BigFloat& frac, Base base, uint64_t count, uint64_t correct_digits, bool exact,
             std::vector<uint8_t>& out) const;
    void require_budget(const FixedPoint& value, uint64_t needed) const;

    uint32_t min_guard_digits_;
};

} // namespace digitloom
