#include "digitloom/digits.hpp"

#include <algorithm>

#include "digitloom/error.hpp"

namespace digitloom {

namespace {

// Headroom carried above the bits still needed, so the word multiply's
// rounding stays far below the certified error bound.
const mpfr_prec_t HEADROOM_BITS = 128;

// Digits per machine-word step; b^W must fit in an unsigned long.
int word_digits(Base base) {
    return base == Base::Hexadecimal ? 15 : 18;
}

unsigned long power(Base base, int exponent) {
    unsigned long out = 1;
    for (int i = 0; i < exponent; i++) out *= static_cast<unsigned long>(radix(base));
    return out;
}

} // namespace

char digit_char(uint8_t digit) {
    return "0123456789abcdef"[digit & 15];
}

bool digit_value(char c, Base base, uint8_t& digit) {
    int value;
    if (c >= '0' && c <= '9') {
        value = c - '0';
    } else if (c >= 'a' && c <= 'f') {
        value = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        value = c - 'A' + 10;
    } else {
        return false;
    }
    if (value >= radix(base)) return false;
    digit = static_cast<uint8_t>(value);
    return true;
}

std::string DigitSequence::to_string() const {
    std::string out;
    out.reserve(integer_part.size() + digits.size() + 2);
    if (negative) out += '-';
    out += integer_part;
    if (!digits.empty()) {
        out += '.';
        out += fractional_string();
    }
    return out;
}

std::string DigitSequence::fractional_string() const {
    std::string out(digits.size(), '0');
    for (size_t i = 0; i < digits.size(); i++) {
        out[i] = digit_char(digits[i]);
    }
    return out;
}

////////////////////////////////////////////////////////////////////////////////

DigitExtractor::DigitExtractor(uint32_t min_guard_digits) : min_guard_digits_(min_guard_digits) {}

void DigitExtractor::require_budget(const FixedPoint& value, uint64_t needed) const {
    if (value.exact) return;
    if (value.correct_digits < needed + min_guard_digits_) {
        throw PrecisionExhausted("guard margin consumed",
                                 "need " + std::to_string(needed + min_guard_digits_) +
                                     " correct digits, have " + std::to_string(value.correct_digits));
    }
}

DigitSequence DigitExtractor::extract(const FixedPoint& value, uint64_t count) const {
    require_budget(value, count);

    DigitSequence out;
    out.base = value.base;
    out.negative = value.value.sign() < 0;

    mpfr_prec_t precision = value.value.precision() + HEADROOM_BITS;
    BigFloat magnitude(precision);
    mpfr_abs(magnitude.get(), value.value.get(), MPFR_RNDN);

    BigFloat whole(precision);
    mpfr_floor(whole.get(), magnitude.get());

    BigInt integer;
    mpfr_get_z(integer.get(), whole.get(), MPFR_RNDZ);
    out.integer_part = integer.to_string(radix(value.base));

    //  frac = |x| - floor(|x|) is exact.
    mpfr_sub(magnitude.get(), magnitude.get(), whole.get(), MPFR_RNDN);

    out.digits.reserve(count);
    run(magnitude, value.base, count, value.correct_digits, value.exact, out.digits);
    if (out.digits.empty()) {
        //  Nothing was emitted; a "-0" would be misleading.
        out.negative = out.negative && out.integer_part != "0";
    }
    return out;
}

DigitSequence DigitExtractor::extract(const Rational& value, Base base, uint64_t count) const {
    Rational reduced = value;
    reduced.canonicalize();

    DigitSequence out;
    out.base = base;
    out.negative = reduced.sign() < 0;

    BigInt numerator = reduced.numerator();
    mpz_abs(numerator.get(), numerator.get());

    BigInt integer, remainder;
    mpz_fdiv_qr(integer.get(), remainder.get(), numerator.get(), reduced.denominator().get());
    out.integer_part = integer.to_string(radix(base));
    if (count == 0) {
        out.negative = out.negative && out.integer_part != "0";
        return out;
    }

    //  floor(remainder b^count / den), left-padded to count digits
    BigInt scaled;
    mpz_ui_pow_ui(scaled.get(), static_cast<unsigned long>(radix(base)), static_cast<unsigned long>(count));
    mpz_mul(scaled.get(), scaled.get(), remainder.get());
    mpz_fdiv_q(scaled.get(), scaled.get(), reduced.denominator().get());

    std::string text = scaled.to_string(radix(base));
    out.digits.assign(count, 0);
    size_t offset = count - text.size();
    for (size_t i = 0; i < text.size(); i++) {
        digit_value(text[i], base, out.digits[offset + i]);
    }
    return out;
}

std::vector<uint8_t> DigitExtractor::extract_window(const FixedPoint& value, uint64_t start,
                                                    uint64_t count) const {
    require_budget(value, start + count);

    mpfr_prec_t precision = value.value.precision() + HEADROOM_BITS;
    BigFloat frac(precision);
    mpfr_abs(frac.get(), value.value.get(), MPFR_RNDN);
    mpfr_frac(frac.get(), frac.get(), MPFR_RNDN);

    //  Skip start digits: frac(b^start * f).
    if (start > 0) {
        BigFloat scale(precision);
        mpfr_ui_pow_ui(scale.get(), static_cast<unsigned long>(radix(value.base)),
                       static_cast<unsigned long>(start), MPFR_RNDN);
        mpfr_mul(frac.get(), frac.get(), scale.get(), MPFR_RNDN);
        mpfr_frac(frac.get(), frac.get(), MPFR_RNDN);
    }

    std::vector<uint8_t> out;
    out.reserve(count);
    uint64_t remaining_correct = value.exact ? value.correct_digits : value.correct_digits - start;
    run(frac, value.base, count, remaining_correct, value.exact, out);
    return out;
}

void DigitExtractor::run(BigFloat& frac, Base base, uint64_t count, uint64_t correct_digits, bool exact,
                         std::vector<uint8_t>& out) const {
    const int W = word_digits(base);
    const uint64_t margin = exact ? 0 : correct_digits - count;

    uint64_t left = count;
    while (left > 0) {
        int w = static_cast<int>(std::min<uint64_t>(left, W));
        unsigned long scale = power(base, w);

        mpfr_mul_ui(frac.get(), frac.get(), scale, MPFR_RNDN);
        unsigned long word = mpfr_get_ui(frac.get(), MPFR_RNDZ);
        if (word >= scale) {
            throw PrecisionExhausted("digit word overflowed its range",
                                     "position " + std::to_string(count - left));
        }
        mpfr_sub_ui(frac.get(), frac.get(), word, MPFR_RNDN);

        size_t at = out.size();
        out.resize(at + w);
        for (int i = w - 1; i >= 0; i--) {
            out[at + i] = static_cast<uint8_t>(word % radix(base));
            word /= radix(base);
        }
        left -= w;

        //  Only (left + margin) digits of the remainder still matter.
        if (!exact) {
            mpfr_prec_t needed = digits_to_bits(left + margin, base) + HEADROOM_BITS;
            if (needed < frac.precision()) frac.round_to(needed);
        }
    }

    if (exact) return;

    //  The true remainder lies within b^-margin of frac. If that interval
    //  touches 0 or 1 the last digit is not certain.
    if (frac.is_zero()) {
        throw PrecisionExhausted("remainder is zero at the final digit",
                                 "position " + std::to_string(count));
    }
    BigFloat distance(frac.precision());
    mpfr_ui_sub(distance.get(), 1, frac.get(), MPFR_RNDN);
    if (mpfr_cmp(distance.get(), frac.get()) > 0) {
        mpfr_set(distance.get(), frac.get(), MPFR_RNDN);
    }
    if (distance.is_zero()) {
        throw PrecisionExhausted("remainder is one at the final digit", "position " + std::to_string(count));
    }

    double distance_log2 = static_cast<double>(distance.exponent() - 1);
    double error_log2 = -static_cast<double>(margin) * log2_radix(base) + 1.0;
    if (distance_log2 <= error_log2) {
        throw PrecisionExhausted("final digit lies within the error bound of a digit boundary",
                                 "position " + std::to_string(count) + ", margin " +
                                     std::to_string(margin) + " digits");
    }
}

} // namespace digitloom
