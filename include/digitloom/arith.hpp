/**
 * Precision Arithmetic Core
 *
 * Thin RAII owners over GMP integers and MPFR floats, an unreduced rational
 * pair, and the precision bookkeeping every engine uses:
 *
 *   BigInt          exact integer (mpz_t)
 *   BigFloat        binary float with its own precision in bits (mpfr_t)
 *   Rational        numerator/denominator, reduced only on canonicalize()
 *   FixedPoint      BigFloat + number of base-b fractional digits known correct
 *   PrecisionBudget working precision derived from (N, base, guard)
 *
 * Engines operate on the raw handles (get()) with the mpz_/mpfr_ calls
 * directly; the wrappers only own the storage.
 */

#pragma once

#include <cstdint>
#include <string>

#include <gmp.h>
#include <mpfr.h>

namespace digitloom {

enum class Base : int {
    Decimal = 10,
    Hexadecimal = 16
};

// Throws UnsupportedBase for anything but 10 and 16.
Base to_base(int base);
inline int radix(Base base) { return static_cast<int>(base); }
double log2_radix(Base base);

// Computes base^exp mod m by repeated squaring.
uint64_t mod_pow(uint64_t base, uint64_t exp, uint64_t m);

////////////////////////////////////////////////////////////////////////////////

class BigInt {
public:
    BigInt();
    BigInt(long value);
    explicit BigInt(const std::string& text, int base = 10);
    BigInt(const BigInt& other);
    BigInt(BigInt&& other) noexcept;
    BigInt& operator=(const BigInt& other);
    BigInt& operator=(BigInt&& other) noexcept;
    ~BigInt();

    mpz_ptr get() { return value_; }
    mpz_srcptr get() const { return value_; }

    int sign() const { return mpz_sgn(value_); }
    size_t bit_length() const { return mpz_sizeinbase(value_, 2); }
    std::string to_string(int base = 10) const;

    BigInt operator+(const BigInt& rhs) const;
    BigInt operator-(const BigInt& rhs) const;
    BigInt operator*(const BigInt& rhs) const;
    bool operator==(const BigInt& rhs) const { return mpz_cmp(value_, rhs.value_) == 0; }
    bool operator!=(const BigInt& rhs) const { return !(*this == rhs); }

private:
    mpz_t value_;
};

////////////////////////////////////////////////////////////////////////////////

class BigFloat {
public:
    // Precision in bits; the value starts at zero.
    explicit BigFloat(mpfr_prec_t precision = 64);
    BigFloat(const BigFloat& other);
    BigFloat(BigFloat&& other) noexcept;
    BigFloat& operator=(const BigFloat& other);
    BigFloat& operator=(BigFloat&& other) noexcept;
    ~BigFloat();

    mpfr_ptr get() { return value_; }
    mpfr_srcptr get() const { return value_; }

    mpfr_prec_t precision() const { return mpfr_get_prec(value_); }
    // Rounds the current value to the new precision.
    void round_to(mpfr_prec_t precision);

    bool is_zero() const { return mpfr_zero_p(value_) != 0; }
    int sign() const { return mpfr_sgn(value_); }
    // Binary exponent e with 2^(e-1) <= |x| < 2^e. Undefined for zero.
    long exponent() const { return mpfr_get_exp(value_); }

    // Scientific rendering for logs and diagnostics.
    std::string to_string(size_t digits = 20) const;

private:
    mpfr_t value_;
};

////////////////////////////////////////////////////////////////////////////////

// Numerator/denominator pair. Arithmetic does not reduce; call
// canonicalize() when a reduced form is needed.
class Rational {
public:
    Rational();
    Rational(long numerator, long denominator = 1);
    Rational(BigInt numerator, BigInt denominator);

    // Parses "123", "-4", "3.1416". Throws std::invalid_argument on bad text.
    static Rational parse_decimal(const std::string& text);

    const BigInt& numerator() const { return num_; }
    const BigInt& denominator() const { return den_; }

    bool is_zero() const { return num_.sign() == 0; }
    int sign() const { return num_.sign() * den_.sign(); }
    bool is_integer() const;

    Rational operator+(const Rational& rhs) const;
    Rational operator-(const Rational& rhs) const;
    Rational operator*(const Rational& rhs) const;
    // Throws std::domain_error on division by zero.
    Rational operator/(const Rational& rhs) const;
    Rational pow(long exponent) const;

    // Reduces by the gcd and makes the denominator positive.
    void canonicalize();

    // Rounded to nearest at the target's precision.
    void to_float(BigFloat& target) const;

private:
    BigInt num_;
    BigInt den_;
};

////////////////////////////////////////////////////////////////////////////////

// Working precision for one request. Immutable; widened() returns a new
// budget rather than reusing one across a different N.
class PrecisionBudget {
public:
    PrecisionBudget(uint64_t digits, Base base, uint32_t guard_digits);

    uint64_t digits() const { return digits_; }
    Base base() const { return base_; }
    uint32_t guard_digits() const { return guard_digits_; }
    uint64_t working_digits() const { return digits_ + guard_digits_; }

    // Bits of absolute precision needed below the radix point.
    mpfr_prec_t fraction_bits() const;

    PrecisionBudget widened(uint32_t extra_guard_digits) const;

private:
    uint64_t digits_;
    Base base_;
    uint32_t guard_digits_;
};

// Bits needed to hold the given number of base-b digits.
mpfr_prec_t digits_to_bits(uint64_t digits, Base base);
// Whole base-b digits guaranteed by the given number of bits.
uint64_t bits_to_digits(mpfr_prec_t bits, Base base);

// A real value with an explicit absolute precision: the first
// correct_digits base-b digits after the radix point are guaranteed.
struct FixedPoint {
    BigFloat value;
    Base base = Base::Decimal;
    uint64_t correct_digits = 0;
    // Set when value is exactly the quantity requested (rational literal).
    bool exact = false;
};

// Builds a FixedPoint from a value carrying the given relative precision in
// bits; the integer part's bits are charged against that precision.
FixedPoint make_fixed_point(BigFloat value, Base base, mpfr_prec_t relative_bits, bool exact = false);

} // namespace digitloom
