#include "digitloom/arith.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

#include "digitloom/error.hpp"

namespace digitloom {

Base to_base(int base) {
    switch (base) {
        case 10: return Base::Decimal;
        case 16: return Base::Hexadecimal;
        default: throw UnsupportedBase(base);
    }
}

double log2_radix(Base base) {
    return base == Base::Hexadecimal ? 4.0 : 3.321928094887362347870319429489390175864831393;
}

// Modular exponentiation: compute base^exp mod m
uint64_t mod_pow(uint64_t base, uint64_t exp, uint64_t m) {
    if (m == 1) return 0;
    if (exp == 0) return 1;

    uint64_t result = 1;
    base = base % m;

    while (exp > 0) {
        if (exp & 1) {
            result = (unsigned __int128)result * base % m;
        }
        exp >>= 1;
        base = (unsigned __int128)base * base % m;
    }
    return result;
}

////////////////////////////////////////////////////////////////////////////////
//  BigInt

BigInt::BigInt() { mpz_init(value_); }

BigInt::BigInt(long value) { mpz_init_set_si(value_, value); }

BigInt::BigInt(const std::string& text, int base) {
    if (mpz_init_set_str(value_, text.c_str(), base) != 0) {
        mpz_clear(value_);
        throw std::invalid_argument("not an integer: '" + text + "'");
    }
}

BigInt::BigInt(const BigInt& other) { mpz_init_set(value_, other.value_); }

BigInt::BigInt(BigInt&& other) noexcept {
    mpz_init(value_);
    mpz_swap(value_, other.value_);
}

BigInt& BigInt::operator=(const BigInt& other) {
    if (this != &other) mpz_set(value_, other.value_);
    return *this;
}

BigInt& BigInt::operator=(BigInt&& other) noexcept {
    mpz_swap(value_, other.value_);
    return *this;
}

BigInt::~BigInt() { mpz_clear(value_); }

std::string BigInt::to_string(int base) const {
    std::unique_ptr<char[]> buffer(new char[mpz_sizeinbase(value_, base) + 2]);
    mpz_get_str(buffer.get(), base, value_);
    return std::string(buffer.get());
}

BigInt BigInt::operator+(const BigInt& rhs) const {
    BigInt out;
    mpz_add(out.value_, value_, rhs.value_);
    return out;
}

BigInt BigInt::operator-(const BigInt& rhs) const {
    BigInt out;
    mpz_sub(out.value_, value_, rhs.value_);
    return out;
}

BigInt BigInt::operator*(const BigInt& rhs) const {
    BigInt out;
    mpz_mul(out.value_, value_, rhs.value_);
    return out;
}

////////////////////////////////////////////////////////////////////////////////
//  BigFloat

BigFloat::BigFloat(mpfr_prec_t precision) {
    mpfr_init2(value_, std::max<mpfr_prec_t>(precision, MPFR_PREC_MIN));
    mpfr_set_zero(value_, 1);
}

BigFloat::BigFloat(const BigFloat& other) {
    mpfr_init2(value_, other.precision());
    mpfr_set(value_, other.value_, MPFR_RNDN);
}

BigFloat::BigFloat(BigFloat&& other) noexcept {
    mpfr_init2(value_, MPFR_PREC_MIN);
    mpfr_swap(value_, other.value_);
}

BigFloat& BigFloat::operator=(const BigFloat& other) {
    if (this != &other) {
        mpfr_set_prec(value_, other.precision());
        mpfr_set(value_, other.value_, MPFR_RNDN);
    }
    return *this;
}

BigFloat& BigFloat::operator=(BigFloat&& other) noexcept {
    mpfr_swap(value_, other.value_);
    return *this;
}

BigFloat::~BigFloat() { mpfr_clear(value_); }

void BigFloat::round_to(mpfr_prec_t precision) {
    mpfr_prec_round(value_, std::max<mpfr_prec_t>(precision, MPFR_PREC_MIN), MPFR_RNDN);
}

std::string BigFloat::to_string(size_t digits) const {
    char* raw = nullptr;
    std::string format = "%." + std::to_string(digits) + "Re";
    if (mpfr_asprintf(&raw, format.c_str(), value_) < 0) {
        return "<unprintable>";
    }
    std::string out(raw);
    mpfr_free_str(raw);
    return out;
}

////////////////////////////////////////////////////////////////////////////////
//  Rational

Rational::Rational() : num_(0), den_(1) {}

Rational::Rational(long numerator, long denominator) : num_(numerator), den_(denominator) {
    if (denominator == 0) throw std::domain_error("zero denominator");
}

Rational::Rational(BigInt numerator, BigInt denominator)
    : num_(std::move(numerator)), den_(std::move(denominator)) {
    if (den_.sign() == 0) throw std::domain_error("zero denominator");
}

Rational Rational::parse_decimal(const std::string& text) {
    if (text.empty()) throw std::invalid_argument("empty number");

    size_t dot = text.find('.');
    std::string whole = text.substr(0, dot);
    std::string frac = dot == std::string::npos ? std::string() : text.substr(dot + 1);
    if (dot != std::string::npos && frac.empty()) {
        throw std::invalid_argument("missing digits after '.' in '" + text + "'");
    }

    BigInt numerator(whole + frac, 10);
    BigInt denominator(1);
    mpz_ui_pow_ui(denominator.get(), 10, frac.size());
    Rational out(std::move(numerator), std::move(denominator));
    out.canonicalize();
    return out;
}

bool Rational::is_integer() const {
    return mpz_divisible_p(num_.get(), den_.get()) != 0;
}

Rational Rational::operator+(const Rational& rhs) const {
    return Rational(num_ * rhs.den_ + rhs.num_ * den_, den_ * rhs.den_);
}

Rational Rational::operator-(const Rational& rhs) const {
    return Rational(num_ * rhs.den_ - rhs.num_ * den_, den_ * rhs.den_);
}

Rational Rational::operator*(const Rational& rhs) const {
    return Rational(num_ * rhs.num_, den_ * rhs.den_);
}

Rational Rational::operator/(const Rational& rhs) const {
    if (rhs.is_zero()) throw std::domain_error("division by zero");
    return Rational(num_ * rhs.den_, den_ * rhs.num_);
}

Rational Rational::pow(long exponent) const {
    if (exponent < 0) {
        if (is_zero()) throw std::domain_error("zero raised to a negative power");
        return Rational(den_, num_).pow(-exponent);
    }
    BigInt n, d;
    mpz_pow_ui(n.get(), num_.get(), static_cast<unsigned long>(exponent));
    mpz_pow_ui(d.get(), den_.get(), static_cast<unsigned long>(exponent));
    return Rational(std::move(n), std::move(d));
}

void Rational::canonicalize() {
    BigInt g;
    mpz_gcd(g.get(), num_.get(), den_.get());
    if (mpz_cmp_ui(g.get(), 1) > 0) {
        mpz_divexact(num_.get(), num_.get(), g.get());
        mpz_divexact(den_.get(), den_.get(), g.get());
    }
    if (den_.sign() < 0) {
        mpz_neg(num_.get(), num_.get());
        mpz_neg(den_.get(), den_.get());
    }
}

void Rational::to_float(BigFloat& target) const {
    mpq_t q;
    mpq_init(q);
    mpq_set_num(q, num_.get());
    mpq_set_den(q, den_.get());
    mpq_canonicalize(q);
    mpfr_set_q(target.get(), q, MPFR_RNDN);
    mpq_clear(q);
}

////////////////////////////////////////////////////////////////////////////////
//  Precision bookkeeping

mpfr_prec_t digits_to_bits(uint64_t digits, Base base) {
    return static_cast<mpfr_prec_t>(std::ceil(static_cast<double>(digits) * log2_radix(base))) + 1;
}

uint64_t bits_to_digits(mpfr_prec_t bits, Base base) {
    if (bits <= 0) return 0;
    return static_cast<uint64_t>(std::floor(static_cast<double>(bits) / log2_radix(base)));
}

PrecisionBudget::PrecisionBudget(uint64_t digits, Base base, uint32_t guard_digits)
    : digits_(digits), base_(base), guard_digits_(guard_digits) {}

mpfr_prec_t PrecisionBudget::fraction_bits() const {
    return digits_to_bits(working_digits(), base_);
}

PrecisionBudget PrecisionBudget::widened(uint32_t extra_guard_digits) const {
    return PrecisionBudget(digits_, base_, guard_digits_ + extra_guard_digits);
}

FixedPoint make_fixed_point(BigFloat value, Base base, mpfr_prec_t relative_bits, bool exact) {
    FixedPoint out;
    out.base = base;
    out.exact = exact;
    mpfr_prec_t fraction_bits = relative_bits;
    if (!value.is_zero() && value.exponent() > 0) {
        fraction_bits -= value.exponent();
    }
    // Two bits for the final rounding of the last operation.
    out.correct_digits = bits_to_digits(fraction_bits - 2, base);
    out.value = std::move(value);
    return out;
}

} // namespace digitloom
