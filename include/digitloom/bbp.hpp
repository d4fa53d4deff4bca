/**
 * Random-Access Extractor
 *
 * Hexadecimal digits of pi at an arbitrary offset via the
 * Bailey-Borwein-Plouffe formula:
 *
 *      {16^n pi} = {4 S(1,n) - 2 S(4,n) - S(5,n) - S(6,n)}
 *      S(j,n)    = sum_{k<=n} (16^(n-k) mod (8k+j)) / (8k+j)
 *                + sum_{k>n}  16^(n-k) / (8k+j)
 *
 * The modular part runs in parallel with per-thread partial sums. Results
 * whose fractional part falls within the accumulated error bound (plus the
 * guard bits) of a digit boundary are recomputed at doubled precision.
 */

#pragma once

#include <cstdint>
#include <string>

#include "digitloom/arith.hpp"
#include "digitloom/config.hpp"

namespace digitloom {

struct HexSlice {
    uint64_t start = 0;
    // Upper-case hex digits, one per offset.
    std::string digits;
    // Smallest distance, in bits, between any evaluation's fractional part
    // and the nearest digit boundary beyond its error bound.
    double confidence_bits = 0.0;
};

class RandomAccessExtractor {
public:
    explicit RandomAccessExtractor(const EngineConfig& config);

    // Hex digit at a 0-based offset after the point (offset 0 -> 2).
    int digit_at(uint64_t offset);

    // Digits [start, start + count). Throws PrecisionExhausted if an
    // evaluation stays ambiguous up to the configured precision cap.
    HexSlice extract(uint64_t start, uint64_t count);

private:
    // Writes want digits starting at offset n into digits. Returns false
    // when the result is too close to a boundary at this precision.
    bool evaluate(uint64_t n, unsigned want, mpfr_prec_t precision, std::string& digits,
                  double& confidence_bits);

    // result = {S(j, n)}
    void series_frac(BigFloat& result, unsigned j, uint64_t n);

    const EngineConfig& config_;
};

} // namespace digitloom
