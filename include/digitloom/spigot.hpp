/**
 * Spigot Streamer
 *
 * Unbounded digit generator for pi (Gibbons' streaming algorithm) in base
 * 10 or 16. The state is a linear fractional transform (q r / 0 t) plus
 * the term counters k and l and the candidate digit n. Each step either
 * emits n, when n is already determined by the transform, or absorbs the
 * next series term into it. Only the state integers are kept; no emitted
 * digit is retained.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "digitloom/arith.hpp"
#include "digitloom/cancellation.hpp"

namespace digitloom {

enum class SpigotStep {
    Emitted,
    Deferred,
    Finished
};

// Everything needed to resume a stream.
struct SpigotSnapshot {
    Base base = Base::Decimal;
    uint64_t emitted = 0;
    uint64_t limit = 0;
    uint64_t k = 0;
    uint64_t l = 0;
    BigInt q, r, t, n;

    // "base emitted limit k l q r t n", integers in hex.
    std::string serialize() const;
    // Throws InvalidRequest on malformed text.
    static SpigotSnapshot parse(const std::string& text);
};

class SpigotStreamer {
public:
    static constexpr uint64_t UNBOUNDED = UINT64_MAX;

    // Emits up to limit fractional digits (UNBOUNDED for no limit).
    explicit SpigotStreamer(Base base, uint64_t limit = UNBOUNDED,
                            const CancellationToken* cancel = nullptr);
    explicit SpigotStreamer(const SpigotSnapshot& snapshot, const CancellationToken* cancel = nullptr);

    Base base() const { return base_; }
    // Always "3"; the integer digit is produced by the constructor.
    std::string integer_part() const { return "3"; }
    uint64_t emitted() const { return emitted_; }
    uint64_t limit() const { return limit_; }
    bool finished() const { return emitted_ >= limit_; }

    // One step of the algorithm. digit is written only on Emitted.
    SpigotStep step(uint8_t& digit);

    // Steps until the next digit. False once the limit is reached. Throws
    // CancellationRequested when the token fires between steps.
    bool next_digit(uint8_t& digit);

    // Appends up to max digits to out and returns how many were appended.
    // On cancellation the digits already appended stay in out.
    size_t next_batch(size_t max, std::vector<uint8_t>& out);

    SpigotSnapshot snapshot() const;

private:
    bool emit_ready() const;
    void emit(uint8_t& digit);
    void absorb();

    Base base_;
    uint64_t limit_;
    const CancellationToken* cancel_;
    uint64_t emitted_ = 0;

    BigInt q_, r_, t_, n_;
    uint64_t k_ = 1;
    uint64_t l_ = 3;
    BigInt scratch_;
};

} // namespace digitloom
