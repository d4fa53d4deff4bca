/**
 * Verifier
 *
 * Cross-checks a produced DigitSequence without touching it:
 *
 *   RandomAccess   pi in base 16; evenly spaced positions recomputed with
 *                  the BBP extractor
 *   SpigotPrefix   pi in base 10; the first digits regenerated by the
 *                  spigot streamer
 *   Stability      everything else; the sequence recomputed with a wider
 *                  guard and its last digits compared
 *
 * A mismatch is a verdict in the report, never an exception.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "digitloom/cancellation.hpp"
#include "digitloom/config.hpp"
#include "digitloom/constant_spec.hpp"
#include "digitloom/constants.hpp"
#include "digitloom/digits.hpp"

namespace digitloom {

enum class VerificationMethod {
    Skipped,
    RandomAccess,
    SpigotPrefix,
    Stability
};

const char* verification_method_name(VerificationMethod method);

struct SampleResult {
    // 0-based fractional position.
    uint64_t position = 0;
    uint8_t expected = 0;
    uint8_t actual = 0;
    bool match = false;
};

struct VerificationReport {
    VerificationMethod method = VerificationMethod::Skipped;
    std::vector<SampleResult> samples;
    bool passed = true;
    std::string detail;

    size_t mismatches() const;
};

struct VerifyOptions {
    bool enabled = false;
    // Positions to check; the prefix length for the spigot check.
    uint32_t samples = 16;
};

class Verifier {
public:
    explicit Verifier(const EngineConfig& config, const CancellationToken* cancel = nullptr);

    VerificationReport verify(const ConstantSpec& spec, const DigitSequence& sequence, uint32_t samples,
                              PiAlgorithm pi_algorithm = PiAlgorithm::BinarySplitting);

    // Evenly spaced positions over [0, length), first and last included.
    static std::vector<uint64_t> sample_positions(uint64_t length, uint32_t samples);

private:
    VerificationReport random_access(const DigitSequence& sequence, uint32_t samples);
    VerificationReport spigot_prefix(const DigitSequence& sequence, uint32_t samples);
    VerificationReport stability(const ConstantSpec& spec, const DigitSequence& sequence,
                                 PiAlgorithm pi_algorithm);

    const EngineConfig& config_;
    const CancellationToken* cancel_;
};

} // namespace digitloom
