/**
 * Engine tunables.
 *
 * Guard margins and sampling thresholds are policy, not algorithm; they are
 * gathered here with their defaults and can be overridden from the
 * environment (DIGITLOOM_* variables).
 */

#pragma once

#include <cstdint>
#include <string>

namespace digitloom {

struct EngineConfig {
    // Extra base-b digits carried beyond the request.
    uint32_t guard_digits = 15;
    // Added to the guard for the single retry after PrecisionExhausted.
    uint32_t retry_guard_digits = 40;
    // Fewest guard digits the extractor accepts before declaring exhaustion.
    uint32_t min_guard_digits = 2;

    // Stability sampling: recompute the last window digits with this many
    // more guard digits.
    uint32_t stability_extra_guard = 20;
    uint32_t stability_window = 32;

    // Random-access (BBP) extraction.
    uint32_t bbp_guard_bits = 10;
    uint32_t bbp_max_precision_bits = 4096;
    uint32_t bbp_digits_per_eval = 8;

    // Binary splitting: ranges at or below leaf_terms are summed directly;
    // ranges above task_terms are split into OpenMP tasks.
    uint64_t split_leaf_terms = 16;
    uint64_t split_task_terms = 1024;

    // 0 = OpenMP default.
    unsigned threads = 0;

    // scrypt work factor for container encryption.
    uint32_t scrypt_log2_n = 14;
    uint32_t scrypt_r = 8;
    uint32_t scrypt_p = 1;

    std::string log_level = "info";

    // Defaults overridden by any DIGITLOOM_* variables that are set.
    static EngineConfig from_environment();

    // Throws ConfigError when a value is out of range.
    void validate() const;
};

} // namespace digitloom
