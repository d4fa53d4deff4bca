#pragma once

#include <cstdint>
#include <string>

#include "digitloom/arith.hpp"

namespace digitloom {

// Byte counts of each export encoding for N fractional digits, before any
// compression. Text-based formats carry the value as "3.1415...".
struct SizeEstimate {
    uint64_t text = 0;
    uint64_t json = 0;
    uint64_t ndjson = 0;
    uint64_t csv = 0;
    uint64_t tsv = 0;
    uint64_t sql = 0;
    uint64_t ascii_binary = 0;
    // Two digits per byte, integer digits included.
    uint64_t packed_binary = 0;
    uint64_t container = 0;
    // N log2(b).
    double information_bits = 0.0;
};

SizeEstimate estimate_sizes(uint64_t digits, Base base, uint32_t chunk_size, const std::string& descriptor = "pi",
                            const std::string& integer_part = "3", bool encrypted = false);

} // namespace digitloom
