#pragma once

#include <cstdint>
#include <string>

#include "digitloom/crypto.hpp"

namespace digitloom {

enum class CompressionId : uint8_t {
    None = 0,
    Gzip = 1
};

const char* compression_name(CompressionId compression);
// "none", "gzip". Throws InvalidRequest.
CompressionId parse_compression(const std::string& name);
// Throws ContainerFormatError for unknown ids.
CompressionId compression_from_id(uint8_t id);

// gzip framing (zlib windowBits 15 + 16). Throws ContainerFormatError.
Bytes gzip_compress(const Bytes& data, int level = 6);
// Fails unless the stream inflates to exactly expected_size bytes.
Bytes gzip_decompress(const Bytes& data, size_t expected_size);

} // namespace digitloom
