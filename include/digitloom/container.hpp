/**
 * Chunked Container Codec ("dloom")
 *
 * File layout, integers big-endian:
 *
 *      magic "DLOOMCH2" | u16 version | u32 header length | header
 *      finalization block (32 bytes, rewritten on close)
 *      chunk 0 ... chunk n-1
 *      directory (written on close)
 *
 * header:  u16 version, descriptor, u8 base, u8 negative, integer part,
 *          u64 declared digits (all ones = unbounded), u32 chunk size,
 *          u8 compression, u8 encryption, u8 hash (1 = sha256), u8 kdf
 *          [kdf 1: salt 16, u8 log2 N, u32 r, u32 p, key check 16]
 *          sha256 of everything above
 *
 * finalization: u8 state, check 7, u64 digits, u64 chunks, u64 directory offset
 *          (check = first 7 bytes of sha256(header digest | state | digits |
 *          chunks | directory offset))
 *
 * chunk:   sha256(plaintext) 32 | u32 raw length | u32 payload length |
 *          u8 compression | u8 encryption | [nonce 12 | tag 16] | payload
 *
 * directory: u64 count | count x (u64 offset, u32 record length, u32 raw
 *            length) | sha256 of the entries
 *
 * The payload is the chunk's digits as ASCII (0-9a-f), hashed first, then
 * gzip-compressed, then sealed with AEAD. The associated data binds the
 * header digest, the chunk index and the raw length. Every chunk but the
 * last holds exactly chunk_size digits, so digit i lives in chunk
 * i / chunk_size.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "digitloom/arith.hpp"
#include "digitloom/compression.hpp"
#include "digitloom/config.hpp"
#include "digitloom/crypto.hpp"
#include "digitloom/digits.hpp"

namespace digitloom {

enum class ContainerState : uint8_t {
    Open = 0,
    Complete = 1,
    Truncated = 2
};

const char* container_state_name(ContainerState state);

struct ContainerOptions {
    uint32_t chunk_size = 65536;
    CompressionId compression = CompressionId::None;
    CipherId cipher = CipherId::None;
    std::string password;
};

struct ContainerHeader {
    static constexpr uint64_t UNBOUNDED = UINT64_MAX;

    uint16_t version = 2;
    std::string descriptor;
    Base base = Base::Decimal;
    bool negative = false;
    std::string integer_part = "0";
    uint64_t declared_digits = 0;
    uint32_t chunk_size = 0;
    CompressionId compression = CompressionId::None;
    CipherId cipher = CipherId::None;
    crypto::ScryptParams scrypt;
    Bytes salt;
    Bytes key_check;
    // sha256 of the encoded header; filled by encode/decode.
    Bytes digest;

    bool unbounded() const { return declared_digits == UNBOUNDED; }
    bool encrypted() const { return cipher != CipherId::None; }

    // Header bytes including the trailing digest; sets digest.
    Bytes encode();
    // Throws ContainerFormatError on malformed bytes or a digest mismatch.
    static ContainerHeader decode(const Bytes& bytes);
};

// Bytes a container occupies once closed, without compression.
uint64_t container_size(uint64_t digits, uint32_t chunk_size, size_t descriptor_bytes, size_t integer_bytes,
                        bool encrypted);

// Identity of the digit stream a writer records.
struct ContainerMetadata {
    std::string descriptor;
    Base base = Base::Decimal;
    bool negative = false;
    std::string integer_part = "0";
    uint64_t declared_digits = 0;
};

////////////////////////////////////////////////////////////////////////////////

// Opened -> Writing -> Closed. Single producer. A chunk is built, hashed
// and transformed in memory before any of its bytes reach the file.
class ContainerWriter {
public:
    enum class State {
        Opened,
        Writing,
        Closed
    };

    ContainerWriter(const std::string& path, const ContainerMetadata& metadata, const ContainerOptions& options,
                    const EngineConfig& config = EngineConfig());
    ~ContainerWriter();

    ContainerWriter(const ContainerWriter&) = delete;
    ContainerWriter& operator=(const ContainerWriter&) = delete;

    // Digit values in [0, base). Throws InvalidRequest for out-of-range
    // digits or writing past the declared count, IoError on write failure.
    void append(const uint8_t* digits, size_t count);
    void append(const std::vector<uint8_t>& digits) { append(digits.data(), digits.size()); }

    // Flushes the partial chunk, writes the directory and finalizes the
    // header. The container is complete unless truncated is set or fewer
    // digits than declared were written.
    void close(bool truncated = false);

    State state() const { return state_; }
    uint64_t digits_written() const { return digits_written_; }
    uint64_t chunk_count() const { return directory_.size(); }
    const ContainerHeader& header() const { return header_; }

private:
    struct DirectoryEntry {
        uint64_t offset;
        uint32_t length;
        uint32_t raw_length;
    };

    void begin();
    void flush_chunk();
    void write(const Bytes& bytes);

    std::string path_;
    ContainerHeader header_;
    Bytes key_;
    std::ofstream out_;
    State state_ = State::Opened;
    uint64_t finalization_offset_ = 0;
    uint64_t position_ = 0;
    uint64_t digits_written_ = 0;
    std::string pending_;
    std::vector<DirectoryEntry> directory_;
};

////////////////////////////////////////////////////////////////////////////////

struct ChunkFailure {
    uint64_t index = 0;
    std::string reason;
    std::string expected_digest;
    std::string actual_digest;
};

struct ReadResult {
    // Marks the positions of a chunk that failed; outside every base.
    static constexpr uint8_t MISSING = 0xff;

    // One entry per stored digit, so digits[i] is digit i of the container.
    // A failed chunk leaves its raw length of MISSING.
    std::vector<uint8_t> digits;
    std::vector<ChunkFailure> failures;

    bool ok() const { return failures.empty(); }
};

// Read side. Every read opens its own stream, so one reader may serve
// concurrent chunk fetches.
class ContainerReader {
public:
    // Throws ContainerFormatError for malformed files and
    // AuthenticationFailure for a missing or wrong password.
    explicit ContainerReader(const std::string& path, const std::string& password = "");

    const ContainerHeader& header() const { return header_; }
    ContainerState state() const { return state_; }
    bool complete() const { return state_ == ContainerState::Complete; }
    uint64_t total_digits() const { return total_digits_; }
    uint64_t chunk_count() const { return directory_.size(); }

    // Throws ChunkIntegrityFailure when the chunk fails authentication,
    // decompression or its digest check.
    std::vector<uint8_t> read_chunk(uint64_t index) const;

    // Digits [start, start + count). Throws InvalidRequest when the range
    // extends past total_digits().
    std::vector<uint8_t> read_digits(uint64_t start, uint64_t count) const;

    // Reads every chunk; failed chunks are reported, not thrown.
    ReadResult read_all() const;

    // The whole stream; the first failing chunk throws.
    DigitSequence to_sequence() const;

private:
    struct DirectoryEntry {
        uint64_t offset;
        uint32_t length;
        uint32_t raw_length;
    };

    void load_directory(std::ifstream& in, uint64_t offset, uint64_t chunks, uint64_t size);
    void scan_chunks(std::ifstream& in, uint64_t start);

    std::string path_;
    ContainerHeader header_;
    ContainerState state_ = ContainerState::Open;
    uint64_t total_digits_ = 0;
    Bytes key_;
    std::vector<DirectoryEntry> directory_;
};

} // namespace digitloom
