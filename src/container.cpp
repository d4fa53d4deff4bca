#include "digitloom/container.hpp"

#include <algorithm>
#include <cstring>

#include "digitloom/error.hpp"
#include "digitloom/logging.hpp"

namespace digitloom {

namespace {

const char MAGIC[8] = {'D', 'L', 'O', 'O', 'M', 'C', 'H', '2'};
const uint16_t FORMAT_VERSION = 2;
const uint8_t HASH_SHA256 = 1;
const uint8_t KDF_NONE = 0;
const uint8_t KDF_SCRYPT = 1;

const size_t PREAMBLE_BYTES = sizeof(MAGIC) + 2 + 4;
const size_t FINALIZATION_BYTES = 32;
const size_t FINALIZATION_CHECK_BYTES = 7;
// digest, raw length, payload length, compression, encryption
const size_t RECORD_FIXED_BYTES = crypto::DIGEST_BYTES + 4 + 4 + 1 + 1;
const size_t RECORD_AEAD_BYTES = crypto::NONCE_BYTES + crypto::TAG_BYTES;
const size_t DIRECTORY_ENTRY_BYTES = 8 + 4 + 4;
const uint32_t MAX_HEADER_BYTES = 1 << 20;

////////////////////////////////////////////////////////////////////////////////
//  Big-endian encoding

void put_u8(Bytes& out, uint8_t value) { out.push_back(value); }

void put_u16(Bytes& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

void put_u32(Bytes& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(value >> shift));
}

void put_u64(Bytes& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(value >> shift));
}

void put_bytes(Bytes& out, const Bytes& bytes) { out.insert(out.end(), bytes.begin(), bytes.end()); }

void put_string(Bytes& out, const std::string& text) {
    if (text.size() > 0xFFFF) throw InvalidRequest("header string longer than 65535 bytes");
    put_u16(out, static_cast<uint16_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
}

class Cursor {
public:
    Cursor(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    uint8_t u8() {
        need(1);
        return data_[pos_++];
    }

    uint16_t u16() {
        need(2);
        uint16_t value = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return value;
    }

    uint32_t u32() {
        need(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; i++) value = (value << 8) | data_[pos_++];
        return value;
    }

    uint64_t u64() {
        need(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; i++) value = (value << 8) | data_[pos_++];
        return value;
    }

    Bytes bytes(size_t count) {
        need(count);
        Bytes out(data_ + pos_, data_ + pos_ + count);
        pos_ += count;
        return out;
    }

    std::string string() {
        uint16_t length = u16();
        need(length);
        std::string out(reinterpret_cast<const char*>(data_ + pos_), length);
        pos_ += length;
        return out;
    }

    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }

private:
    void need(size_t count) const {
        if (count > size_ - pos_) throw ContainerFormatError("unexpected end of data");
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

Bytes read_exact(std::ifstream& in, size_t size, const char* what) {
    Bytes out(size);
    if (size > 0 && !in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size))) {
        throw ContainerFormatError(std::string("unexpected end of file reading ") + what);
    }
    return out;
}

uint64_t file_size(std::ifstream& in) {
    in.seekg(0, std::ios::end);
    uint64_t size = static_cast<uint64_t>(in.tellg());
    in.seekg(0, std::ios::beg);
    return size;
}

// Leading bytes of sha256(header digest | state | digits | chunks | directory
// offset); ties the block to its header and catches a flipped state.
Bytes finalization_check(const Bytes& header_digest, ContainerState state, uint64_t digits, uint64_t chunks,
                         uint64_t directory_offset) {
    Bytes input = header_digest;
    put_u8(input, static_cast<uint8_t>(state));
    put_u64(input, digits);
    put_u64(input, chunks);
    put_u64(input, directory_offset);
    Bytes check = crypto::sha256(input);
    check.resize(FINALIZATION_CHECK_BYTES);
    return check;
}

Bytes encode_finalization(const Bytes& header_digest, ContainerState state, uint64_t digits, uint64_t chunks,
                          uint64_t directory_offset) {
    Bytes out;
    put_u8(out, static_cast<uint8_t>(state));
    put_bytes(out, finalization_check(header_digest, state, digits, chunks, directory_offset));
    put_u64(out, digits);
    put_u64(out, chunks);
    put_u64(out, directory_offset);
    return out;
}

Bytes associated_data(const Bytes& header_digest, uint64_t index, uint32_t raw_length) {
    Bytes out = header_digest;
    put_u64(out, index);
    put_u32(out, raw_length);
    return out;
}

Base base_from_byte(uint8_t value) {
    if (value != 10 && value != 16) {
        throw ContainerFormatError("unsupported base in header", std::to_string(value));
    }
    return static_cast<Base>(value);
}

} // namespace

const char* container_state_name(ContainerState state) {
    switch (state) {
        case ContainerState::Open:      return "open";
        case ContainerState::Complete:  return "complete";
        case ContainerState::Truncated: return "truncated";
    }
    return "?";
}

uint64_t container_size(uint64_t digits, uint32_t chunk_size, size_t descriptor_bytes, size_t integer_bytes,
                        bool encrypted) {
    if (chunk_size == 0) throw InvalidRequest("chunk size must be positive");

    //  version, descriptor, base, sign, integer part, declared, chunk size,
    //  compression, encryption, hash, kdf, digest
    uint64_t header = 2 + (2 + descriptor_bytes) + 1 + 1 + (2 + integer_bytes) + 8 + 4 + 4 + crypto::DIGEST_BYTES;
    if (encrypted) header += crypto::SALT_BYTES + 1 + 4 + 4 + crypto::KEY_CHECK_BYTES;

    uint64_t chunks = (digits + chunk_size - 1) / chunk_size;
    uint64_t record = RECORD_FIXED_BYTES + (encrypted ? RECORD_AEAD_BYTES : 0);
    uint64_t directory = 8 + chunks * DIRECTORY_ENTRY_BYTES + crypto::DIGEST_BYTES;

    return PREAMBLE_BYTES + header + FINALIZATION_BYTES + chunks * record + digits + directory;
}

////////////////////////////////////////////////////////////////////////////////
//  Header

Bytes ContainerHeader::encode() {
    Bytes out;
    put_u16(out, version);
    put_string(out, descriptor);
    put_u8(out, static_cast<uint8_t>(radix(base)));
    put_u8(out, negative ? 1 : 0);
    put_string(out, integer_part);
    put_u64(out, declared_digits);
    put_u32(out, chunk_size);
    put_u8(out, static_cast<uint8_t>(compression));
    put_u8(out, static_cast<uint8_t>(cipher));
    put_u8(out, HASH_SHA256);
    if (encrypted()) {
        put_u8(out, KDF_SCRYPT);
        put_bytes(out, salt);
        put_u8(out, static_cast<uint8_t>(scrypt.log2_n));
        put_u32(out, scrypt.r);
        put_u32(out, scrypt.p);
        put_bytes(out, key_check);
    } else {
        put_u8(out, KDF_NONE);
    }

    digest = crypto::sha256(out);
    put_bytes(out, digest);
    return out;
}

ContainerHeader ContainerHeader::decode(const Bytes& bytes) {
    if (bytes.size() < crypto::DIGEST_BYTES) throw ContainerFormatError("header too short");

    size_t body = bytes.size() - crypto::DIGEST_BYTES;
    Bytes stored(bytes.begin() + static_cast<std::ptrdiff_t>(body), bytes.end());
    Bytes actual = crypto::sha256(bytes.data(), body);
    if (!crypto::equal(stored, actual)) {
        throw ContainerFormatError("header digest mismatch", crypto::hex(actual));
    }

    ContainerHeader out;
    Cursor in(bytes.data(), body);
    out.version = in.u16();
    if (out.version != FORMAT_VERSION) {
        throw ContainerFormatError("unsupported header version", std::to_string(out.version));
    }
    out.descriptor = in.string();
    out.base = base_from_byte(in.u8());
    out.negative = in.u8() != 0;
    out.integer_part = in.string();
    out.declared_digits = in.u64();
    out.chunk_size = in.u32();
    if (out.chunk_size == 0) throw ContainerFormatError("chunk size is zero");
    out.compression = compression_from_id(in.u8());
    out.cipher = cipher_from_id(in.u8());

    uint8_t hash = in.u8();
    if (hash != HASH_SHA256) throw ContainerFormatError("unknown hash id", std::to_string(hash));

    uint8_t kdf = in.u8();
    if (kdf == KDF_SCRYPT) {
        out.salt = in.bytes(crypto::SALT_BYTES);
        out.scrypt.log2_n = in.u8();
        out.scrypt.r = in.u32();
        out.scrypt.p = in.u32();
        out.key_check = in.bytes(crypto::KEY_CHECK_BYTES);
    } else if (kdf != KDF_NONE) {
        throw ContainerFormatError("unknown kdf id", std::to_string(kdf));
    }
    if ((kdf == KDF_SCRYPT) != out.encrypted()) {
        throw ContainerFormatError("key derivation does not match the encryption setting");
    }
    if (out.encrypted() && (out.scrypt.log2_n < 1 || out.scrypt.log2_n > 30 || out.scrypt.r == 0 ||
                            out.scrypt.p == 0)) {
        throw ContainerFormatError("scrypt parameters out of range");
    }
    if (in.remaining() != 0) throw ContainerFormatError("trailing bytes in header");

    out.digest = stored;
    return out;
}

////////////////////////////////////////////////////////////////////////////////
//  Writer

ContainerWriter::ContainerWriter(const std::string& path, const ContainerMetadata& metadata,
                                 const ContainerOptions& options, const EngineConfig& config)
    : path_(path) {
    if (options.chunk_size == 0) throw InvalidRequest("chunk size must be positive");
    if (options.cipher != CipherId::None && options.password.empty()) {
        throw InvalidRequest("encryption needs a password");
    }

    header_.version = FORMAT_VERSION;
    header_.descriptor = metadata.descriptor;
    header_.base = metadata.base;
    header_.negative = metadata.negative;
    header_.integer_part = metadata.integer_part;
    header_.declared_digits = metadata.declared_digits;
    header_.chunk_size = options.chunk_size;
    header_.compression = options.compression;
    header_.cipher = options.cipher;

    if (header_.encrypted()) {
        header_.scrypt.log2_n = config.scrypt_log2_n;
        header_.scrypt.r = config.scrypt_r;
        header_.scrypt.p = config.scrypt_p;
        header_.salt = crypto::random_bytes(crypto::SALT_BYTES);
        key_ = crypto::derive_key(options.password, header_.salt, header_.scrypt);
        header_.key_check = crypto::key_check(key_);
    }

    out_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out_) throw IoError("cannot create container", path_);

    logging::get()->debug("container {}: opened ({}, base {}, chunk size {}, {}, {})", path_,
                          header_.descriptor, radix(header_.base), header_.chunk_size,
                          compression_name(header_.compression), cipher_name(header_.cipher));
}

ContainerWriter::~ContainerWriter() {
    if (state_ == State::Closed) return;
    try {
        close(true);
    } catch (const std::exception& e) {
        logging::get()->error("container {}: finalizing on destruction failed: {}", path_, e.what());
    }
}

void ContainerWriter::write(const Bytes& bytes) {
    out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out_) throw IoError("write failed", path_);
    position_ += bytes.size();
}

void ContainerWriter::begin() {
    Bytes header = header_.encode();
    if (header.size() > MAX_HEADER_BYTES) throw InvalidRequest("container header too large");

    Bytes preamble(MAGIC, MAGIC + sizeof(MAGIC));
    put_u16(preamble, FORMAT_VERSION);
    put_u32(preamble, static_cast<uint32_t>(header.size()));
    put_bytes(preamble, header);
    write(preamble);

    finalization_offset_ = position_;
    write(encode_finalization(header_.digest, ContainerState::Open, 0, 0, 0));
    state_ = State::Writing;
}

void ContainerWriter::append(const uint8_t* digits, size_t count) {
    if (state_ == State::Closed) throw InvalidRequest("container is closed");
    if (!header_.unbounded() && digits_written_ + pending_.size() + count > header_.declared_digits) {
        throw InvalidRequest("more digits than the container declares (" +
                             std::to_string(header_.declared_digits) + ")");
    }
    for (size_t i = 0; i < count; i++) {
        if (digits[i] >= radix(header_.base)) {
            throw InvalidRequest("digit " + std::to_string(digits[i]) + " out of range for base " +
                                 std::to_string(radix(header_.base)));
        }
    }
    if (state_ == State::Opened) begin();

    for (size_t i = 0; i < count; i++) {
        pending_ += digit_char(digits[i]);
        if (pending_.size() == header_.chunk_size) flush_chunk();
    }
}

void ContainerWriter::flush_chunk() {
    if (pending_.empty()) return;

    uint64_t index = directory_.size();
    uint32_t raw_length = static_cast<uint32_t>(pending_.size());
    Bytes raw(pending_.begin(), pending_.end());
    Bytes digest = crypto::sha256(raw);

    Bytes payload = header_.compression == CompressionId::Gzip ? gzip_compress(raw) : raw;

    crypto::Sealed sealed;
    if (header_.encrypted()) {
        sealed = crypto::seal(header_.cipher, key_, payload,
                              associated_data(header_.digest, index, raw_length));
        payload.swap(sealed.ciphertext);
    }

    Bytes record;
    record.reserve(RECORD_FIXED_BYTES + RECORD_AEAD_BYTES + payload.size());
    put_bytes(record, digest);
    put_u32(record, raw_length);
    put_u32(record, static_cast<uint32_t>(payload.size()));
    put_u8(record, static_cast<uint8_t>(header_.compression));
    put_u8(record, static_cast<uint8_t>(header_.cipher));
    if (header_.encrypted()) {
        put_bytes(record, sealed.nonce);
        put_bytes(record, sealed.tag);
    }
    put_bytes(record, payload);

    DirectoryEntry entry{position_, static_cast<uint32_t>(record.size()), raw_length};
    write(record);
    out_.flush();

    directory_.push_back(entry);
    digits_written_ += raw_length;
    pending_.clear();
}

void ContainerWriter::close(bool truncated) {
    if (state_ == State::Closed) return;
    if (state_ == State::Opened) begin();
    flush_chunk();

    uint64_t directory_offset = position_;
    Bytes entries;
    for (const DirectoryEntry& entry : directory_) {
        put_u64(entries, entry.offset);
        put_u32(entries, entry.length);
        put_u32(entries, entry.raw_length);
    }
    Bytes directory;
    put_u64(directory, directory_.size());
    put_bytes(directory, entries);
    put_bytes(directory, crypto::sha256(entries));
    write(directory);

    ContainerState final_state = ContainerState::Complete;
    if (truncated || (!header_.unbounded() && digits_written_ < header_.declared_digits)) {
        final_state = ContainerState::Truncated;
    }

    out_.seekp(static_cast<std::streamoff>(finalization_offset_));
    write(encode_finalization(header_.digest, final_state, digits_written_, directory_.size(), directory_offset));
    out_.close();
    if (out_.fail()) throw IoError("closing container failed", path_);
    state_ = State::Closed;

    auto log = logging::get();
    if (final_state == ContainerState::Truncated) {
        log->warn("container {}: closed truncated at {} digits in {} chunks", path_, digits_written_,
                  directory_.size());
    } else {
        log->info("container {}: closed, {} digits in {} chunks", path_, digits_written_, directory_.size());
    }
}

////////////////////////////////////////////////////////////////////////////////
//  Reader

ContainerReader::ContainerReader(const std::string& path, const std::string& password) : path_(path) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw IoError("cannot open container", path_);
    uint64_t size = file_size(in);

    Bytes preamble = read_exact(in, PREAMBLE_BYTES, "preamble");
    if (std::memcmp(preamble.data(), MAGIC, sizeof(MAGIC)) != 0) {
        throw ContainerFormatError("not a dloom container", path_);
    }
    Cursor fields(preamble.data() + sizeof(MAGIC), preamble.size() - sizeof(MAGIC));
    uint16_t version = fields.u16();
    if (version != FORMAT_VERSION) {
        throw ContainerFormatError("unsupported container version", std::to_string(version));
    }
    uint32_t header_length = fields.u32();
    if (header_length > MAX_HEADER_BYTES) throw ContainerFormatError("header length out of range");

    header_ = ContainerHeader::decode(read_exact(in, header_length, "header"));

    Bytes final_block = read_exact(in, FINALIZATION_BYTES, "finalization block");
    Cursor final_fields(final_block.data(), final_block.size());
    uint8_t state = final_fields.u8();
    if (state > static_cast<uint8_t>(ContainerState::Truncated)) {
        throw ContainerFormatError("unknown container state", std::to_string(state));
    }
    state_ = static_cast<ContainerState>(state);
    Bytes check = final_fields.bytes(FINALIZATION_CHECK_BYTES);
    uint64_t digits = final_fields.u64();
    uint64_t chunks = final_fields.u64();
    uint64_t directory_offset = final_fields.u64();
    if (!crypto::equal(check, finalization_check(header_.digest, state_, digits, chunks, directory_offset))) {
        throw ContainerFormatError("finalization block check mismatch");
    }

    if (header_.encrypted()) {
        if (password.empty()) throw AuthenticationFailure("container is encrypted; a password is required");
        key_ = crypto::derive_key(password, header_.salt, header_.scrypt);
        if (!crypto::equal(crypto::key_check(key_), header_.key_check)) {
            key_.clear();
            throw AuthenticationFailure("wrong password");
        }
    }

    uint64_t chunks_start = PREAMBLE_BYTES + header_length + FINALIZATION_BYTES;
    if (state_ == ContainerState::Open) {
        scan_chunks(in, chunks_start);
        logging::get()->warn("container {}: not closed; recovered {} chunks ({} digits) by scanning", path_,
                             directory_.size(), total_digits_);
    } else {
        if (directory_offset < chunks_start || directory_offset > size) {
            throw ContainerFormatError("directory offset out of range");
        }
        load_directory(in, directory_offset, chunks, size);
        if (total_digits_ != digits) {
            throw ContainerFormatError("directory disagrees with the recorded digit count",
                                       std::to_string(total_digits_) + " != " + std::to_string(digits));
        }
    }

    for (size_t i = 0; i < directory_.size(); i++) {
        bool last = i + 1 == directory_.size();
        uint32_t raw = directory_[i].raw_length;
        if (raw == 0 || raw > header_.chunk_size || (!last && raw != header_.chunk_size)) {
            throw ContainerFormatError("chunk length breaks the fixed chunk size", "chunk " + std::to_string(i));
        }
    }
    if (!header_.unbounded() && total_digits_ > header_.declared_digits) {
        throw ContainerFormatError("more digits than declared");
    }
    if (state_ == ContainerState::Complete && !header_.unbounded() && total_digits_ != header_.declared_digits) {
        throw ContainerFormatError("marked complete but short of the declared digits",
                                   std::to_string(total_digits_) + " of " + std::to_string(header_.declared_digits));
    }
}

void ContainerReader::load_directory(std::ifstream& in, uint64_t offset, uint64_t chunks, uint64_t size) {
    if (size - offset < 8 + crypto::DIGEST_BYTES) throw ContainerFormatError("directory truncated");
    in.seekg(static_cast<std::streamoff>(offset));
    Bytes count_bytes = read_exact(in, 8, "directory");
    uint64_t count = Cursor(count_bytes.data(), count_bytes.size()).u64();
    if (count != chunks) {
        throw ContainerFormatError("directory chunk count mismatch",
                                   std::to_string(count) + " != " + std::to_string(chunks));
    }
    if (count > (size - offset - 8 - crypto::DIGEST_BYTES) / DIRECTORY_ENTRY_BYTES) {
        throw ContainerFormatError("directory larger than the file", std::to_string(count) + " entries");
    }

    Bytes entries = read_exact(in, count * DIRECTORY_ENTRY_BYTES, "directory entries");
    Bytes stored = read_exact(in, crypto::DIGEST_BYTES, "directory digest");
    if (!crypto::equal(stored, crypto::sha256(entries))) {
        throw ContainerFormatError("directory digest mismatch");
    }

    Cursor cursor(entries.data(), entries.size());
    directory_.reserve(count);
    total_digits_ = 0;
    for (uint64_t i = 0; i < count; i++) {
        DirectoryEntry entry;
        entry.offset = cursor.u64();
        entry.length = cursor.u32();
        entry.raw_length = cursor.u32();
        if (entry.offset > offset || entry.length > offset - entry.offset) {
            throw ContainerFormatError("chunk record overlaps the directory", "chunk " + std::to_string(i));
        }
        directory_.push_back(entry);
        total_digits_ += entry.raw_length;
    }
}

void ContainerReader::scan_chunks(std::ifstream& in, uint64_t start) {
    uint64_t size = file_size(in);
    uint64_t position = start;
    total_digits_ = 0;

    while (position + RECORD_FIXED_BYTES <= size) {
        in.seekg(static_cast<std::streamoff>(position));
        Bytes fixed = read_exact(in, RECORD_FIXED_BYTES, "chunk record");
        Cursor cursor(fixed.data() + crypto::DIGEST_BYTES, fixed.size() - crypto::DIGEST_BYTES);
        uint32_t raw_length = cursor.u32();
        uint32_t payload_length = cursor.u32();
        cursor.u8();
        uint8_t encryption = cursor.u8();

        uint64_t length = RECORD_FIXED_BYTES + (encryption != 0 ? RECORD_AEAD_BYTES : 0) + payload_length;
        // A record cut short by a crash ends the recoverable prefix.
        if (position + length > size) break;

        directory_.push_back(DirectoryEntry{position, static_cast<uint32_t>(length), raw_length});
        total_digits_ += raw_length;
        position += length;
    }
}

std::vector<uint8_t> ContainerReader::read_chunk(uint64_t index) const {
    if (index >= directory_.size()) {
        throw InvalidRequest("chunk " + std::to_string(index) + " out of range (" +
                             std::to_string(directory_.size()) + " chunks)");
    }
    const DirectoryEntry& entry = directory_[index];

    std::ifstream in(path_, std::ios::binary);
    if (!in) throw IoError("cannot open container", path_);
    in.seekg(static_cast<std::streamoff>(entry.offset));
    Bytes record(entry.length);
    if (!in.read(reinterpret_cast<char*>(record.data()), static_cast<std::streamsize>(record.size()))) {
        throw ChunkIntegrityFailure(index, "record truncated");
    }

    Bytes expected;
    crypto::Sealed sealed;
    uint32_t raw_length = 0;
    try {
        Cursor cursor(record.data(), record.size());
        expected = cursor.bytes(crypto::DIGEST_BYTES);
        raw_length = cursor.u32();
        uint32_t payload_length = cursor.u32();
        uint8_t compression = cursor.u8();
        uint8_t encryption = cursor.u8();

        if (raw_length != entry.raw_length) {
            throw ChunkIntegrityFailure(index, "raw length disagrees with the directory");
        }
        if (compression != static_cast<uint8_t>(header_.compression) ||
            encryption != static_cast<uint8_t>(header_.cipher)) {
            throw ChunkIntegrityFailure(index, "chunk flags disagree with the header");
        }
        if (header_.encrypted()) {
            sealed.nonce = cursor.bytes(crypto::NONCE_BYTES);
            sealed.tag = cursor.bytes(crypto::TAG_BYTES);
        }
        if (payload_length != cursor.remaining()) {
            throw ChunkIntegrityFailure(index, "payload length disagrees with the record size");
        }
        sealed.ciphertext = cursor.bytes(payload_length);
    } catch (const ContainerFormatError& e) {
        throw ChunkIntegrityFailure(index, e.what());
    }

    Bytes payload;
    if (header_.encrypted()) {
        if (!crypto::open(header_.cipher, key_, sealed, associated_data(header_.digest, index, raw_length),
                          payload)) {
            throw ChunkIntegrityFailure(index, "authentication tag mismatch");
        }
    } else {
        payload.swap(sealed.ciphertext);
    }

    Bytes raw;
    if (header_.compression == CompressionId::Gzip) {
        try {
            raw = gzip_decompress(payload, raw_length);
        } catch (const ContainerFormatError& e) {
            throw ChunkIntegrityFailure(index, std::string("decompression failed: ") + e.what());
        }
    } else {
        raw.swap(payload);
    }
    if (raw.size() != raw_length) {
        throw ChunkIntegrityFailure(index, "payload size disagrees with the raw length");
    }

    Bytes actual = crypto::sha256(raw);
    if (!crypto::equal(expected, actual)) {
        throw ChunkIntegrityFailure(index, "digest mismatch", crypto::hex(expected), crypto::hex(actual));
    }

    std::vector<uint8_t> digits(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        if (!digit_value(static_cast<char>(raw[i]), header_.base, digits[i])) {
            throw ChunkIntegrityFailure(index, "digit out of range at " + std::to_string(i));
        }
    }
    return digits;
}

std::vector<uint8_t> ContainerReader::read_digits(uint64_t start, uint64_t count) const {
    if (count > total_digits_ || start > total_digits_ - count) {
        throw InvalidRequest("digits [" + std::to_string(start) + ", +" + std::to_string(count) +
                             ") past the end (" + std::to_string(total_digits_) + " digits)");
    }

    std::vector<uint8_t> out;
    out.reserve(count);
    uint64_t position = start;
    while (out.size() < count) {
        uint64_t index = position / header_.chunk_size;
        uint64_t offset = position % header_.chunk_size;
        std::vector<uint8_t> chunk = read_chunk(index);
        uint64_t take = std::min<uint64_t>(chunk.size() - offset, count - out.size());
        out.insert(out.end(), chunk.begin() + static_cast<std::ptrdiff_t>(offset),
                   chunk.begin() + static_cast<std::ptrdiff_t>(offset + take));
        position += take;
    }
    return out;
}

ReadResult ContainerReader::read_all() const {
    ReadResult out;
    out.digits.reserve(total_digits_);
    for (uint64_t i = 0; i < directory_.size(); i++) {
        try {
            std::vector<uint8_t> chunk = read_chunk(i);
            out.digits.insert(out.digits.end(), chunk.begin(), chunk.end());
        } catch (const ChunkIntegrityFailure& e) {
            logging::get()->error("container {}: chunk {} failed: {}", path_, i, e.reason());
            out.digits.insert(out.digits.end(), directory_[i].raw_length, ReadResult::MISSING);
            out.failures.push_back(ChunkFailure{e.chunk_index(), e.reason(), e.expected_digest(), e.actual_digest()});
        }
    }
    return out;
}

DigitSequence ContainerReader::to_sequence() const {
    DigitSequence out;
    out.base = header_.base;
    out.negative = header_.negative;
    out.integer_part = header_.integer_part;
    out.digits.reserve(total_digits_);
    for (uint64_t i = 0; i < directory_.size(); i++) {
        std::vector<uint8_t> chunk = read_chunk(i);
        out.digits.insert(out.digits.end(), chunk.begin(), chunk.end());
    }
    out.complete = complete();
    return out;
}

} // namespace digitloom
