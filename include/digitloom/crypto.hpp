/**
 * Hashing, key derivation and authenticated encryption for the chunked
 * container, on top of OpenSSL's EVP interface.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace digitloom {

using Bytes = std::vector<uint8_t>;

enum class CipherId : uint8_t {
    None = 0,
    Aes256Gcm = 1,
    ChaCha20Poly1305 = 2
};

const char* cipher_name(CipherId cipher);
// "none", "aes-256-gcm", "chacha20-poly1305". Throws InvalidRequest.
CipherId parse_cipher(const std::string& name);
// Throws ContainerFormatError for unknown ids.
CipherId cipher_from_id(uint8_t id);

namespace crypto {

const size_t DIGEST_BYTES = 32;
const size_t KEY_BYTES = 32;
const size_t NONCE_BYTES = 12;
const size_t TAG_BYTES = 16;
const size_t SALT_BYTES = 16;
const size_t KEY_CHECK_BYTES = 16;

Bytes sha256(const uint8_t* data, size_t size);
inline Bytes sha256(const Bytes& data) { return sha256(data.data(), data.size()); }

std::string hex(const Bytes& data);

// Cryptographically secure random bytes. Throws CryptoError.
Bytes random_bytes(size_t size);

// Constant-time comparison.
bool equal(const Bytes& a, const Bytes& b);

struct ScryptParams {
    uint32_t log2_n = 14;
    uint32_t r = 8;
    uint32_t p = 1;
};

// 32-byte key from a password. Throws CryptoError.
Bytes derive_key(const std::string& password, const Bytes& salt, const ScryptParams& params);

// Stored in the container header; lets a reader reject a wrong password
// before any chunk is touched.
Bytes key_check(const Bytes& key);

struct Sealed {
    Bytes nonce;
    Bytes tag;
    Bytes ciphertext;
};

// Encrypts under a fresh random nonce. Throws CryptoError.
Sealed seal(CipherId cipher, const Bytes& key, const Bytes& plaintext, const Bytes& associated_data);

// False when the tag does not verify; plaintext is then left empty.
bool open(CipherId cipher, const Bytes& key, const Sealed& sealed, const Bytes& associated_data,
          Bytes& plaintext);

} // namespace crypto
} // namespace digitloom
