#include "digitloom/crypto.hpp"

#include <memory>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "digitloom/error.hpp"

namespace digitloom {

namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

[[noreturn]] void fail(const std::string& what) {
    unsigned long code = ERR_get_error();
    std::string message = what;
    if (code != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
    }
    throw CryptoError(message);
}

const EVP_CIPHER* evp_cipher(CipherId cipher) {
    switch (cipher) {
        case CipherId::Aes256Gcm:        return EVP_aes_256_gcm();
        case CipherId::ChaCha20Poly1305: return EVP_chacha20_poly1305();
        case CipherId::None:             break;
    }
    throw CryptoError("no cipher selected");
}

CipherContext start(CipherId cipher, const Bytes& key, const Bytes& nonce, bool encrypt) {
    if (key.size() != crypto::KEY_BYTES) throw CryptoError("key must be 32 bytes");
    if (nonce.size() != crypto::NONCE_BYTES) throw CryptoError("nonce must be 12 bytes");

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) fail("EVP_CIPHER_CTX_new");

    int enc = encrypt ? 1 : 0;
    if (EVP_CipherInit_ex(ctx.get(), evp_cipher(cipher), nullptr, nullptr, nullptr, enc) != 1) {
        fail("cipher init");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1) {
        fail("set nonce length");
    }
    if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1) {
        fail("cipher key setup");
    }
    return ctx;
}

void add_associated_data(EVP_CIPHER_CTX* ctx, const Bytes& associated_data) {
    if (associated_data.empty()) return;
    int written = 0;
    if (EVP_CipherUpdate(ctx, nullptr, &written, associated_data.data(),
                         static_cast<int>(associated_data.size())) != 1) {
        fail("associated data");
    }
}

} // namespace

const char* cipher_name(CipherId cipher) {
    switch (cipher) {
        case CipherId::None:             return "none";
        case CipherId::Aes256Gcm:        return "aes-256-gcm";
        case CipherId::ChaCha20Poly1305: return "chacha20-poly1305";
    }
    return "?";
}

CipherId parse_cipher(const std::string& name) {
    if (name == "none" || name.empty()) return CipherId::None;
    if (name == "aes-256-gcm" || name == "aes") return CipherId::Aes256Gcm;
    if (name == "chacha20-poly1305" || name == "chacha20") return CipherId::ChaCha20Poly1305;
    throw InvalidRequest("unknown cipher '" + name + "'");
}

CipherId cipher_from_id(uint8_t id) {
    switch (id) {
        case 0: return CipherId::None;
        case 1: return CipherId::Aes256Gcm;
        case 2: return CipherId::ChaCha20Poly1305;
    }
    throw ContainerFormatError("unknown encryption id", std::to_string(id));
}

namespace crypto {

Bytes sha256(const uint8_t* data, size_t size) {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) fail("EVP_MD_CTX_new");

    Bytes out(DIGEST_BYTES);
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1) {
        fail("sha256");
    }
    out.resize(length);
    return out;
}

std::string hex(const Bytes& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out += digits[byte >> 4];
        out += digits[byte & 15];
    }
    return out;
}

Bytes random_bytes(size_t size) {
    Bytes out(size);
    if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
        fail("RAND_bytes");
    }
    return out;
}

bool equal(const Bytes& a, const Bytes& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

Bytes derive_key(const std::string& password, const Bytes& salt, const ScryptParams& params) {
    uint64_t n = uint64_t(1) << params.log2_n;
    //  scrypt needs 128 r N bytes for V plus 128 r p for B
    uint64_t max_memory = 128ULL * params.r * (n + params.p + 2) + (1ULL << 20);

    Bytes key(KEY_BYTES);
    if (EVP_PBE_scrypt(password.data(), password.size(), salt.data(), salt.size(), n, params.r,
                       params.p, max_memory, key.data(), key.size()) != 1) {
        fail("scrypt");
    }
    return key;
}

Bytes key_check(const Bytes& key) {
    static const char label[] = "digitloom key check v2";
    Bytes input(label, label + sizeof(label) - 1);
    input.insert(input.end(), key.begin(), key.end());
    Bytes digest = sha256(input);
    digest.resize(KEY_CHECK_BYTES);
    return digest;
}

Sealed seal(CipherId cipher, const Bytes& key, const Bytes& plaintext, const Bytes& associated_data) {
    Sealed out;
    out.nonce = random_bytes(NONCE_BYTES);
    CipherContext ctx = start(cipher, key, out.nonce, true);
    add_associated_data(ctx.get(), associated_data);

    out.ciphertext.resize(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int written = 0;
    if (!plaintext.empty() &&
        EVP_CipherUpdate(ctx.get(), out.ciphertext.data(), &written, plaintext.data(),
                         static_cast<int>(plaintext.size())) != 1) {
        fail("encrypt");
    }
    int tail = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.ciphertext.data() + written, &tail) != 1) {
        fail("encrypt final");
    }
    out.ciphertext.resize(static_cast<size_t>(written + tail));

    out.tag.resize(TAG_BYTES);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_BYTES), out.tag.data()) != 1) {
        fail("get tag");
    }
    return out;
}

bool open(CipherId cipher, const Bytes& key, const Sealed& sealed, const Bytes& associated_data,
          Bytes& plaintext) {
    plaintext.clear();
    if (sealed.tag.size() != TAG_BYTES) return false;

    CipherContext ctx = start(cipher, key, sealed.nonce, false);
    add_associated_data(ctx.get(), associated_data);

    Bytes out(sealed.ciphertext.size() + EVP_MAX_BLOCK_LENGTH);
    int written = 0;
    if (!sealed.ciphertext.empty() &&
        EVP_CipherUpdate(ctx.get(), out.data(), &written, sealed.ciphertext.data(),
                         static_cast<int>(sealed.ciphertext.size())) != 1) {
        fail("decrypt");
    }

    Bytes tag = sealed.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
        fail("set tag");
    }
    int tail = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.data() + written, &tail) != 1) {
        //  Tag mismatch; drop the queued error so it does not leak into
        //  an unrelated later failure message.
        ERR_clear_error();
        return false;
    }
    out.resize(static_cast<size_t>(written + tail));
    plaintext.swap(out);
    return true;
}

} // namespace crypto
} // namespace digitloom
