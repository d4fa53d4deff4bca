#include <string>

#include <gtest/gtest.h>

#include "digitloom/compression.hpp"
#include "digitloom/crypto.hpp"
#include "digitloom/error.hpp"
#include "test_support.hpp"

using namespace digitloom;

namespace {

Bytes bytes_of(const std::string& text) { return Bytes(text.begin(), text.end()); }

} // namespace

class CryptoTest : public test::DigitloomTest {
protected:
    crypto::ScryptParams cheap() {
        crypto::ScryptParams params;
        params.log2_n = 10;
        return params;
    }
};

TEST_F(CryptoTest, Sha256KnownAnswer) {
    EXPECT_EQ(crypto::hex(crypto::sha256(bytes_of("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(crypto::sha256(Bytes()).size(), crypto::DIGEST_BYTES);
}

TEST_F(CryptoTest, ConstantTimeEqual) {
    EXPECT_TRUE(crypto::equal(bytes_of("same"), bytes_of("same")));
    EXPECT_FALSE(crypto::equal(bytes_of("same"), bytes_of("sane")));
    EXPECT_FALSE(crypto::equal(bytes_of("short"), bytes_of("longer")));
}

TEST_F(CryptoTest, RandomBytesDiffer) {
    Bytes a = crypto::random_bytes(32);
    Bytes b = crypto::random_bytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
}

TEST_F(CryptoTest, KeyDerivationIsDeterministic) {
    Bytes salt(crypto::SALT_BYTES, 7);
    Bytes k1 = crypto::derive_key("correct horse", salt, cheap());
    Bytes k2 = crypto::derive_key("correct horse", salt, cheap());
    Bytes k3 = crypto::derive_key("wrong horse", salt, cheap());
    EXPECT_EQ(k1.size(), crypto::KEY_BYTES);
    EXPECT_EQ(k1, k2);
    EXPECT_NE(k1, k3);

    EXPECT_EQ(crypto::key_check(k1).size(), crypto::KEY_CHECK_BYTES);
    EXPECT_FALSE(crypto::equal(crypto::key_check(k1), crypto::key_check(k3)));
}

TEST_F(CryptoTest, SealAndOpen) {
    Bytes key = crypto::derive_key("pw", Bytes(crypto::SALT_BYTES, 1), cheap());
    Bytes plaintext = bytes_of("31415926535897932384");
    Bytes ad = bytes_of("chunk 0");

    for (CipherId cipher : {CipherId::Aes256Gcm, CipherId::ChaCha20Poly1305}) {
        SCOPED_TRACE(cipher_name(cipher));
        crypto::Sealed sealed = crypto::seal(cipher, key, plaintext, ad);
        EXPECT_EQ(sealed.nonce.size(), crypto::NONCE_BYTES);
        EXPECT_EQ(sealed.tag.size(), crypto::TAG_BYTES);
        EXPECT_NE(sealed.ciphertext, plaintext);

        Bytes opened;
        ASSERT_TRUE(crypto::open(cipher, key, sealed, ad, opened));
        EXPECT_EQ(opened, plaintext);

        Bytes out;
        EXPECT_FALSE(crypto::open(cipher, key, sealed, bytes_of("chunk 1"), out));
        EXPECT_TRUE(out.empty());

        crypto::Sealed tampered = sealed;
        tampered.ciphertext[3] ^= 0x01;
        EXPECT_FALSE(crypto::open(cipher, key, tampered, ad, out));
    }
}

TEST_F(CryptoTest, CipherNames) {
    EXPECT_EQ(parse_cipher("none"), CipherId::None);
    EXPECT_EQ(parse_cipher("aes-256-gcm"), CipherId::Aes256Gcm);
    EXPECT_EQ(parse_cipher("chacha20-poly1305"), CipherId::ChaCha20Poly1305);
    EXPECT_THROW(parse_cipher("rot13"), InvalidRequest);
    EXPECT_EQ(cipher_from_id(2), CipherId::ChaCha20Poly1305);
    EXPECT_THROW(cipher_from_id(9), ContainerFormatError);
}

TEST_F(CryptoTest, GzipRoundTrip) {
    Bytes raw(10000, '7');
    Bytes packed = gzip_compress(raw);
    EXPECT_LT(packed.size(), raw.size());
    ASSERT_GE(packed.size(), 2u);
    EXPECT_EQ(packed[0], 0x1f);
    EXPECT_EQ(packed[1], 0x8b);
    EXPECT_EQ(gzip_decompress(packed, raw.size()), raw);
}

TEST_F(CryptoTest, GzipRejectsDamage) {
    Bytes raw = bytes_of("1415926535897932384626433832795028841971");
    Bytes packed = gzip_compress(raw);
    EXPECT_THROW(gzip_decompress(packed, raw.size() + 1), ContainerFormatError);

    Bytes damaged = packed;
    damaged[damaged.size() / 2] ^= 0xff;
    EXPECT_THROW(gzip_decompress(damaged, raw.size()), ContainerFormatError);
    EXPECT_THROW(gzip_decompress(bytes_of("not gzip"), 8), ContainerFormatError);

    EXPECT_EQ(parse_compression("gzip"), CompressionId::Gzip);
    EXPECT_THROW(parse_compression("zstd"), InvalidRequest);
    EXPECT_THROW(compression_from_id(5), ContainerFormatError);
}
