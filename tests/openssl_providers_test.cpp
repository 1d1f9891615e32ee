#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "crypto/factories.hpp"
#include "crypto/secure_random.hpp"
#include "encoding/hex.hpp"

namespace {
std::vector<std::uint8_t> bytes_of(const std::string &s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
} // namespace

// RFC 2202, test case 2
TEST(CryptoHmacSha1, MatchesPublishedVector) {
    auto signer = formsauth::make_hmac_sha1_signature_provider(bytes_of("Jefe"));
    const formsauth::Signature sig = signer->sign(bytes_of("what do ya want for nothing?"));
    EXPECT_EQ(sig.algorithm, formsauth::SigAlgorithm::HMAC_SHA1);
    EXPECT_EQ(formsauth::to_hex(sig.bytes), "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
}

TEST(CryptoHmacSha1, VerifyDetectsAnyByteChange) {
    auto signer = formsauth::make_hmac_sha1_signature_provider(bytes_of("key"));
    const std::vector<std::uint8_t> msg = bytes_of("message");
    formsauth::Signature sig = signer->sign(msg);
    EXPECT_TRUE(signer->verify(msg, sig));

    for (std::size_t i = 0; i < sig.bytes.size(); ++i) {
        formsauth::Signature bad = sig;
        bad.bytes[i] ^= 0x01;
        EXPECT_FALSE(signer->verify(msg, bad)) << "byte " << i;
    }

    formsauth::Signature short_sig = sig;
    short_sig.bytes.pop_back();
    EXPECT_FALSE(signer->verify(msg, short_sig));
}

TEST(CryptoHmacSha1, RejectsEmptyKey) {
    EXPECT_THROW(formsauth::make_hmac_sha1_signature_provider({}), std::invalid_argument);
}

// NIST SP 800-38A F.2.5, first block
TEST(CryptoAes256Cbc, MatchesPublishedVector) {
    const auto key = formsauth::from_hex(
        "603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4");
    const auto iv = formsauth::from_hex("000102030405060708090a0b0c0d0e0f");
    auto cipher = formsauth::make_aes256_cbc_provider(key, iv);

    const auto pt = formsauth::from_hex("6bc1bee22e409f96e93d7e117393172a");
    const std::vector<std::uint8_t> ct = cipher->encrypt(pt);

    // One block of data plus one block of PKCS#7 padding.
    ASSERT_EQ(ct.size(), 32u);
    const std::vector<std::uint8_t> first(ct.begin(), ct.begin() + 16);
    EXPECT_EQ(formsauth::to_hex(first), "f58c4c04d6e5f1ba779eabfb5f7bfbd6");
    EXPECT_EQ(cipher->decrypt(ct), pt);
}

TEST(CryptoAes256Cbc, DecryptRejectsPartialBlocks) {
    auto cipher = formsauth::make_aes256_cbc_provider(
        std::vector<std::uint8_t>(32, 0x11), std::vector<std::uint8_t>(16, 0x00));
    EXPECT_THROW(cipher->decrypt({}), std::runtime_error);
    EXPECT_THROW(cipher->decrypt(std::vector<std::uint8_t>(17, 0x00)), std::runtime_error);
}

TEST(CryptoAes256Cbc, RejectsWrongKeyOrIvSize) {
    EXPECT_THROW(formsauth::make_aes256_cbc_provider(
                     std::vector<std::uint8_t>(16, 0x00), std::vector<std::uint8_t>(16, 0x00)),
                 std::invalid_argument);
    EXPECT_THROW(formsauth::make_aes256_cbc_provider(
                     std::vector<std::uint8_t>(32, 0x00), std::vector<std::uint8_t>(12, 0x00)),
                 std::invalid_argument);
}

TEST(CryptoSecureRandom, ProducesRequestedLength) {
    EXPECT_TRUE(formsauth::random_bytes(0).empty());
    const auto a = formsauth::random_bytes(32);
    const auto b = formsauth::random_bytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
}

TEST(CryptoSecureRandom, ConstantTimeEqual) {
    EXPECT_TRUE(formsauth::constant_time_equal({}, {}));
    EXPECT_TRUE(formsauth::constant_time_equal({1, 2, 3}, {1, 2, 3}));
    EXPECT_FALSE(formsauth::constant_time_equal({1, 2, 3}, {1, 2, 4}));
    EXPECT_FALSE(formsauth::constant_time_equal({1, 2, 3}, {1, 2}));
}
