#include "interfaces.hpp"
#include "factories.hpp"
#include "secure_random.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <string>

namespace formsauth {

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *p) const { EVP_MD_CTX_free(p); }
};

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX *p) const { EVP_CIPHER_CTX_free(p); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

class HmacSha1SignatureProvider : public SignatureProvider {
public:
    explicit HmacSha1SignatureProvider(const std::vector<std::uint8_t> &key) {
        if (key.empty()) {
            throw std::invalid_argument("HMAC-SHA1 key must not be empty");
        }
        EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key(
            EVP_PKEY_HMAC, nullptr, key.data(), key.size());
        if (!pkey) {
            throw std::runtime_error("EVP_PKEY_new_raw_private_key(HMAC) failed");
        }
        key_.reset(pkey);
    }

    SigAlgorithm algorithm() const override { return SigAlgorithm::HMAC_SHA1; }

    std::size_t signature_size() const override { return 20; }

    Signature sign(const std::vector<std::uint8_t> &msg) const override {
        MdCtxPtr mdctx(EVP_MD_CTX_new());
        if (!mdctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }

        if (EVP_DigestSignInit(mdctx.get(), nullptr, EVP_sha1(), nullptr, key_.get()) != 1) {
            throw std::runtime_error("EVP_DigestSignInit(HMAC-SHA1) failed");
        }
        if (!msg.empty() &&
            EVP_DigestSignUpdate(mdctx.get(), msg.data(), msg.size()) != 1) {
            throw std::runtime_error("EVP_DigestSignUpdate failed");
        }

        Signature sig;
        sig.algorithm = SigAlgorithm::HMAC_SHA1;
        sig.bytes.resize(signature_size());
        size_t siglen = sig.bytes.size();
        if (EVP_DigestSignFinal(mdctx.get(), sig.bytes.data(), &siglen) != 1 ||
            siglen != signature_size()) {
            throw std::runtime_error("EVP_DigestSignFinal failed");
        }
        return sig;
    }

    bool verify(const std::vector<std::uint8_t> &msg,
                const Signature &sig) const override {
        if (sig.algorithm != SigAlgorithm::HMAC_SHA1) {
            return false;
        }
        return constant_time_equal(sign(msg).bytes, sig.bytes);
    }

private:
    std::unique_ptr<EVP_PKEY, PKeyDeleter> key_;
};

class Aes256CbcProvider : public CipherProvider {
public:
    Aes256CbcProvider(const std::vector<std::uint8_t> &key,
                      const std::vector<std::uint8_t> &iv)
        : key_(key), iv_(iv) {
        if (key_.size() != key_size() || iv_.size() != iv_size()) {
            throw std::invalid_argument("AES-256-CBC key/iv size mismatch");
        }
    }

    CipherAlgorithm algorithm() const override { return CipherAlgorithm::AES_256_CBC; }

    std::size_t key_size() const override { return 32; }
    std::size_t iv_size() const override { return 16; }
    std::size_t block_size() const override { return 16; }

    std::vector<std::uint8_t> encrypt(
        const std::vector<std::uint8_t> &plaintext) const override {
        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        }

        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                               key_.data(), iv_.data()) != 1) {
            throw std::runtime_error("AES-256-CBC init failed");
        }

        // PKCS#7 padding adds at most one block.
        std::vector<std::uint8_t> ciphertext(plaintext.size() + block_size());
        int len = 0;
        int out_len = 0;
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                                  plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
                throw std::runtime_error("AES-256-CBC encrypt failed");
            }
            out_len = len;
        }

        if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + out_len, &len) != 1) {
            throw std::runtime_error("AES-256-CBC final failed");
        }
        out_len += len;
        ciphertext.resize(static_cast<std::size_t>(out_len));
        return ciphertext;
    }

    std::vector<std::uint8_t> decrypt(
        const std::vector<std::uint8_t> &ciphertext) const override {
        if (ciphertext.empty() || ciphertext.size() % block_size() != 0) {
            throw std::runtime_error("AES-256-CBC ciphertext is not a whole number of blocks");
        }

        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        }

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                               key_.data(), iv_.data()) != 1) {
            throw std::runtime_error("AES-256-CBC decrypt init failed");
        }

        std::vector<std::uint8_t> plaintext(ciphertext.size() + block_size());
        int len = 0;
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            throw std::runtime_error("AES-256-CBC decrypt failed");
        }
        int out_len = len;

        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + out_len, &len) != 1) {
            throw std::runtime_error("AES-256-CBC padding check failed");
        }
        out_len += len;
        plaintext.resize(static_cast<std::size_t>(out_len));
        return plaintext;
    }

private:
    std::vector<std::uint8_t> key_;
    std::vector<std::uint8_t> iv_;
};

} // namespace

std::unique_ptr<SignatureProvider> make_hmac_sha1_signature_provider(
    const std::vector<std::uint8_t> &key) {
    return std::make_unique<HmacSha1SignatureProvider>(key);
}

std::unique_ptr<CipherProvider> make_aes256_cbc_provider(
    const std::vector<std::uint8_t> &key,
    const std::vector<std::uint8_t> &iv) {
    return std::make_unique<Aes256CbcProvider>(key, iv);
}

std::unique_ptr<SignatureProvider> make_signature_provider(
    const ValidationMethod &method,
    const std::vector<std::uint8_t> &key) {
    switch (method.algorithm) {
    case SigAlgorithm::HMAC_SHA1:
        return make_hmac_sha1_signature_provider(key);
    }
    throw std::invalid_argument("unsupported validation method: " + method.name);
}

std::unique_ptr<CipherProvider> make_cipher_provider(
    const DecryptionMethod &method,
    const std::vector<std::uint8_t> &key,
    const std::vector<std::uint8_t> &iv) {
    switch (method.algorithm) {
    case CipherAlgorithm::AES_256_CBC:
        return make_aes256_cbc_provider(key, iv);
    }
    throw std::invalid_argument("unsupported decryption method: " + method.name);
}

} // namespace formsauth
