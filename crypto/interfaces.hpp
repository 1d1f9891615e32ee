#pragma once

#include "algorithms.hpp"

#include <memory>
#include <vector>

namespace formsauth {

// Keyed integrity tag over an arbitrary message. Implementations hold their
// key from construction and must be safe to call concurrently.
class SignatureProvider {
public:
    virtual ~SignatureProvider() = default;

    virtual SigAlgorithm algorithm() const = 0;

    virtual std::size_t signature_size() const = 0;

    virtual Signature sign(const std::vector<std::uint8_t> &msg) const = 0;

    // Recomputes the tag and compares in constant time.
    virtual bool verify(const std::vector<std::uint8_t> &msg,
                        const Signature &sig) const = 0;
};

// Symmetric cipher bound to a fixed key and IV.
class CipherProvider {
public:
    virtual ~CipherProvider() = default;

    virtual CipherAlgorithm algorithm() const = 0;

    virtual std::size_t key_size() const = 0;   // bytes, e.g. 32 for AES-256
    virtual std::size_t iv_size() const = 0;    // bytes, e.g. 16 for CBC
    virtual std::size_t block_size() const = 0; // bytes, 16 for AES

    virtual std::vector<std::uint8_t> encrypt(
        const std::vector<std::uint8_t> &plaintext) const = 0;

    // Throws std::runtime_error when the ciphertext is not a valid
    // encryption under this key (bad length or padding).
    virtual std::vector<std::uint8_t> decrypt(
        const std::vector<std::uint8_t> &ciphertext) const = 0;
};

struct CryptoSuite {
    std::unique_ptr<SignatureProvider> signer; // must not be null
    std::unique_ptr<CipherProvider>    cipher; // must not be null
};

} // namespace formsauth
