#pragma once

#include "interfaces.hpp"

namespace formsauth {

// OpenSSL-backed factories
std::unique_ptr<SignatureProvider> make_hmac_sha1_signature_provider(
    const std::vector<std::uint8_t> &key);
std::unique_ptr<CipherProvider>    make_aes256_cbc_provider(
    const std::vector<std::uint8_t> &key,
    const std::vector<std::uint8_t> &iv);

// Dispatch on a resolved method; throws std::invalid_argument on key or IV
// size mismatch.
std::unique_ptr<SignatureProvider> make_signature_provider(
    const ValidationMethod &method,
    const std::vector<std::uint8_t> &key);
std::unique_ptr<CipherProvider>    make_cipher_provider(
    const DecryptionMethod &method,
    const std::vector<std::uint8_t> &key,
    const std::vector<std::uint8_t> &iv);

} // namespace formsauth
