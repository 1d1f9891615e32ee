#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace formsauth {

enum class SigAlgorithm {
    HMAC_SHA1
};

enum class CipherAlgorithm {
    AES_256_CBC
};

// Fixed sizes for a signature method. signature_size is the exact length of
// the tag appended to every ticket.
struct ValidationMethod {
    std::string  name;
    SigAlgorithm algorithm;
    std::size_t  signature_size;
};

// Fixed sizes for a cipher method. header_size is the number of random salt
// bytes prefixed to every plaintext before encryption.
struct DecryptionMethod {
    std::string     name;
    CipherAlgorithm algorithm;
    std::size_t     key_size;
    std::size_t     iv_size;
    std::size_t     header_size;
};

// Lookup by configuration name ("sha1", "aes"). Throws std::invalid_argument
// for names that are not supported.
ValidationMethod validation_method_from_name(const std::string &name);
DecryptionMethod decryption_method_from_name(const std::string &name);

struct Signature {
    std::vector<std::uint8_t> bytes;
    SigAlgorithm algorithm;
};

} // namespace formsauth
