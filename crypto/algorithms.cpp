#include "algorithms.hpp"

#include <stdexcept>

namespace formsauth {

ValidationMethod validation_method_from_name(const std::string &name) {
    if (name == "sha1") {
        return ValidationMethod{"sha1", SigAlgorithm::HMAC_SHA1, 20};
    }
    throw std::invalid_argument("unknown validation method: " + name);
}

DecryptionMethod decryption_method_from_name(const std::string &name) {
    if (name == "aes") {
        return DecryptionMethod{"aes", CipherAlgorithm::AES_256_CBC, 32, 16, 32};
    }
    throw std::invalid_argument("unknown decryption method: " + name);
}

} // namespace formsauth
