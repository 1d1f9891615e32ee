#pragma once

#include "../crypto/algorithms.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace formsauth {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Upper bound for TicketOptions::default_ttl, roughly 100 years.
constexpr std::chrono::milliseconds kMaxDefaultTtl = std::chrono::hours(24) * 36525;

// Options as an operator supplies them: method names and hex-encoded
// secrets. Nothing here is validated until resolve_config().
struct TicketOptions {
    std::string validation_method = "sha1";
    std::string validation_key;                // hex, required
    std::string decryption_method = "aes";
    std::optional<std::string> decryption_iv;  // hex, zeros when absent
    std::string decryption_key;                // hex, required

    // When set to 1..255, generated tickets carry this version and decoded
    // tickets must carry it. 0 leaves the version unpinned.
    std::optional<int> ticket_version;
    bool validate_expiration = true;

    bool generate_as_buffer = false;
    std::chrono::milliseconds default_ttl = std::chrono::hours(24);
    bool default_persistent = false;
    std::string default_cookie_path = "/";
};

// Resolved, immutable codec configuration. Secrets are decoded once here.
struct CodecConfig {
    ValidationMethod validation;
    DecryptionMethod decryption;

    std::vector<std::uint8_t> validation_key;
    std::vector<std::uint8_t> decryption_key;
    std::vector<std::uint8_t> decryption_iv;

    std::optional<std::uint8_t> required_version;
    bool validate_expiration;

    bool generate_as_buffer;
    std::chrono::milliseconds default_ttl;
    bool default_persistent;
    std::string default_cookie_path;
};

// Throws ConfigError naming the offending option.
CodecConfig resolve_config(const TicketOptions &options);

// Reads FORMSAUTH_VALIDATION_METHOD, FORMSAUTH_VALIDATION_KEY,
// FORMSAUTH_DECRYPTION_METHOD, FORMSAUTH_DECRYPTION_IV,
// FORMSAUTH_DECRYPTION_KEY, FORMSAUTH_TICKET_VERSION,
// FORMSAUTH_VALIDATE_EXPIRATION, FORMSAUTH_GENERATE_AS_BUFFER,
// FORMSAUTH_DEFAULT_TTL_MS, FORMSAUTH_DEFAULT_PERSISTENT,
// FORMSAUTH_DEFAULT_COOKIE_PATH. Unset variables keep their defaults.
TicketOptions load_options_from_environment();

} // namespace formsauth
