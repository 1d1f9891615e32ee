#include "config.hpp"

#include "../buffer/byte_writer.hpp"
#include "../encoding/hex.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace formsauth {

namespace {

std::vector<std::uint8_t> decode_secret(const std::string &hex, const char *field) {
    try {
        return from_hex(hex);
    } catch (const std::invalid_argument &ex) {
        throw ConfigError(std::string("'") + field + "' is not valid hex: " + ex.what());
    }
}

std::optional<std::string> env_value(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

bool parse_bool(std::string value, const char *name) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw ConfigError(std::string(name) + " is not a boolean: " + value);
}

long long parse_integer(const std::string &value, const char *name) {
    std::size_t used = 0;
    long long out = 0;
    try {
        out = std::stoll(value, &used);
    } catch (const std::logic_error &) {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    }
    if (used != value.size()) {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    }
    return out;
}

} // namespace

CodecConfig resolve_config(const TicketOptions &options) {
    CodecConfig cfg;

    try {
        cfg.validation = validation_method_from_name(options.validation_method);
        cfg.decryption = decryption_method_from_name(options.decryption_method);
    } catch (const std::invalid_argument &ex) {
        throw ConfigError(ex.what());
    }

    if (options.validation_key.empty()) {
        throw ConfigError("'validationKey' is required");
    }
    if (options.decryption_key.empty()) {
        throw ConfigError("'decryptionKey' is required");
    }

    cfg.validation_key = decode_secret(options.validation_key, "validationKey");
    cfg.decryption_key = decode_secret(options.decryption_key, "decryptionKey");
    if (cfg.decryption_key.size() != cfg.decryption.key_size) {
        throw ConfigError("'decryptionKey' must be " +
                          std::to_string(cfg.decryption.key_size) + " bytes for " +
                          cfg.decryption.name + ", got " +
                          std::to_string(cfg.decryption_key.size()));
    }

    if (options.decryption_iv) {
        cfg.decryption_iv = decode_secret(*options.decryption_iv, "decryptionIV");
        if (cfg.decryption_iv.size() != cfg.decryption.iv_size) {
            throw ConfigError("'decryptionIV' must be " +
                              std::to_string(cfg.decryption.iv_size) + " bytes for " +
                              cfg.decryption.name);
        }
    } else {
        cfg.decryption_iv.assign(cfg.decryption.iv_size, 0x00);
    }

    if (options.ticket_version) {
        const int v = *options.ticket_version;
        if (v < 0 || v > 0xFF) {
            throw ConfigError("'ticketVersion' must be between 0 and 255, got " +
                              std::to_string(v));
        }
        if (v != 0) {
            cfg.required_version = static_cast<std::uint8_t>(v);
        }
    }
    cfg.validate_expiration = options.validate_expiration;

    if (options.default_ttl.count() <= 0) {
        throw ConfigError("'defaultTTL' must be positive");
    }
    if (options.default_ttl > kMaxDefaultTtl) {
        throw ConfigError("'defaultTTL' exceeds " +
                          std::to_string(kMaxDefaultTtl.count()) + " ms");
    }
    if (options.default_cookie_path.empty()) {
        throw ConfigError("'defaultCookiePath' must not be empty");
    }
    try {
        (void)ByteWriter::string_size(options.default_cookie_path);
    } catch (const std::length_error &ex) {
        throw ConfigError(std::string("'defaultCookiePath': ") + ex.what());
    }

    cfg.generate_as_buffer = options.generate_as_buffer;
    cfg.default_ttl = options.default_ttl;
    cfg.default_persistent = options.default_persistent;
    cfg.default_cookie_path = options.default_cookie_path;
    return cfg;
}

TicketOptions load_options_from_environment() {
    TicketOptions opts;

    if (auto v = env_value("FORMSAUTH_VALIDATION_METHOD")) opts.validation_method = *v;
    if (auto v = env_value("FORMSAUTH_VALIDATION_KEY")) opts.validation_key = *v;
    if (auto v = env_value("FORMSAUTH_DECRYPTION_METHOD")) opts.decryption_method = *v;
    if (auto v = env_value("FORMSAUTH_DECRYPTION_IV")) opts.decryption_iv = *v;
    if (auto v = env_value("FORMSAUTH_DECRYPTION_KEY")) opts.decryption_key = *v;

    if (auto v = env_value("FORMSAUTH_TICKET_VERSION")) {
        const long long version = parse_integer(*v, "FORMSAUTH_TICKET_VERSION");
        if (version < 0 || version > 0xFF) {
            throw ConfigError("FORMSAUTH_TICKET_VERSION out of range: " + *v);
        }
        // 0 leaves the version unpinned.
        if (version != 0) {
            opts.ticket_version = static_cast<int>(version);
        }
    }
    if (auto v = env_value("FORMSAUTH_VALIDATE_EXPIRATION")) {
        opts.validate_expiration = parse_bool(*v, "FORMSAUTH_VALIDATE_EXPIRATION");
    }
    if (auto v = env_value("FORMSAUTH_GENERATE_AS_BUFFER")) {
        opts.generate_as_buffer = parse_bool(*v, "FORMSAUTH_GENERATE_AS_BUFFER");
    }
    if (auto v = env_value("FORMSAUTH_DEFAULT_TTL_MS")) {
        opts.default_ttl = std::chrono::milliseconds(
            parse_integer(*v, "FORMSAUTH_DEFAULT_TTL_MS"));
    }
    if (auto v = env_value("FORMSAUTH_DEFAULT_PERSISTENT")) {
        opts.default_persistent = parse_bool(*v, "FORMSAUTH_DEFAULT_PERSISTENT");
    }
    if (auto v = env_value("FORMSAUTH_DEFAULT_COOKIE_PATH")) {
        opts.default_cookie_path = *v;
    }

    return opts;
}

} // namespace formsauth
