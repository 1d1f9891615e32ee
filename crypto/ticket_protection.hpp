#pragma once

#include "interfaces.hpp"
#include "../audit/audit_logger.hpp"
#include "../buffer/byte_writer.hpp"
#include "../policy/config.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace formsauth {

// Payload layout (plaintext, before encryption):
//   header           random salt, header_size bytes, skipped on read
//   format version   kFormatVersion
//   ticket version   1 byte
//   issue date       8 bytes
//   spacer           kSpacer
//   expiration date  8 bytes
//   is persistent    1 byte
//   name             string
//   custom data      string
//   cookie path      string
//   footer           kFooter
// Wire form: AES-256-CBC(payload) || HMAC-SHA1(ciphertext)
constexpr std::uint8_t kFormatVersion = 0x01;
constexpr std::uint8_t kSpacer = 0xFE;
constexpr std::uint8_t kFooter = 0xFF;
constexpr std::uint8_t kDefaultTicketVersion = 0x01;

// Bytes of framing excluding header and strings.
constexpr std::size_t kFixedOverhead = 1 + 1 + ByteWriter::kDateSize + 1 +
                                       ByteWriter::kDateSize + 1 + 1;

// A fully materialized ticket, as recovered by validate().
struct Ticket {
    std::uint8_t ticket_version = kDefaultTicketVersion;
    Timestamp    issue_date;
    Timestamp    expiration_date;
    bool         is_persistent = false;
    std::string  name;
    std::string  custom_data;
    std::string  cookie_path;
};

bool operator==(const Ticket &a, const Ticket &b);
bool operator!=(const Ticket &a, const Ticket &b);

// Input to generate(). Unset fields take the codec's configured defaults.
struct TicketRequest {
    std::string name;        // required
    std::string custom_data;
    std::optional<std::uint8_t> ticket_version;  // 0 counts as unset
    std::optional<Timestamp>    issue_date;      // now
    std::optional<Timestamp>    expiration_date; // issue_date + default TTL
    std::optional<bool>         is_persistent;
    std::optional<std::string>  cookie_path;     // empty counts as unset
};

// Hex text or raw bytes depending on CodecConfig::generate_as_buffer.
using EncodedTicket = std::variant<std::string, std::vector<std::uint8_t>>;

// Thrown by generate() when the caller's explicit ticket version conflicts
// with the configured one.
class TicketVersionMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Internal classification of a rejected ticket. Only ever written to the
// audit log; callers see an empty optional for all of them.
enum class TicketValidationCode {
    Ok,
    Truncated,
    BadEncoding,
    SignatureFailed,
    DecryptFailed,
    Malformed,
    VersionMismatch,
    Expired
};

const char *validation_code_name(TicketValidationCode code);

Timestamp current_time();

// Issues and validates tickets under one immutable configuration. All
// methods are const and safe to call concurrently on a shared instance.
class TicketCodec {
public:
    // Builds the crypto suite from the resolved configuration. `audit` may be
    // null; when present it receives ticket_issued / ticket_rejected events.
    explicit TicketCodec(CodecConfig config,
                         std::shared_ptr<const AuditLogger> audit = nullptr);

    const CodecConfig &config() const { return config_; }

    // Exact plaintext size generate() will produce for `request`.
    std::size_t payload_size(const TicketRequest &request) const;

    // Shortest byte sequence that can possibly be a ticket.
    std::size_t minimum_ticket_size() const;

    EncodedTicket generate(const TicketRequest &request) const;
    std::vector<std::uint8_t> generate_bytes(const TicketRequest &request) const;
    std::string generate_hex(const TicketRequest &request) const;

    // Never throws for bad input; any failure yields std::nullopt.
    std::optional<Ticket> validate(const std::vector<std::uint8_t> &bytes) const;
    std::optional<Ticket> validate(const std::vector<std::uint8_t> &bytes,
                                   Timestamp now) const;
    std::optional<Ticket> validate(const std::string &hex) const;
    std::optional<Ticket> validate(const std::string &hex, Timestamp now) const;
    std::optional<Ticket> validate_encoded(const EncodedTicket &encoded) const;

private:
    TicketValidationCode unseal(const std::vector<std::uint8_t> &bytes,
                                Timestamp now,
                                Ticket &out) const;

    const std::string &effective_cookie_path(const TicketRequest &request) const;

    void record_rejection(TicketValidationCode code, const std::string &detail) const;

    CodecConfig config_;
    CryptoSuite suite_;
    std::shared_ptr<const AuditLogger> audit_;
};

} // namespace formsauth
