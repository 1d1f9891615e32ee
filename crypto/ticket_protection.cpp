#include "ticket_protection.hpp"
#include "factories.hpp"
#include "secure_random.hpp"
#include "../buffer/byte_reader.hpp"
#include "../encoding/hex.hpp"

#include <cstddef>
#include <sstream>
#include <utility>

namespace formsauth {

bool operator==(const Ticket &a, const Ticket &b) {
    return a.ticket_version == b.ticket_version &&
           a.issue_date == b.issue_date &&
           a.expiration_date == b.expiration_date &&
           a.is_persistent == b.is_persistent &&
           a.name == b.name &&
           a.custom_data == b.custom_data &&
           a.cookie_path == b.cookie_path;
}

bool operator!=(const Ticket &a, const Ticket &b) {
    return !(a == b);
}

const char *validation_code_name(TicketValidationCode code) {
    switch (code) {
    case TicketValidationCode::Ok: return "ok";
    case TicketValidationCode::Truncated: return "truncated";
    case TicketValidationCode::BadEncoding: return "bad_encoding";
    case TicketValidationCode::SignatureFailed: return "signature_failed";
    case TicketValidationCode::DecryptFailed: return "decrypt_failed";
    case TicketValidationCode::Malformed: return "malformed";
    case TicketValidationCode::VersionMismatch: return "version_mismatch";
    case TicketValidationCode::Expired: return "expired";
    }
    return "unknown";
}

Timestamp current_time() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

TicketCodec::TicketCodec(CodecConfig config,
                         std::shared_ptr<const AuditLogger> audit)
    : config_(std::move(config)), audit_(std::move(audit)) {
    suite_.signer = make_signature_provider(config_.validation, config_.validation_key);
    suite_.cipher = make_cipher_provider(config_.decryption, config_.decryption_key,
                                         config_.decryption_iv);
}

const std::string &TicketCodec::effective_cookie_path(const TicketRequest &request) const {
    if (request.cookie_path && !request.cookie_path->empty()) {
        return *request.cookie_path;
    }
    return config_.default_cookie_path;
}

std::size_t TicketCodec::payload_size(const TicketRequest &request) const {
    return config_.decryption.header_size + kFixedOverhead +
           ByteWriter::string_size(request.name) +
           ByteWriter::string_size(request.custom_data) +
           ByteWriter::string_size(effective_cookie_path(request));
}

std::size_t TicketCodec::minimum_ticket_size() const {
    return config_.validation.signature_size + config_.decryption.header_size +
           kFixedOverhead + 3 * ByteWriter::kStringPrefixSize;
}

std::vector<std::uint8_t> TicketCodec::generate_bytes(const TicketRequest &request) const {
    if (request.name.empty()) {
        throw std::invalid_argument("ticket name is required");
    }

    // A version of 0 counts as not supplied.
    const bool has_version = request.ticket_version && *request.ticket_version != 0;

    std::uint8_t version = kDefaultTicketVersion;
    if (config_.required_version) {
        if (has_version && *request.ticket_version != *config_.required_version) {
            throw TicketVersionMismatch(
                "Invalid ticket version " + std::to_string(*request.ticket_version) +
                ", expected " + std::to_string(*config_.required_version));
        }
        version = *config_.required_version;
    } else if (has_version) {
        version = *request.ticket_version;
    }

    const Timestamp issue_date = request.issue_date ? *request.issue_date : current_time();
    if (!request.expiration_date &&
        issue_date.time_since_epoch() > std::chrono::milliseconds::max() - config_.default_ttl) {
        throw std::invalid_argument("issue date plus default TTL overflows the expiration date");
    }
    const Timestamp expiration_date = request.expiration_date
                                          ? *request.expiration_date
                                          : issue_date + config_.default_ttl;
    const bool is_persistent = request.is_persistent.value_or(config_.default_persistent);

    ByteWriter writer(payload_size(request));

    // Random header serves as a salt
    writer.write_buffer(random_bytes(config_.decryption.header_size));
    writer.write_byte(kFormatVersion);
    writer.write_byte(version);
    writer.write_date(issue_date);
    writer.write_byte(kSpacer);
    writer.write_date(expiration_date);
    writer.write_bool(is_persistent);
    writer.write_string(request.name);
    writer.write_string(request.custom_data);
    writer.write_string(effective_cookie_path(request));
    writer.write_byte(kFooter);

    const std::vector<std::uint8_t> plaintext = std::move(writer).finish();

    // Sign the ciphertext, not the plaintext.
    std::vector<std::uint8_t> out = suite_.cipher->encrypt(plaintext);
    const Signature sig = suite_.signer->sign(out);
    out.insert(out.end(), sig.bytes.begin(), sig.bytes.end());

    if (audit_) {
        std::ostringstream oss;
        oss << "{"
            << "\"ticket_version\":" << static_cast<int>(version) << ","
            << "\"expires_at\":" << expiration_date.time_since_epoch().count() << ","
            << "\"persistent\":" << (is_persistent ? "true" : "false")
            << "}";
        audit_->log_event("ticket_issued", oss.str());
    }

    return out;
}

std::string TicketCodec::generate_hex(const TicketRequest &request) const {
    return to_hex(generate_bytes(request));
}

EncodedTicket TicketCodec::generate(const TicketRequest &request) const {
    if (config_.generate_as_buffer) {
        return generate_bytes(request);
    }
    return generate_hex(request);
}

TicketValidationCode TicketCodec::unseal(const std::vector<std::uint8_t> &bytes,
                                         Timestamp now,
                                         Ticket &out) const {
    if (bytes.size() < minimum_ticket_size()) {
        return TicketValidationCode::Truncated;
    }

    const std::size_t sig_size = config_.validation.signature_size;
    const auto split = bytes.end() - static_cast<std::ptrdiff_t>(sig_size);

    const std::vector<std::uint8_t> ciphertext(bytes.begin(), split);
    Signature claimed;
    claimed.algorithm = config_.validation.algorithm;
    claimed.bytes.assign(split, bytes.end());

    if (!suite_.signer->verify(ciphertext, claimed)) {
        return TicketValidationCode::SignatureFailed;
    }

    std::vector<std::uint8_t> plaintext;
    try {
        plaintext = suite_.cipher->decrypt(ciphertext);
    } catch (const std::runtime_error &) {
        return TicketValidationCode::DecryptFailed;
    }

    ByteReader reader(plaintext);
    Ticket ticket;

    reader.skip(config_.decryption.header_size);
    reader.assert_byte(kFormatVersion, "format version");

    ticket.ticket_version = reader.read_byte();
    if (config_.required_version && ticket.ticket_version != *config_.required_version) {
        return TicketValidationCode::VersionMismatch;
    }

    ticket.issue_date = reader.read_date();
    reader.assert_byte(kSpacer, "spacer");
    ticket.expiration_date = reader.read_date();
    ticket.is_persistent = reader.read_bool();
    ticket.name = reader.read_string();
    ticket.custom_data = reader.read_string();
    ticket.cookie_path = reader.read_string();
    reader.assert_byte(kFooter, "footer");
    reader.expect_end();

    if (config_.validate_expiration && ticket.expiration_date < now) {
        return TicketValidationCode::Expired;
    }

    out = std::move(ticket);
    return TicketValidationCode::Ok;
}

std::optional<Ticket> TicketCodec::validate(const std::vector<std::uint8_t> &bytes,
                                            Timestamp now) const {
    Ticket ticket;
    TicketValidationCode code = TicketValidationCode::Malformed;
    std::string detail;
    try {
        code = unseal(bytes, now, ticket);
    } catch (const std::exception &ex) {
        // MalformedTicket from the reader, or a crypto backend failure.
        code = TicketValidationCode::Malformed;
        detail = ex.what();
    }

    if (code != TicketValidationCode::Ok) {
        record_rejection(code, detail);
        return std::nullopt;
    }
    return ticket;
}

std::optional<Ticket> TicketCodec::validate(const std::vector<std::uint8_t> &bytes) const {
    return validate(bytes, current_time());
}

std::optional<Ticket> TicketCodec::validate(const std::string &hex, Timestamp now) const {
    std::vector<std::uint8_t> bytes;
    try {
        bytes = from_hex(hex);
    } catch (const std::invalid_argument &ex) {
        record_rejection(TicketValidationCode::BadEncoding, ex.what());
        return std::nullopt;
    }
    return validate(bytes, now);
}

std::optional<Ticket> TicketCodec::validate(const std::string &hex) const {
    return validate(hex, current_time());
}

std::optional<Ticket> TicketCodec::validate_encoded(const EncodedTicket &encoded) const {
    if (const auto *hex = std::get_if<std::string>(&encoded)) {
        return validate(*hex);
    }
    return validate(std::get<std::vector<std::uint8_t>>(encoded));
}

void TicketCodec::record_rejection(TicketValidationCode code, const std::string &detail) const {
    if (!audit_) {
        return;
    }
    std::ostringstream oss;
    oss << "{\"reason\":\"" << validation_code_name(code) << "\"";
    if (!detail.empty()) {
        oss << ",\"detail\":" << json_quote(detail);
    }
    oss << "}";
    audit_->log_event("ticket_rejected", oss.str());
}

} // namespace formsauth
