#pragma once

#include "../crypto/ticket_protection.hpp"

#include <optional>
#include <string>

namespace formsauth {

// Very small JSON helpers tailored to the one-object-per-line request
// format. They find the first occurrence of "key" anywhere in the line.
std::optional<std::string> extract_json_string(const std::string &json, const std::string &key);
std::optional<long long>   extract_json_integer(const std::string &json, const std::string &key);
std::optional<bool>        extract_json_bool(const std::string &json, const std::string &key);

// {"kind":"GENERATE","name":...,"custom_data":...,"cookie_path":...,
//  "ticket_version":N,"is_persistent":bool,"ttl_ms":N}
// ttl_ms sets the expiration relative to now. Throws std::invalid_argument
// for a missing name or out-of-range numbers.
TicketRequest parse_generate_request_json(const std::string &json);

std::string generate_response_to_json(const std::string &ticket_hex);

// Denied responses carry no reason.
std::string validate_response_to_json(const std::optional<Ticket> &ticket);

// Dispatches one request line on its "kind" and returns the response line
// (without trailing newline). Never throws.
std::string handle_request_line(const TicketCodec &codec, const std::string &line);

} // namespace formsauth
