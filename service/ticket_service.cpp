#include "ticket_service.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace formsauth {

namespace {

// Position just past `"key"` and the following colon, or npos.
std::size_t find_value(const std::string &json, const std::string &key) {
    auto pos = json.find("\"" + key + "\"");
    if (pos == std::string::npos) return std::string::npos;
    pos = json.find(':', pos + key.size() + 2);
    if (pos == std::string::npos) return std::string::npos;
    ++pos;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        ++pos;
    }
    return pos;
}

void append_utf8(std::string &out, unsigned cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::uint8_t checked_version(long long v) {
    if (v < 0 || v > 0xFF) {
        throw std::invalid_argument("ticket_version out of range: " + std::to_string(v));
    }
    return static_cast<std::uint8_t>(v);
}

} // namespace

std::optional<std::string> extract_json_string(const std::string &json, const std::string &key) {
    auto pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
        return std::nullopt;
    }

    std::string out;
    for (++pos; pos < json.size(); ++pos) {
        const char c = json[pos];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++pos >= json.size()) break;
        switch (json[pos]) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
            if (pos + 4 >= json.size()) {
                throw std::invalid_argument("truncated \\u escape in '" + key + "'");
            }
            const std::string digits = json.substr(pos + 1, 4);
            std::size_t used = 0;
            unsigned cp = 0;
            try {
                cp = static_cast<unsigned>(std::stoul(digits, &used, 16));
            } catch (const std::logic_error &) {
                used = 0;
            }
            if (used != 4) {
                throw std::invalid_argument("invalid \\u escape in '" + key + "'");
            }
            append_utf8(out, cp);
            pos += 4;
            break;
        }
        default:
            throw std::invalid_argument("invalid escape in '" + key + "'");
        }
    }
    throw std::invalid_argument("unterminated string for '" + key + "'");
}

std::optional<long long> extract_json_integer(const std::string &json, const std::string &key) {
    auto pos = find_value(json, key);
    if (pos == std::string::npos || pos >= json.size()) {
        return std::nullopt;
    }
    auto end = pos;
    if (json[end] == '-') ++end;
    while (end < json.size() && std::isdigit(static_cast<unsigned char>(json[end]))) {
        ++end;
    }
    const std::string digits = json.substr(pos, end - pos);
    if (digits.empty() || digits == "-") {
        return std::nullopt;
    }
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range &) {
        throw std::invalid_argument("'" + key + "' is out of range");
    }
}

std::optional<bool> extract_json_bool(const std::string &json, const std::string &key) {
    auto pos = find_value(json, key);
    if (pos == std::string::npos) return std::nullopt;
    if (json.compare(pos, 4, "true") == 0) return true;
    if (json.compare(pos, 5, "false") == 0) return false;
    return std::nullopt;
}

TicketRequest parse_generate_request_json(const std::string &json) {
    TicketRequest req;
    req.name = extract_json_string(json, "name").value_or("");
    if (req.name.empty()) {
        throw std::invalid_argument("missing_name");
    }
    req.custom_data = extract_json_string(json, "custom_data").value_or("");
    req.cookie_path = extract_json_string(json, "cookie_path");

    if (auto v = extract_json_integer(json, "ticket_version")) {
        req.ticket_version = checked_version(*v);
    }
    req.is_persistent = extract_json_bool(json, "is_persistent");

    if (auto ttl = extract_json_integer(json, "ttl_ms")) {
        if (*ttl <= 0) {
            throw std::invalid_argument("ttl_ms must be positive");
        }
        req.issue_date = current_time();
        if (*ttl > std::chrono::milliseconds::max().count() -
                       req.issue_date->time_since_epoch().count()) {
            throw std::invalid_argument("ttl_ms is too large");
        }
        req.expiration_date = *req.issue_date + std::chrono::milliseconds(*ttl);
    }
    return req;
}

std::string generate_response_to_json(const std::string &ticket_hex) {
    std::ostringstream oss;
    oss << "{"
        << "\"kind\":\"GENERATE\","
        << "\"status\":\"OK\","
        << "\"ticket\":\"" << ticket_hex << "\"";
    oss << "}";
    return oss.str();
}

std::string validate_response_to_json(const std::optional<Ticket> &ticket) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"kind\":\"VALIDATE\",";
    if (!ticket) {
        oss << "\"status\":\"DENIED\",";
        oss << "\"valid\":false";
        oss << "}";
        return oss.str();
    }

    oss << "\"status\":\"OK\",";
    oss << "\"valid\":true,";
    oss << "\"name\":" << json_quote(ticket->name) << ",";
    oss << "\"custom_data\":" << json_quote(ticket->custom_data) << ",";
    oss << "\"cookie_path\":" << json_quote(ticket->cookie_path) << ",";
    oss << "\"ticket_version\":" << static_cast<int>(ticket->ticket_version) << ",";
    oss << "\"issue_date\":" << ticket->issue_date.time_since_epoch().count() << ",";
    oss << "\"expiration_date\":" << ticket->expiration_date.time_since_epoch().count() << ",";
    oss << "\"is_persistent\":" << (ticket->is_persistent ? "true" : "false");
    oss << "}";
    return oss.str();
}

std::string handle_request_line(const TicketCodec &codec, const std::string &line) {
    try {
        const std::string kind = extract_json_string(line, "kind").value_or("");
        if (kind == "GENERATE") {
            const TicketRequest req = parse_generate_request_json(line);
            return generate_response_to_json(codec.generate_hex(req));
        }
        if (kind == "VALIDATE") {
            const std::string ticket = extract_json_string(line, "ticket").value_or("");
            if (ticket.empty()) {
                return "{\"kind\":\"VALIDATE\",\"status\":\"DENIED\",\"error\":\"missing_ticket\"}";
            }
            return validate_response_to_json(codec.validate(ticket));
        }
        // Unknown kind; return a generic error structure.
        return "{\"status\":\"DENIED\",\"error\":\"unknown_kind\"}";
    } catch (const std::exception &ex) {
        return std::string("{\"status\":\"DENIED\",\"error\":") + json_quote(ex.what()) + "}";
    }
}

} // namespace formsauth
