#include "audit_logger.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace formsauth {

AuditLogger::AuditLogger(const std::string &log_path) : log_path_(log_path) {}

void AuditLogger::log_event(const std::string &event_type, const std::string &payload_json) const {
    namespace fs = std::filesystem;

    std::lock_guard<std::mutex> lock(mu_);

    fs::path p(log_path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            return;
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    out << "{"
        << "\"ts\":" << secs << ","
        << "\"event\":" << json_quote(event_type) << ",";
    // payload_json is assumed to be valid JSON object or value
    out << "\"payload\":" << payload_json;
    out << "}" << '\n';
}

std::string json_quote(const std::string &value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out.push_back(c);
            }
        }
    }
    out.push_back('"');
    return out;
}

} // namespace formsauth
