#pragma once

#include <mutex>
#include <string>

namespace formsauth {

class AuditLogger {
public:
    explicit AuditLogger(const std::string &log_path);

    // Writes a single JSON line with type and payload (already JSON) embedded.
    // Best-effort: an unwritable log path drops the event.
    void log_event(const std::string &event_type, const std::string &payload_json) const;

private:
    std::string log_path_;
    mutable std::mutex mu_;
};

// Quotes and escapes `value` as a JSON string literal.
std::string json_quote(const std::string &value);

} // namespace formsauth
