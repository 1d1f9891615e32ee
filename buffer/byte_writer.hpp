#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace formsauth {

using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

// Append-only writer over a buffer whose size is fixed up front. Callers
// compute the exact payload size (see string_size) and every byte must be
// written before finish() hands the buffer back.
//
// Encoding, shared with ByteReader:
//   byte/bool  1 byte (bool is 0x00 or 0x01)
//   date       8 bytes, signed milliseconds since the Unix epoch, little-endian
//   string     2-byte little-endian length, then the UTF-8 bytes
class ByteWriter {
public:
    static constexpr std::size_t kDateSize = 8;
    static constexpr std::size_t kStringPrefixSize = 2;
    static constexpr std::size_t kMaxStringSize = 0xFFFF;

    explicit ByteWriter(std::size_t capacity);

    // Bytes write_string(s) will consume. Throws std::length_error when s
    // does not fit the length prefix.
    static std::size_t string_size(const std::string &s);

    void write_buffer(const std::vector<std::uint8_t> &bytes);
    void write_byte(std::uint8_t n);
    void write_bool(bool b);
    void write_date(Timestamp d);
    void write_string(const std::string &s);

    std::size_t position() const { return pos_; }
    std::size_t capacity() const { return buffer_.size(); }

    // Throws std::logic_error unless the buffer is exactly full.
    std::vector<std::uint8_t> finish() &&;

private:
    void reserve_bytes(std::size_t n);

    std::vector<std::uint8_t> buffer_;
    std::size_t pos_ = 0;
};

} // namespace formsauth
