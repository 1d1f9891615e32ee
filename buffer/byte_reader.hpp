#pragma once

#include "byte_writer.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace formsauth {

// Raised for any short read or failed structural assertion while parsing a
// ticket payload.
class MalformedTicket : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Cursor over an immutable byte sequence; the inverse of ByteWriter. The
// reader does not own the bytes, so they must outlive it.
class ByteReader {
public:
    explicit ByteReader(const std::vector<std::uint8_t> &bytes);

    void skip(std::size_t n);

    std::uint8_t read_byte();
    bool read_bool();
    Timestamp read_date();
    std::string read_string();

    // Reads one byte and throws MalformedTicket naming `label` if it is not
    // `expected`.
    void assert_byte(std::uint8_t expected, const char *label);

    // Throws MalformedTicket if any bytes are left unread.
    void expect_end() const;

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return bytes_.size() - pos_; }

private:
    void require(std::size_t n, const char *what) const;

    const std::vector<std::uint8_t> &bytes_;
    std::size_t pos_ = 0;
};

} // namespace formsauth
