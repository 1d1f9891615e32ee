#include "byte_reader.hpp"

namespace formsauth {

ByteReader::ByteReader(const std::vector<std::uint8_t> &bytes) : bytes_(bytes) {}

void ByteReader::require(std::size_t n, const char *what) const {
    if (n > remaining()) {
        throw MalformedTicket(std::string("truncated payload reading ") + what +
                              " at offset " + std::to_string(pos_));
    }
}

void ByteReader::skip(std::size_t n) {
    require(n, "header");
    pos_ += n;
}

std::uint8_t ByteReader::read_byte() {
    require(1, "byte");
    return bytes_[pos_++];
}

bool ByteReader::read_bool() {
    require(1, "bool");
    const std::uint8_t b = bytes_[pos_];
    if (b > 0x01) {
        throw MalformedTicket("invalid bool value " + std::to_string(b) +
                              " at offset " + std::to_string(pos_));
    }
    ++pos_;
    return b == 0x01;
}

Timestamp ByteReader::read_date() {
    require(ByteWriter::kDateSize, "date");
    std::uint64_t ms = 0;
    for (std::size_t i = 0; i < ByteWriter::kDateSize; ++i) {
        ms |= static_cast<std::uint64_t>(bytes_[pos_++]) << (8 * i);
    }
    return Timestamp(std::chrono::milliseconds(static_cast<std::int64_t>(ms)));
}

std::string ByteReader::read_string() {
    require(ByteWriter::kStringPrefixSize, "string length");
    const std::size_t len = static_cast<std::size_t>(bytes_[pos_]) |
                            (static_cast<std::size_t>(bytes_[pos_ + 1]) << 8);
    pos_ += ByteWriter::kStringPrefixSize;
    require(len, "string");
    std::string out(bytes_.begin() + pos_, bytes_.begin() + pos_ + len);
    pos_ += len;
    return out;
}

void ByteReader::assert_byte(std::uint8_t expected, const char *label) {
    require(1, label);
    const std::uint8_t actual = bytes_[pos_];
    if (actual != expected) {
        throw MalformedTicket(std::string("invalid ") + label + ": expected " +
                              std::to_string(expected) + ", got " +
                              std::to_string(actual));
    }
    ++pos_;
}

void ByteReader::expect_end() const {
    if (remaining() != 0) {
        throw MalformedTicket(std::to_string(remaining()) +
                              " trailing bytes after footer");
    }
}

} // namespace formsauth
