#include "byte_writer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace formsauth {

ByteWriter::ByteWriter(std::size_t capacity) : buffer_(capacity) {}

std::size_t ByteWriter::string_size(const std::string &s) {
    if (s.size() > kMaxStringSize) {
        throw std::length_error("string of " + std::to_string(s.size()) +
                                " bytes exceeds the 16-bit length prefix");
    }
    return kStringPrefixSize + s.size();
}

void ByteWriter::reserve_bytes(std::size_t n) {
    if (n > buffer_.size() - pos_) {
        throw std::out_of_range("write of " + std::to_string(n) +
                                " bytes past end of " +
                                std::to_string(buffer_.size()) + "-byte buffer");
    }
}

void ByteWriter::write_buffer(const std::vector<std::uint8_t> &bytes) {
    reserve_bytes(bytes.size());
    std::copy(bytes.begin(), bytes.end(), buffer_.begin() + pos_);
    pos_ += bytes.size();
}

void ByteWriter::write_byte(std::uint8_t n) {
    reserve_bytes(1);
    buffer_[pos_++] = n;
}

void ByteWriter::write_bool(bool b) {
    write_byte(b ? 0x01 : 0x00);
}

void ByteWriter::write_date(Timestamp d) {
    reserve_bytes(kDateSize);
    const auto ms = static_cast<std::uint64_t>(d.time_since_epoch().count());
    for (std::size_t i = 0; i < kDateSize; ++i) {
        buffer_[pos_++] = static_cast<std::uint8_t>((ms >> (8 * i)) & 0xFF);
    }
}

void ByteWriter::write_string(const std::string &s) {
    const std::size_t total = string_size(s);
    reserve_bytes(total);
    const auto len = static_cast<std::uint16_t>(s.size());
    buffer_[pos_++] = static_cast<std::uint8_t>(len & 0xFF);
    buffer_[pos_++] = static_cast<std::uint8_t>((len >> 8) & 0xFF);
    std::copy(s.begin(), s.end(), buffer_.begin() + pos_);
    pos_ += s.size();
}

std::vector<std::uint8_t> ByteWriter::finish() && {
    if (pos_ != buffer_.size()) {
        throw std::logic_error("payload size mismatch: wrote " +
                               std::to_string(pos_) + " of " +
                               std::to_string(buffer_.size()) + " bytes");
    }
    return std::move(buffer_);
}

} // namespace formsauth
