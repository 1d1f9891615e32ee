#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "buffer/byte_reader.hpp"
#include "buffer/byte_writer.hpp"

using formsauth::ByteReader;
using formsauth::ByteWriter;
using formsauth::MalformedTicket;
using formsauth::Timestamp;

TEST(BufferByteReader, ReadsWhatWriterWrote) {
    const Timestamp date(std::chrono::milliseconds(1700000000123LL));
    const std::string name = "bob";
    ByteWriter w(3 + 1 + 1 + 1 + 8 + ByteWriter::string_size(name));
    w.write_buffer({9, 9, 9});
    w.write_byte(0x42);
    w.write_byte(0xFE);
    w.write_bool(true);
    w.write_date(date);
    w.write_string(name);
    const std::vector<std::uint8_t> bytes = std::move(w).finish();

    ByteReader r(bytes);
    r.skip(3);
    EXPECT_EQ(r.read_byte(), 0x42);
    r.assert_byte(0xFE, "spacer");
    EXPECT_TRUE(r.read_bool());
    EXPECT_EQ(r.read_date(), date);
    EXPECT_EQ(r.read_string(), name);
    EXPECT_EQ(r.remaining(), 0u);
    EXPECT_NO_THROW(r.expect_end());
}

TEST(BufferByteReader, DecodesLittleEndianDate) {
    const std::vector<std::uint8_t> bytes = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    ByteReader r(bytes);
    EXPECT_EQ(r.read_date().time_since_epoch().count(), 0x0102030405060708LL);
}

TEST(BufferByteReader, EmptyString) {
    const std::vector<std::uint8_t> bytes = {0x00, 0x00};
    ByteReader r(bytes);
    EXPECT_EQ(r.read_string(), "");
    EXPECT_EQ(r.position(), 2u);
}

TEST(BufferByteReader, AssertByteMismatchNamesLabel) {
    const std::vector<std::uint8_t> bytes = {0x02};
    ByteReader r(bytes);
    try {
        r.assert_byte(0x01, "format version");
        FAIL() << "expected MalformedTicket";
    } catch (const MalformedTicket &ex) {
        EXPECT_NE(std::string(ex.what()).find("format version"), std::string::npos);
    }
}

TEST(BufferByteReader, ShortReadsThrow) {
    const std::vector<std::uint8_t> bytes = {0x01, 0x02, 0x03};
    {
        ByteReader r(bytes);
        EXPECT_THROW(r.read_date(), MalformedTicket);
    }
    {
        ByteReader r(bytes);
        EXPECT_THROW(r.skip(4), MalformedTicket);
    }
    {
        // Prefix claims 0x0201 bytes but only one follows.
        ByteReader r(bytes);
        EXPECT_THROW(r.read_string(), MalformedTicket);
    }
    {
        const std::vector<std::uint8_t> empty;
        ByteReader r(empty);
        EXPECT_THROW(r.read_byte(), MalformedTicket);
        EXPECT_THROW(r.assert_byte(0xFF, "footer"), MalformedTicket);
    }
}

TEST(BufferByteReader, BoolRejectsValuesOtherThanZeroOrOne) {
    const std::vector<std::uint8_t> bytes = {0x00, 0x01, 0x02};
    ByteReader r(bytes);
    EXPECT_FALSE(r.read_bool());
    EXPECT_TRUE(r.read_bool());
    EXPECT_THROW(r.read_bool(), MalformedTicket);
}

TEST(BufferByteReader, ExpectEndRejectsTrailingBytes) {
    const std::vector<std::uint8_t> bytes = {0xFF, 0x00};
    ByteReader r(bytes);
    r.assert_byte(0xFF, "footer");
    EXPECT_THROW(r.expect_end(), MalformedTicket);
}
