#include "storage/errors.hpp"
#include "storage/record.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace logkv::storage {

// ── CRC32 ────────────────────────────────────────────────────────────────────

TEST(RecordTest, Crc32MatchesCheckValue) {
    const std::string input = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(input.data()), input.size()),
              0xCBF43926u);
}

TEST(RecordTest, Crc32OfEmptyInputIsZero) {
    EXPECT_EQ(crc32(nullptr, 0), 0u);
}

// ── Serialisation ────────────────────────────────────────────────────────────

TEST(RecordTest, ValueFrameLayout) {
    auto frame = serialise_record("ab", "xyz");
    ASSERT_EQ(frame.size(), kFrameOverhead + 2 + 3);

    auto hdr = parse_frame_header(frame.data());
    EXPECT_EQ(hdr.key_len, 2u);
    EXPECT_EQ(hdr.value_len, 3u);
    EXPECT_FALSE(hdr.is_tombstone());
    EXPECT_EQ(hdr.frame_size(), frame.size());

    // Key and value bytes follow the 8-byte prefix verbatim.
    EXPECT_EQ(std::string(frame.begin() + 8, frame.begin() + 10), "ab");
    EXPECT_EQ(std::string(frame.begin() + 10, frame.begin() + 13), "xyz");
}

TEST(RecordTest, ParseValueFrame) {
    auto frame = serialise_record("key", "value");
    Record rec;
    auto ec = parse_record(frame.data(), frame.size(), rec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(rec.key, "key");
    EXPECT_EQ(rec.value, "value");
    EXPECT_FALSE(rec.tombstone);
}

TEST(RecordTest, EmptyValueIsNotATombstone) {
    auto frame = serialise_record("k", "");
    Record rec;
    ASSERT_FALSE(parse_record(frame.data(), frame.size(), rec));
    EXPECT_FALSE(rec.tombstone);
    EXPECT_TRUE(rec.value.empty());
}

TEST(RecordTest, TombstoneFrame) {
    auto frame = serialise_tombstone("gone");
    ASSERT_EQ(frame.size(), kFrameOverhead + 4);

    auto hdr = parse_frame_header(frame.data());
    EXPECT_TRUE(hdr.is_tombstone());
    EXPECT_EQ(hdr.value_len, kTombstoneLength);
    EXPECT_EQ(hdr.frame_size(), frame.size());

    Record rec;
    rec.value = "stale";
    ASSERT_FALSE(parse_record(frame.data(), frame.size(), rec));
    EXPECT_EQ(rec.key, "gone");
    EXPECT_TRUE(rec.tombstone);
    EXPECT_TRUE(rec.value.empty());
}

TEST(RecordTest, BinaryKeyAndValueSurvive) {
    const std::string key("\x00\x01\xff", 3);
    const std::string value("\x00\x00\n\r\x7f", 5);
    auto frame = serialise_record(key, value);

    Record rec;
    ASSERT_FALSE(parse_record(frame.data(), frame.size(), rec));
    EXPECT_EQ(rec.key, key);
    EXPECT_EQ(rec.value, value);
}

// ── Corruption ───────────────────────────────────────────────────────────────

TEST(RecordTest, FlippedValueByteFailsChecksum) {
    auto frame = serialise_record("key", "value");
    frame[kFrameHeaderSize + 4] ^= 0x01;

    Record rec;
    EXPECT_EQ(parse_record(frame.data(), frame.size(), rec), StoreErrc::corruption);
}

TEST(RecordTest, FlippedChecksumByteFails) {
    auto frame = serialise_record("key", "value");
    frame.back() ^= 0x80;

    Record rec;
    EXPECT_EQ(parse_record(frame.data(), frame.size(), rec), StoreErrc::corruption);
}

TEST(RecordTest, ShortBufferIsCorruption) {
    auto frame = serialise_record("key", "value");
    Record rec;
    EXPECT_EQ(parse_record(frame.data(), kFrameOverhead - 1, rec), StoreErrc::corruption);
    EXPECT_EQ(parse_record(frame.data(), frame.size() - 1, rec), StoreErrc::corruption);
}

TEST(RecordTest, LengthMismatchIsCorruption) {
    auto frame = serialise_record("key", "value");
    frame.push_back(0);
    Record rec;
    EXPECT_EQ(parse_record(frame.data(), frame.size(), rec), StoreErrc::corruption);
}

TEST(RecordTest, ErrorCategoryNamesItself) {
    std::error_code ec = StoreErrc::corruption;
    EXPECT_STREQ(ec.category().name(), "logkv");
    EXPECT_EQ(ec.message(), "data file corruption");
    EXPECT_NE(ec, std::make_error_code(std::errc::io_error));
}

} // namespace logkv::storage
