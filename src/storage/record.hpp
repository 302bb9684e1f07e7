#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace logkv::storage {

// ── Record frame ─────────────────────────────────────────────────────────────
//
//   [key_len: u32 LE][value_len: u32 LE][key][value][crc32: u32 LE]
//
// value_len == kTombstoneLength marks a removal; no value bytes follow.
// The CRC covers key_len through the last value byte.

static constexpr uint32_t kTombstoneLength = 0xFFFFFFFF;
static constexpr std::size_t kFrameHeaderSize = 2 * sizeof(uint32_t);
static constexpr std::size_t kFrameTrailerSize = sizeof(uint32_t);
static constexpr std::size_t kFrameOverhead = kFrameHeaderSize + kFrameTrailerSize;

// Largest value a frame can describe (the sentinel is reserved).
static constexpr uint64_t kMaxValueLength = kTombstoneLength - 1;

// Largest key a frame can describe.
static constexpr uint64_t kMaxKeyLength = UINT32_MAX;

struct Record {
    std::string key;
    std::string value;
    bool tombstone = false;
};

// Fixed-size prefix of a frame, readable before the rest of it.
struct FrameHeader {
    uint32_t key_len = 0;
    uint32_t value_len = 0;

    [[nodiscard]] bool is_tombstone() const { return value_len == kTombstoneLength; }

    // Total bytes of the frame this header starts, trailer included.
    [[nodiscard]] uint64_t frame_size() const;
};

[[nodiscard]] constexpr uint64_t frame_size(std::size_t key_len, std::size_t value_len) {
    return kFrameOverhead + static_cast<uint64_t>(key_len) + static_cast<uint64_t>(value_len);
}

// ── CRC32 utility ────────────────────────────────────────────────────────────

// CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// ── Serialisation ────────────────────────────────────────────────────────────

// Value frame.  Caller validates sizes; see Store::set.
[[nodiscard]] std::vector<uint8_t> serialise_record(std::string_view key,
                                                    std::string_view value);

// Tombstone frame for `key`.
[[nodiscard]] std::vector<uint8_t> serialise_tombstone(std::string_view key);

// Decodes the 8-byte frame prefix.  `data` must hold kFrameHeaderSize bytes.
[[nodiscard]] FrameHeader parse_frame_header(const uint8_t* data);

// Decodes a complete frame of exactly `length` bytes.
// Returns StoreErrc::corruption on a short buffer, a length mismatch or a
// checksum mismatch.
[[nodiscard]] std::error_code parse_record(const uint8_t* data,
                                           std::size_t length,
                                           Record& out);

} // namespace logkv::storage
