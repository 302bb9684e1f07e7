#include "storage/record.hpp"

#include "storage/errors.hpp"

#include <array>

namespace logkv::storage {

// ── CRC32 (ISO 3309 polynomial 0xEDB88320) ──────────────────────────────────

namespace {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1)
                crc = (crc >> 1) ^ 0xEDB88320;
            else
                crc >>= 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32Table = make_crc32_table();

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (std::size_t i = 0; i < length; ++i) {
        crc = kCrc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

// ── Little-endian helpers ────────────────────────────────────────────────────

namespace {

void write_u32_le(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

std::vector<uint8_t> serialise_frame(std::string_view key,
                                     std::string_view value,
                                     uint32_t value_len) {
    std::vector<uint8_t> buf;
    buf.reserve(kFrameOverhead + key.size() + value.size());

    write_u32_le(buf, static_cast<uint32_t>(key.size()));
    write_u32_le(buf, value_len);
    append_raw(buf, key.data(), key.size());
    append_raw(buf, value.data(), value.size());

    // CRC covers key_len through value.
    uint32_t c = crc32(buf.data(), buf.size());
    write_u32_le(buf, c);

    return buf;
}

} // anonymous namespace

// ── Serialisation ────────────────────────────────────────────────────────────

uint64_t FrameHeader::frame_size() const {
    return storage::frame_size(key_len, is_tombstone() ? 0 : value_len);
}

std::vector<uint8_t> serialise_record(std::string_view key, std::string_view value) {
    return serialise_frame(key, value, static_cast<uint32_t>(value.size()));
}

std::vector<uint8_t> serialise_tombstone(std::string_view key) {
    return serialise_frame(key, {}, kTombstoneLength);
}

FrameHeader parse_frame_header(const uint8_t* data) {
    FrameHeader hdr;
    hdr.key_len = read_u32_le(data);
    hdr.value_len = read_u32_le(data + 4);
    return hdr;
}

std::error_code parse_record(const uint8_t* data, std::size_t length, Record& out) {
    if (length < kFrameOverhead) {
        return make_error_code(StoreErrc::corruption);
    }

    const FrameHeader hdr = parse_frame_header(data);
    if (hdr.frame_size() != length) {
        return make_error_code(StoreErrc::corruption);
    }

    const std::size_t payload_len = length - kFrameTrailerSize;
    const uint32_t stored_crc = read_u32_le(data + payload_len);
    if (crc32(data, payload_len) != stored_crc) {
        return make_error_code(StoreErrc::corruption);
    }

    const auto* key_ptr = reinterpret_cast<const char*>(data + kFrameHeaderSize);
    out.key.assign(key_ptr, hdr.key_len);
    out.tombstone = hdr.is_tombstone();
    if (out.tombstone) {
        out.value.clear();
    } else {
        out.value.assign(key_ptr + hdr.key_len, hdr.value_len);
    }
    return {};
}

} // namespace logkv::storage
