#pragma once

#include "storage/record.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <system_error>
#include <vector>

namespace logkv::storage {

// ── Log header constants ─────────────────────────────────────────────────────

static constexpr char kLogMagic[] = "LKV1";           // 4 bytes (no NUL)
static constexpr std::size_t kLogMagicSize = 4;
static constexpr uint16_t kLogVersion = 1;
static constexpr std::size_t kLogHeaderSize = kLogMagicSize + sizeof(uint16_t);

// ── Scan result ──────────────────────────────────────────────────────────────

struct ScanResult {
    uint64_t frames = 0;           // frames decoded successfully
    uint64_t valid_end = 0;        // offset just past the last good frame
    uint64_t discarded_bytes = 0;  // torn/corrupt tail removed by the scan
};

// Called once per good frame, in file order.
using FrameVisitor =
    std::function<void(uint64_t offset, uint64_t length, const Record& record)>;

// ── AppendLog ────────────────────────────────────────────────────────────────
//
// The single growable data file of a store.
//
//   [magic: "LKV1" (4B)][version: u16 LE = 1][frame]*
//
// Frames are only ever appended; existing byte ranges are never modified, so
// read() (pread) is safe from many threads at once.  append(), truncate_to()
// and replace_with() must be serialised by the caller (Store's write lock).
//
// The file is held under an advisory flock() while open, so a second handle
// on the same path (in this or another process) fails with StoreErrc::locked.

class AppendLog {
public:
    explicit AppendLog(std::filesystem::path path,
                       bool lock_file = true,
                       std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~AppendLog();

    // Non-copyable, non-movable – owns a file descriptor.
    AppendLog(const AppendLog&) = delete;
    AppendLog& operator=(const AppendLog&) = delete;
    AppendLog(AppendLog&&) = delete;
    AppendLog& operator=(AppendLog&&) = delete;

    // Opens the file, creating it (and missing parent directories) with a
    // fresh header if needed.  A file shorter than the header is treated as a
    // torn creation and re-initialised.  A wrong magic/version fails with
    // StoreErrc::bad_header unless `reset_if_unreadable`, which empties it.
    [[nodiscard]] std::error_code open(bool reset_if_unreadable = false);

    // Creates the file from scratch (truncating any previous content) and
    // writes only the header.  Used for compaction targets.
    [[nodiscard]] std::error_code create();

    void close();

    // Appends one complete frame at the end of the file.  With `sync` the
    // data is fdatasync'd before returning.  On failure the file is cut back
    // to its previous end and `offset` is left untouched.
    [[nodiscard]] std::error_code append(const std::vector<uint8_t>& frame,
                                         bool sync,
                                         uint64_t& offset);

    // Reads exactly `length` bytes at `offset`.
    [[nodiscard]] std::error_code read(uint64_t offset,
                                       uint64_t length,
                                       std::vector<uint8_t>& out) const;

    // Cuts the file to `offset` bytes (never below the header).
    [[nodiscard]] std::error_code truncate_to(uint64_t offset);

    [[nodiscard]] std::error_code sync();

    // Re-reads the file size, then decodes every frame from the header
    // onwards.  The first incomplete, unreadable or corrupt frame ends the
    // valid data: the file is truncated there and the removed byte count
    // reported in `result.discarded_bytes`.  A file that shrank below the
    // header is re-initialised.
    [[nodiscard]] std::error_code scan(const FrameVisitor& visit, ScanResult& result);

    // Atomically renames `fresh` over this log's path and adopts its file
    // descriptor.  `fresh` must be open; it is left closed.  On failure this
    // log is unchanged and `fresh` still owns its file.
    [[nodiscard]] std::error_code replace_with(AppendLog& fresh);

    [[nodiscard]] bool is_open() const { return fd_ != -1; }

    [[nodiscard]] uint64_t size() const { return size_; }

    // Incremented on every replace_with(); offsets from an older generation
    // refer to a file that no longer exists.
    [[nodiscard]] uint64_t generation() const { return generation_; }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    // Write all bytes at `offset`, retrying on EINTR and short writes.
    [[nodiscard]] std::error_code write_at(uint64_t offset, const uint8_t* data,
                                           std::size_t len);

    [[nodiscard]] std::error_code write_header();

    // Re-reads the file size with fstat().
    [[nodiscard]] std::error_code refresh_size();

    [[nodiscard]] std::error_code validate_header() const;

    [[nodiscard]] std::error_code lock();

    std::filesystem::path path_;
    bool lock_file_;
    std::shared_ptr<spdlog::logger> logger_;
    int fd_ = -1;
    uint64_t size_ = 0;
    uint64_t generation_ = 0;
};

} // namespace logkv::storage
