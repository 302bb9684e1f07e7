#pragma once

#include "storage/append_log.hpp"
#include "storage/compactor.hpp"
#include "storage/errors.hpp"
#include "storage/index.hpp"
#include "storage/store_options.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace logkv {

struct StoreStats {
    std::size_t count = 0;             // live keys
    uint64_t total_value_size = 0;     // sum of live value lengths
    uint64_t file_size = 0;            // physical data file size
    uint64_t garbage_bytes = 0;        // file bytes no live key points at
    uint64_t compactions = 0;          // compactions + resets since open
    uint64_t recovered_bytes = 0;      // invalid tail dropped by open() and rebuild_index()
};

// ── Store ─────────────────────────────────────────────────────────────────────
//
// Embedded key-value store over a single append-only data file.
//
//   set/remove  → Record frame → AppendLog::append → Index update
//   get         → Index lookup → AppendLog::read (pread) → frame verify
//
// Removals and overwrites leave garbage behind; once it crosses the
// compaction policy the live frames are copied into a fresh file that is
// renamed over the old one.
//
// Concurrency model (StoreOptions::thread_safe, on by default):
//   - get() / read() / exists() / all_values() / keys() / count() /
//     total_size() / stats() / sync() acquire a shared (read) lock.
//   - open() / set() / remove() / remove_many() / remove_all() / compact() /
//     rebuild_index() / close() acquire an exclusive (write) lock.
//
// Every operation except open() and close() throws std::logic_error when the
// store is not open.

class Store {
public:
    explicit Store(std::filesystem::path path, StoreOptions options = {});

    // Closes the store if still open, logging (not throwing) a failed flush.
    ~Store();

    // Not copyable or movable – owns a lock and a file descriptor.
    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&)                 = delete;
    Store& operator=(Store&&)      = delete;

    // Opens (or creates) the data file and rebuilds the index from it.  A
    // torn or corrupt tail is dropped, not reported.  Idempotent.
    [[nodiscard]] std::error_code open();

    // Flushes and releases the file.  Idempotent.
    [[nodiscard]] std::error_code close();

    [[nodiscard]] bool is_open() const;

    // Inserts or overwrites `key`.  Durable on success when sync_writes.
    [[nodiscard]] std::error_code set(std::string_view key, std::string_view value);

    // Removes `key`.  Removing an absent key succeeds without writing.
    [[nodiscard]] std::error_code remove(std::string_view key);

    // Removes every key in `keys`, continuing past failures.  Returns the
    // first failure, or success (also for an empty list).
    [[nodiscard]] std::error_code remove_many(const std::vector<std::string>& keys);

    // Atomically empties the store and shrinks the file to its header.
    [[nodiscard]] std::error_code remove_all();

    // Returns the value for `key`, or std::nullopt if it is absent.  Read
    // failures (corruption, I/O) are logged and also yield std::nullopt.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Like get(), but reports why a value could not be returned:
    // StoreErrc::key_not_found, StoreErrc::invalid_key, StoreErrc::corruption
    // or an I/O errno.
    [[nodiscard]] std::error_code read(std::string_view key, std::string& value) const;

    [[nodiscard]] bool exists(std::string_view key) const;

    // All live values, most recently written first.  Values that cannot be
    // read back are logged and skipped.
    [[nodiscard]] std::vector<std::string> all_values() const;

    // All live keys, most recently written first.
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t count() const;

    // Sum of live value lengths (keys and framing excluded).
    [[nodiscard]] uint64_t total_size() const;

    [[nodiscard]] StoreStats stats() const;

    // Compacts now, regardless of the policy.
    [[nodiscard]] std::error_code compact();

    // Re-reads the data file and rebuilds the index from scratch, dropping
    // any invalid tail as open() does.  On an I/O failure the store is left
    // closed.
    [[nodiscard]] std::error_code rebuild_index();

    // fdatasync the data file (only needed when sync_writes is off).
    [[nodiscard]] std::error_code sync();

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] const StoreOptions& options() const { return options_; }

private:
    using ReadLock  = std::shared_lock<std::shared_mutex>;
    using WriteLock = std::unique_lock<std::shared_mutex>;

    [[nodiscard]] ReadLock read_lock() const;
    [[nodiscard]] WriteLock write_lock() const;

    // Throws std::logic_error if the store is not open.
    void ensure_open() const;

    [[nodiscard]] std::error_code validate_key(std::string_view key) const;

    [[nodiscard]] std::error_code remove_locked(std::string_view key);

    [[nodiscard]] std::error_code read_locked(std::string_view key,
                                              const storage::IndexEntry& entry,
                                              std::string& value) const;

    // Compaction check after a write that produced garbage.  A failed
    // compaction is logged; the store keeps using the current file.
    void maybe_compact_locked();

    std::filesystem::path path_;
    StoreOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex mutex_;
    storage::AppendLog log_;
    storage::Index index_;
    storage::Compactor compactor_;
    bool open_ = false;
    uint64_t recovered_bytes_ = 0;
};

} // namespace logkv
