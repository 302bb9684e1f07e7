#pragma once

#include "storage/append_log.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace logkv::storage {

// Location of the latest live frame for one key.
struct IndexEntry {
    uint64_t offset = 0;       // frame start in the AppendLog
    uint64_t length = 0;       // full frame length, trailer included
    uint32_t value_size = 0;
    uint64_t generation = 0;   // AppendLog::generation() the offset belongs to
    uint64_t sequence = 0;     // write order; larger is more recent
};

// ── Index ────────────────────────────────────────────────────────────────────
//
// In-memory map from key to IndexEntry.  Only live keys are present: a
// tombstone removes the entry.  count(), total_value_size() and
// live_frame_bytes() are kept up to date on every mutation.
//
// Thread-safety: NOT thread-safe.  Store guards it with its read-write lock.

class Index {
public:
    using EntryVisitor = std::function<void(const std::string&, const IndexEntry&)>;

    Index() = default;

    Index(const Index&) = delete;
    Index& operator=(const Index&) = delete;

    // Returns the entry for `key`, or nullptr if absent.  The pointer is
    // invalidated by the next mutation.
    [[nodiscard]] const IndexEntry* find(std::string_view key) const;

    // Inserts or overwrites `key`.  Returns the entry it replaced, if any.
    std::optional<IndexEntry> put(const std::string& key, const IndexEntry& entry);

    // Removes `key`.  Returns true if the key existed.
    bool erase(std::string_view key);

    // Points an existing key at a new frame position (same frame bytes).
    void relocate(const std::string& key, uint64_t offset, uint64_t generation);

    void clear();

    // Visits every entry (order is unspecified).
    void for_each(const EntryVisitor& visit) const;

    // Entries ordered by write sequence.  Pointers are invalidated by the next
    // mutation.
    [[nodiscard]] std::vector<std::pair<const std::string*, const IndexEntry*>>
    by_sequence(bool newest_first) const;

    // Clears the index and replays every frame of `log` in file order.  A
    // value frame overwrites its key, a tombstone erases it.
    [[nodiscard]] std::error_code rebuild_from(AppendLog& log, ScanResult& result);

    // Hands out the next write sequence number.
    [[nodiscard]] uint64_t next_sequence() { return ++last_sequence_; }

    [[nodiscard]] std::size_t count() const { return map_.size(); }

    [[nodiscard]] uint64_t total_value_size() const { return total_value_size_; }

    [[nodiscard]] uint64_t live_frame_bytes() const { return live_frame_bytes_; }

private:
    // Lets find() take a string_view without building a std::string.
    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view key) const noexcept {
            return std::hash<std::string_view>{}(key);
        }
    };

    void account_remove(const IndexEntry& entry);

    std::unordered_map<std::string, IndexEntry, KeyHash, std::equal_to<>> map_;
    uint64_t total_value_size_ = 0;
    uint64_t live_frame_bytes_ = 0;
    uint64_t last_sequence_ = 0;
};

} // namespace logkv::storage
