#pragma once

#include "storage/append_log.hpp"
#include "storage/index.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <system_error>

namespace logkv::storage {

// Garbage must exceed both thresholds before a compaction runs.
struct CompactionPolicy {
    uint64_t min_garbage_bytes = 4096;  // absolute floor
    double garbage_ratio = 0.5;         // fraction of the file size
};

// ── Compactor ────────────────────────────────────────────────────────────────
//
// Rewrites an AppendLog so it holds only the frames the Index still points at.
//
//   1. Create <log path>.compact with a fresh header.
//   2. Copy each live frame unchanged, oldest write first, recording its new
//      offset.  Every frame is verified before it is copied.
//   3. fdatasync, then rename over the original (AppendLog::replace_with).
//   4. Point the index entries at the recorded offsets.  No replay.
//
// Until step 3 commits, the original file and index stay authoritative; any
// failure removes the sibling file.  A sibling left by a crash is deleted by
// discard_stale() on the next open.
//
// Thread-safety: NOT thread-safe.  Caller holds the store's exclusive lock.

class Compactor {
public:
    explicit Compactor(CompactionPolicy policy = {},
                       bool lock_file = true,
                       std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // Bytes in `log` not reachable from `index`.
    [[nodiscard]] static uint64_t garbage_bytes(const AppendLog& log, const Index& index);

    [[nodiscard]] bool should_compact(const AppendLog& log, const Index& index) const;

    // Runs compact() if should_compact().  Returns whether it ran; a failed
    // run returns true with `ec` set.
    bool maybe_compact(AppendLog& log, Index& index, std::error_code& ec);

    // Unconditional compaction.
    [[nodiscard]] std::error_code compact(AppendLog& log, Index& index);

    // Swaps in a header-only file and clears the index.
    [[nodiscard]] std::error_code reset(AppendLog& log, Index& index);

    // Removes a compaction target left behind by an interrupted run.
    void discard_stale(const std::filesystem::path& log_path) const;

    [[nodiscard]] static std::filesystem::path sibling_path(const std::filesystem::path& log_path);

    [[nodiscard]] const CompactionPolicy& policy() const { return policy_; }

    // Number of successful compactions and resets.
    [[nodiscard]] uint64_t runs() const { return runs_; }

private:
    [[nodiscard]] std::error_code rewrite(AppendLog& log, Index& index, bool keep_live);

    CompactionPolicy policy_;
    bool lock_file_;
    std::shared_ptr<spdlog::logger> logger_;
    uint64_t runs_ = 0;
};

} // namespace logkv::storage
