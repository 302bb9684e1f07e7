#pragma once

#include "storage/compactor.hpp"
#include "storage/record.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace logkv {

// ── StoreOptions ──────────────────────────────────────────────────────────────
// Tuning knobs for one Store handle.  Defaults suit an on-device settings or
// cache store.

struct StoreOptions {
    std::size_t max_key_size   = 64 * 1024;                  // bytes; longer keys are invalid_key
    uint64_t    max_value_size = storage::kMaxValueLength;   // bytes; longer values are invalid_value

    bool thread_safe         = true;   // guard every call with the read-write lock
    bool sync_writes         = true;   // fdatasync each frame before returning
    bool lock_file           = true;   // flock() the data file while open
    bool compact_on_open     = true;   // run the compaction check after replay
    bool reset_if_unreadable = false;  // empty a file with a bad header instead of failing

    storage::CompactionPolicy compaction;

    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger();
};

} // namespace logkv
