#include "storage/compactor.hpp"

#include "storage/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace logkv::storage {

Compactor::Compactor(CompactionPolicy policy,
                     bool lock_file,
                     std::shared_ptr<spdlog::logger> logger)
    : policy_(policy)
    , lock_file_(lock_file)
    , logger_(std::move(logger))
{}

std::filesystem::path Compactor::sibling_path(const std::filesystem::path& log_path) {
    auto tmp_path = log_path;
    tmp_path += ".compact";
    return tmp_path;
}

uint64_t Compactor::garbage_bytes(const AppendLog& log, const Index& index) {
    const uint64_t reachable = kLogHeaderSize + index.live_frame_bytes();
    return log.size() > reachable ? log.size() - reachable : 0;
}

bool Compactor::should_compact(const AppendLog& log, const Index& index) const {
    const uint64_t garbage = garbage_bytes(log, index);
    if (garbage <= policy_.min_garbage_bytes) {
        return false;
    }
    return static_cast<double>(garbage) >
           policy_.garbage_ratio * static_cast<double>(log.size());
}

bool Compactor::maybe_compact(AppendLog& log, Index& index, std::error_code& ec) {
    ec.clear();
    if (!should_compact(log, index)) {
        return false;
    }
    ec = compact(log, index);
    return true;
}

std::error_code Compactor::compact(AppendLog& log, Index& index) {
    return rewrite(log, index, true);
}

std::error_code Compactor::reset(AppendLog& log, Index& index) {
    return rewrite(log, index, false);
}

void Compactor::discard_stale(const std::filesystem::path& log_path) const {
    const auto tmp_path = sibling_path(log_path);
    std::error_code ec;
    if (std::filesystem::remove(tmp_path, ec)) {
        logger_->warn("Compactor: removed unfinished compaction file {}", tmp_path.string());
    } else if (ec) {
        logger_->warn("Compactor: failed to remove {}: {}", tmp_path.string(), ec.message());
    }
}

std::error_code Compactor::rewrite(AppendLog& log, Index& index, bool keep_live) {
    const auto tmp_path = sibling_path(log.path());
    const uint64_t bytes_before = log.size();

    AppendLog fresh(tmp_path, lock_file_, logger_);

    auto abort = [&](std::error_code ec, const char* step) {
        logger_->error("Compactor: {} failed for {}: {}",
                       step, log.path().string(), ec.message());
        fresh.close();
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    };

    auto ec = fresh.create();
    if (ec) return abort(ec, "create");

    // Step 1: copy live frames, oldest first, so write order survives reopen.
    std::vector<std::pair<std::string, uint64_t>> moved;
    if (keep_live) {
        moved.reserve(index.count());
        std::vector<uint8_t> frame;
        Record record;

        for (const auto& [key, entry] : index.by_sequence(false)) {
            if (entry->generation != log.generation()) {
                return abort(make_error_code(StoreErrc::corruption), "stale index entry");
            }

            ec = log.read(entry->offset, entry->length, frame);
            if (ec) return abort(ec, "read");

            ec = parse_record(frame.data(), frame.size(), record);
            if (!ec && (record.tombstone || record.key != *key)) {
                ec = make_error_code(StoreErrc::corruption);
            }
            if (ec) return abort(ec, "verify");

            uint64_t new_offset = 0;
            ec = fresh.append(frame, false, new_offset);
            if (ec) return abort(ec, "append");

            moved.emplace_back(*key, new_offset);
        }
    }

    // Step 2: make the new file durable before it becomes authoritative.
    ec = fresh.sync();
    if (ec) return abort(ec, "sync");

    // Step 3: atomic swap.
    ec = log.replace_with(fresh);
    if (ec) return abort(ec, "rename");

    // Step 4: the offsets are already known – no second replay.
    if (keep_live) {
        for (const auto& [key, offset] : moved) {
            index.relocate(key, offset, log.generation());
        }
    } else {
        index.clear();
    }
    ++runs_;

    logger_->info("Compactor: rewrote {} ({} -> {} bytes, {} live records)",
                  log.path().string(), bytes_before, log.size(), index.count());
    return {};
}

} // namespace logkv::storage
