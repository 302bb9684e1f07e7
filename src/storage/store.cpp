#include "storage/store.hpp"

#include "storage/record.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace logkv {

namespace {

StoreOptions normalise(StoreOptions options) {
    options.max_key_size = static_cast<std::size_t>(
        std::min<uint64_t>(options.max_key_size, storage::kMaxKeyLength));
    options.max_value_size = std::min(options.max_value_size, storage::kMaxValueLength);
    if (!options.logger) {
        options.logger = spdlog::default_logger();
    }
    return options;
}

} // anonymous namespace

Store::Store(std::filesystem::path path, StoreOptions options)
    : path_(std::move(path))
    , options_(normalise(std::move(options)))
    , logger_(options_.logger)
    , log_(path_, options_.lock_file, logger_)
    , compactor_(options_.compaction, options_.lock_file, logger_)
{}

Store::~Store() {
    if (auto ec = close()) {
        logger_->error("Store: failed to flush {} on destruction: {}",
                       path_.string(), ec.message());
    }
}

// ── Locking ───────────────────────────────────────────────────────────────────

Store::ReadLock Store::read_lock() const {
    if (!options_.thread_safe) {
        return ReadLock(mutex_, std::defer_lock);
    }
    return ReadLock(mutex_);
}

Store::WriteLock Store::write_lock() const {
    if (!options_.thread_safe) {
        return WriteLock(mutex_, std::defer_lock);
    }
    return WriteLock(mutex_);
}

void Store::ensure_open() const {
    if (!open_) {
        throw std::logic_error("logkv::Store used while not open: " + path_.string());
    }
}

std::error_code Store::validate_key(std::string_view key) const {
    if (key.empty() || key.size() > options_.max_key_size) {
        return make_error_code(StoreErrc::invalid_key);
    }
    return {};
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

std::error_code Store::open() {
    auto lock = write_lock();
    if (open_) {
        return {};
    }

    auto ec = log_.open(options_.reset_if_unreadable);
    if (ec) {
        logger_->error("Store: failed to open {}: {}", path_.string(), ec.message());
        return ec;
    }

    // We hold the file lock now, so a leftover sibling cannot be a live run.
    compactor_.discard_stale(path_);

    storage::ScanResult scan;
    ec = index_.rebuild_from(log_, scan);
    if (ec) {
        logger_->error("Store: failed to replay {}: {}", path_.string(), ec.message());
        index_.clear();
        log_.close();
        return ec;
    }

    recovered_bytes_ = scan.discarded_bytes;
    open_ = true;

    logger_->info("Store: opened {} ({} keys, {} frames, {} bytes)",
                  path_.string(), index_.count(), scan.frames, log_.size());

    if (options_.compact_on_open) {
        maybe_compact_locked();
    }
    return {};
}

std::error_code Store::close() {
    auto lock = write_lock();
    if (!open_) {
        return {};
    }

    auto ec = log_.sync();
    log_.close();
    index_.clear();
    open_ = false;

    if (ec) {
        logger_->error("Store: final flush of {} failed: {}", path_.string(), ec.message());
    } else {
        logger_->info("Store: closed {}", path_.string());
    }
    return ec;
}

bool Store::is_open() const {
    auto lock = read_lock();
    return open_;
}

// ── Writes ────────────────────────────────────────────────────────────────────

std::error_code Store::set(std::string_view key, std::string_view value) {
    auto lock = write_lock();
    ensure_open();

    if (auto ec = validate_key(key)) {
        return ec;
    }
    if (value.size() > options_.max_value_size) {
        return make_error_code(StoreErrc::invalid_value);
    }

    const auto frame = storage::serialise_record(key, value);
    uint64_t offset = 0;
    if (auto ec = log_.append(frame, options_.sync_writes, offset)) {
        logger_->error("Store: append to {} failed: {}", path_.string(), ec.message());
        return ec;
    }

    // Publish only after the frame is on disk.
    auto previous = index_.put(std::string(key), storage::IndexEntry{
        .offset = offset,
        .length = frame.size(),
        .value_size = static_cast<uint32_t>(value.size()),
        .generation = log_.generation(),
        .sequence = index_.next_sequence(),
    });

    logger_->trace("Store: set key_len={} value_len={} at offset {}",
                   key.size(), value.size(), offset);

    if (previous) {
        maybe_compact_locked();
    }
    return {};
}

std::error_code Store::remove_locked(std::string_view key) {
    if (index_.find(key) == nullptr) {
        return {};  // Already absent.
    }

    const auto frame = storage::serialise_tombstone(key);
    uint64_t offset = 0;
    if (auto ec = log_.append(frame, options_.sync_writes, offset)) {
        logger_->error("Store: tombstone append to {} failed: {}",
                       path_.string(), ec.message());
        return ec;
    }

    index_.erase(key);
    logger_->trace("Store: removed key_len={} (tombstone at offset {})", key.size(), offset);
    return {};
}

std::error_code Store::remove(std::string_view key) {
    auto lock = write_lock();
    ensure_open();

    if (auto ec = validate_key(key)) {
        return ec;
    }
    auto ec = remove_locked(key);
    if (!ec) {
        maybe_compact_locked();
    }
    return ec;
}

std::error_code Store::remove_many(const std::vector<std::string>& keys) {
    auto lock = write_lock();
    ensure_open();

    std::error_code first_error;
    for (const auto& key : keys) {
        auto ec = validate_key(key);
        if (!ec) {
            ec = remove_locked(key);
        }
        if (ec && !first_error) {
            first_error = ec;
        }
    }

    if (!keys.empty()) {
        maybe_compact_locked();
    }
    return first_error;
}

std::error_code Store::remove_all() {
    auto lock = write_lock();
    ensure_open();

    const std::size_t dropped = index_.count();
    auto ec = compactor_.reset(log_, index_);
    if (ec) {
        logger_->error("Store: failed to reset {}: {}", path_.string(), ec.message());
        return ec;
    }

    logger_->info("Store: removed all {} keys from {}", dropped, path_.string());
    return {};
}

void Store::maybe_compact_locked() {
    std::error_code ec;
    if (compactor_.maybe_compact(log_, index_, ec) && ec) {
        logger_->warn("Store: compaction of {} failed, keeping current file: {}",
                      path_.string(), ec.message());
    }
}

// ── Reads ─────────────────────────────────────────────────────────────────────

std::error_code Store::read_locked(std::string_view key,
                                   const storage::IndexEntry& entry,
                                   std::string& value) const {
    if (entry.generation != log_.generation()) {
        return make_error_code(StoreErrc::corruption);
    }

    std::vector<uint8_t> frame;
    if (auto ec = log_.read(entry.offset, entry.length, frame)) {
        return ec;
    }

    storage::Record record;
    if (auto ec = storage::parse_record(frame.data(), frame.size(), record)) {
        return ec;
    }
    if (record.tombstone || record.key != key) {
        return make_error_code(StoreErrc::corruption);
    }

    value = std::move(record.value);
    return {};
}

std::error_code Store::read(std::string_view key, std::string& value) const {
    auto lock = read_lock();
    ensure_open();

    if (auto ec = validate_key(key)) {
        return ec;
    }
    const auto* entry = index_.find(key);
    if (entry == nullptr) {
        return make_error_code(StoreErrc::key_not_found);
    }
    return read_locked(key, *entry, value);
}

std::optional<std::string> Store::get(std::string_view key) const {
    std::string value;
    auto ec = read(key, value);
    if (!ec) {
        return value;
    }
    if (ec != StoreErrc::key_not_found && ec != StoreErrc::invalid_key) {
        logger_->error("Store: failed to read key from {}: {}", path_.string(), ec.message());
    }
    return std::nullopt;
}

bool Store::exists(std::string_view key) const {
    auto lock = read_lock();
    ensure_open();

    if (validate_key(key)) {
        return false;
    }
    return index_.find(key) != nullptr;
}

std::vector<std::string> Store::all_values() const {
    auto lock = read_lock();
    ensure_open();

    std::vector<std::string> values;
    values.reserve(index_.count());
    for (const auto& [key, entry] : index_.by_sequence(true)) {
        std::string value;
        if (auto ec = read_locked(*key, *entry, value)) {
            logger_->error("Store: skipping unreadable value in {}: {}",
                           path_.string(), ec.message());
            continue;
        }
        values.push_back(std::move(value));
    }
    return values;
}

std::vector<std::string> Store::keys() const {
    auto lock = read_lock();
    ensure_open();

    std::vector<std::string> result;
    result.reserve(index_.count());
    for (const auto& [key, entry] : index_.by_sequence(true)) {
        result.push_back(*key);
    }
    return result;
}

std::size_t Store::count() const {
    auto lock = read_lock();
    ensure_open();
    return index_.count();
}

uint64_t Store::total_size() const {
    auto lock = read_lock();
    ensure_open();
    return index_.total_value_size();
}

StoreStats Store::stats() const {
    auto lock = read_lock();
    ensure_open();

    return StoreStats{
        .count = index_.count(),
        .total_value_size = index_.total_value_size(),
        .file_size = log_.size(),
        .garbage_bytes = storage::Compactor::garbage_bytes(log_, index_),
        .compactions = compactor_.runs(),
        .recovered_bytes = recovered_bytes_,
    };
}

// ── Maintenance ───────────────────────────────────────────────────────────────

std::error_code Store::compact() {
    auto lock = write_lock();
    ensure_open();
    return compactor_.compact(log_, index_);
}

std::error_code Store::rebuild_index() {
    auto lock = write_lock();
    ensure_open();

    storage::ScanResult scan;
    auto ec = index_.rebuild_from(log_, scan);
    if (ec) {
        // A partial index over a file of unknown size must not take writes.
        logger_->error("Store: index rebuild of {} failed, closing: {}",
                       path_.string(), ec.message());
        index_.clear();
        log_.close();
        open_ = false;
        return ec;
    }
    recovered_bytes_ += scan.discarded_bytes;
    logger_->info("Store: rebuilt index of {} ({} keys, {} bytes discarded)",
                  path_.string(), index_.count(), scan.discarded_bytes);
    return {};
}

std::error_code Store::sync() {
    auto lock = read_lock();
    ensure_open();
    return log_.sync();
}

} // namespace logkv
