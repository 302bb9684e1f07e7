#include "storage/index.hpp"

#include <algorithm>

namespace logkv::storage {

const IndexEntry* Index::find(std::string_view key) const {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<IndexEntry> Index::put(const std::string& key, const IndexEntry& entry) {
    std::optional<IndexEntry> previous;

    auto [it, inserted] = map_.try_emplace(key, entry);
    if (!inserted) {
        previous = it->second;
        account_remove(it->second);
        it->second = entry;
    }

    total_value_size_ += entry.value_size;
    live_frame_bytes_ += entry.length;
    return previous;
}

bool Index::erase(std::string_view key) {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return false;
    }
    account_remove(it->second);
    map_.erase(it);
    return true;
}

void Index::relocate(const std::string& key, uint64_t offset, uint64_t generation) {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return;
    }
    it->second.offset = offset;
    it->second.generation = generation;
}

void Index::clear() {
    map_.clear();
    total_value_size_ = 0;
    live_frame_bytes_ = 0;
}

void Index::for_each(const EntryVisitor& visit) const {
    for (const auto& [key, entry] : map_) {
        visit(key, entry);
    }
}

std::vector<std::pair<const std::string*, const IndexEntry*>>
Index::by_sequence(bool newest_first) const {
    std::vector<std::pair<const std::string*, const IndexEntry*>> result;
    result.reserve(map_.size());
    for (const auto& [key, entry] : map_) {
        result.emplace_back(&key, &entry);
    }

    std::sort(result.begin(), result.end(), [newest_first](const auto& a, const auto& b) {
        return newest_first ? a.second->sequence > b.second->sequence
                            : a.second->sequence < b.second->sequence;
    });
    return result;
}

std::error_code Index::rebuild_from(AppendLog& log, ScanResult& result) {
    clear();

    const uint64_t generation = log.generation();
    return log.scan(
        [this, generation](uint64_t offset, uint64_t length, const Record& record) {
            if (record.tombstone) {
                erase(record.key);
                return;
            }
            put(record.key, IndexEntry{
                .offset = offset,
                .length = length,
                .value_size = static_cast<uint32_t>(record.value.size()),
                .generation = generation,
                .sequence = next_sequence(),
            });
        },
        result);
}

void Index::account_remove(const IndexEntry& entry) {
    total_value_size_ -= entry.value_size;
    live_frame_bytes_ -= entry.length;
}

} // namespace logkv::storage
