#include "docsync/sync/pending_index.hpp"

#include <mutex>

namespace docsync::sync {

bool PendingIndex::insert(PendingItem item) {
    std::unique_lock lock(mutex_);
    auto key = item.content_id;
    return items_.try_emplace(std::move(key), std::move(item)).second;
}

std::optional<PendingItem> PendingIndex::take(const ContentDigest& digest) {
    std::unique_lock lock(mutex_);
    auto it = items_.find(digest);
    if (it == items_.end()) {
        return std::nullopt;
    }
    PendingItem item = std::move(it->second);
    items_.erase(it);
    return item;
}

std::optional<PendingItem> PendingIndex::find(const ContentDigest& digest) const {
    std::shared_lock lock(mutex_);
    auto it = items_.find(digest);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PendingIndex::contains(const ContentDigest& digest) const {
    std::shared_lock lock(mutex_);
    return items_.find(digest) != items_.end();
}

std::size_t PendingIndex::size() const {
    std::shared_lock lock(mutex_);
    return items_.size();
}

bool PendingIndex::empty() const {
    std::shared_lock lock(mutex_);
    return items_.empty();
}

std::uint64_t PendingIndex::pending_bytes() const {
    std::shared_lock lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& [digest, item] : items_) {
        total += item.size_bytes;
    }
    return total;
}

std::vector<PendingItem> PendingIndex::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<PendingItem> items;
    items.reserve(items_.size());
    for (const auto& [digest, item] : items_) {
        items.push_back(item);
    }
    return items;
}

} // namespace docsync::sync
