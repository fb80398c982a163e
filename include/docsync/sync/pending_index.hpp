#pragma once

/**
 * @file pending_index.hpp
 * @brief Content that has been announced but not yet materialized
 *
 * INVARIANT:
 * An entry exists iff metadata for the digest was observed and the content
 * has not been confirmed locally available since.
 *
 * CONCURRENCY MODEL:
 * One writer (the session worker) and any number of readers (status
 * queries). Readers take a shared lock, the writer an exclusive one.
 */

#include "docsync/sync/types.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace docsync::sync {

class PendingIndex {
public:
    PendingIndex() = default;

    PendingIndex(const PendingIndex&) = delete;
    PendingIndex& operator=(const PendingIndex&) = delete;

    /**
     * First writer wins: a digest that is already pending keeps its
     * original item.
     *
     * @return true if the item was added, false if the digest was present
     */
    bool insert(PendingItem item);

    /// Removes and returns the item, or nullopt if the digest is unknown.
    std::optional<PendingItem> take(const ContentDigest& digest);

    std::optional<PendingItem> find(const ContentDigest& digest) const;
    bool contains(const ContentDigest& digest) const;

    std::size_t size() const;
    bool empty() const;

    /// Sum of size_bytes over all pending items.
    std::uint64_t pending_bytes() const;

    std::vector<PendingItem> snapshot() const;

private:
    std::unordered_map<ContentDigest, PendingItem> items_;
    mutable std::shared_mutex mutex_;
};

} // namespace docsync::sync
