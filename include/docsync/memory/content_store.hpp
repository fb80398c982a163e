#pragma once

/**
 * @file content_store.hpp
 * @brief Content-addressed blob storage held in memory
 *
 * WHY THIS FILE EXISTS:
 * Every node needs somewhere to keep the bytes its log entries point at.
 * Entries only carry a digest; resolve() turns it back into bytes once
 * the content is local.
 *
 * THREAD SAFETY PATTERN:
 * - resolve/contains/size take a shared lock (many concurrent readers)
 * - put/erase take an exclusive lock
 *
 * DIGESTS:
 * fnv1a_hex() of the content. Identical bytes share one slot, so a put of
 * already-stored content is a no-op that returns the same digest.
 */

#include "docsync/core/encoding.hpp"
#include "docsync/sync/document.hpp"

#include <shared_mutex>
#include <unordered_map>

namespace docsync::memory {

class MemoryContentStore : public sync::ContentStore {
public:
    MemoryContentStore() = default;

    sync::ContentDigest put(const Bytes& content);

    Result<Bytes> resolve(const sync::ContentDigest& digest) const override;

    bool contains(const sync::ContentDigest& digest) const;

    /// Drops stored bytes; entries pointing at them resolve to ContentNotFound.
    bool erase(const sync::ContentDigest& digest);

    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<sync::ContentDigest, Bytes> blobs_;
};

} // namespace docsync::memory
