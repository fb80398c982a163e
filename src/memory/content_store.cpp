#include "docsync/memory/content_store.hpp"

#include <mutex>

namespace docsync::memory {

sync::ContentDigest MemoryContentStore::put(const Bytes& content) {
    auto digest = fnv1a_hex(content);
    std::unique_lock lock(mutex_);
    blobs_.try_emplace(digest, content);
    return digest;
}

Result<Bytes> MemoryContentStore::resolve(const sync::ContentDigest& digest) const {
    std::shared_lock lock(mutex_);
    auto it = blobs_.find(digest);
    if (it == blobs_.end()) {
        return Err<Bytes>(ErrorCode::ContentNotFound, "Content not stored locally: " + digest);
    }
    return Ok(it->second);
}

bool MemoryContentStore::contains(const sync::ContentDigest& digest) const {
    std::shared_lock lock(mutex_);
    return blobs_.count(digest) > 0;
}

bool MemoryContentStore::erase(const sync::ContentDigest& digest) {
    std::unique_lock lock(mutex_);
    return blobs_.erase(digest) > 0;
}

std::size_t MemoryContentStore::size() const {
    std::shared_lock lock(mutex_);
    return blobs_.size();
}

} // namespace docsync::memory
