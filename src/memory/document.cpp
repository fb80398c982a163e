#include "docsync/memory/document.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <tuple>

namespace docsync::memory {
namespace {

bool is_newer(const sync::LogEntry& candidate, const sync::LogEntry& current) {
    return std::tie(candidate.timestamp_us, candidate.author, candidate.content_digest) >
           std::tie(current.timestamp_us, current.author, current.content_digest);
}

sync::RemoteInsert remote_insert_for(const sync::LogEntry& entry,
                                     const std::string& dataset,
                                     const sync::PeerId& from) {
    return sync::RemoteInsert{
        entry.content_digest,
        entry.content_size,
        to_text(entry.key),
        dataset,
        from,
    };
}

} // namespace

MemoryDocument::MemoryDocument(std::string namespace_id,
                               std::string dataset,
                               std::string node_id,
                               std::shared_ptr<MemoryContentStore> store,
                               std::shared_ptr<MemoryHub> hub)
    : namespace_id_(std::move(namespace_id)),
      dataset_(std::move(dataset)),
      node_id_(std::move(node_id)),
      store_(std::move(store)),
      hub_(std::move(hub)) {}

MemoryDocument::~MemoryDocument() {
    auto peers = hub_->replicas(namespace_id_, this);
    hub_->detach(namespace_id_, this);
    for (const auto& peer : peers) {
        peer->announce_peer_left(node_id_);
    }

    std::lock_guard lock(mutex_);
    for (const auto& channel : channels_) {
        channel->shutdown();
    }
}

// ──────────────────────────────────────────────────────────
// DocumentLog
// ──────────────────────────────────────────────────────────

Result<std::unique_ptr<sync::EventSubscription>> MemoryDocument::subscribe() {
    std::lock_guard lock(mutex_);
    if (fail_subscriptions_) {
        return Err<std::unique_ptr<sync::EventSubscription>>(
            ErrorCode::SubscriptionFailed, "Event stream unavailable for " + dataset_);
    }

    auto channel = std::make_shared<MemorySubscription::Channel>();
    if (!subscribed_once_) {
        subscribed_once_ = true;
        for (auto& event : backlog_) {
            channel->try_push(std::move(event));
        }
        backlog_.clear();
    }
    channels_.push_back(channel);

    std::unique_ptr<sync::EventSubscription> subscription = std::make_unique<MemorySubscription>(channel);
    return Ok(std::move(subscription));
}

Result<std::vector<sync::LogEntry>> MemoryDocument::latest_per_key() const {
    std::vector<sync::LogEntry> result;
    std::lock_guard lock(mutex_);
    result.reserve(latest_.size());
    for (const auto& [key, entry] : latest_) {
        if (entry.content_size > 0) {
            result.push_back(entry);
        }
    }
    return Ok(std::move(result));
}

Result<sync::ContentDigest> MemoryDocument::set_bytes(const sync::AuthorId& author,
                                                      const Bytes& key,
                                                      const Bytes& content) {
    return write(author, key, &content);
}

Result<std::string> MemoryDocument::share() {
    return Ok(make_ticket(namespace_id_));
}

Result<void> MemoryDocument::del(const sync::AuthorId& author, const Bytes& key) {
    auto result = write(author, key, nullptr);
    if (result.is_error()) {
        return Err<void>(result.error());
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Replication
// ──────────────────────────────────────────────────────────

Result<sync::ContentDigest> MemoryDocument::write(const sync::AuthorId& author,
                                                  const Bytes& key,
                                                  const Bytes* content) {
    sync::LogEntry entry;
    entry.key = key;
    entry.author = author;
    if (content && !content->empty()) {
        entry.content_digest = store_->put(*content);
        entry.content_size = content->size();
    }

    {
        std::lock_guard lock(mutex_);
        entry.timestamp_us = next_timestamp_locked();
        apply_entry_locked(entry);
        publish_locked(sync::LocalInsert{entry});
    }

    for (const auto& peer : hub_->replicas(namespace_id_, this)) {
        peer->receive_remote(entry, node_id_, *store_);
    }
    return Ok(entry.content_digest);
}

void MemoryDocument::receive_remote(const sync::LogEntry& entry,
                                    const sync::PeerId& from,
                                    const MemoryContentStore& source) {
    {
        std::lock_guard lock(mutex_);
        if (!apply_entry_locked(entry)) {
            return;
        }
        publish_locked(remote_insert_for(entry, dataset_, from));
    }

    if (entry.content_size == 0) {
        return;
    }
    if (fetch_content(entry, source)) {
        std::lock_guard lock(mutex_);
        publish_locked(sync::ContentReady{entry.content_digest});
    }
}

void MemoryDocument::sync_from_peers() {
    const auto started = std::chrono::steady_clock::now();
    auto peers = hub_->replicas(namespace_id_, this);

    {
        std::lock_guard lock(mutex_);
        for (const auto& peer : peers) {
            publish_locked(sync::PeerJoined{peer->node_id()});
        }
    }
    for (const auto& peer : peers) {
        peer->announce_peer_joined(node_id_);
    }

    // Metadata first, content afterwards
    struct Fetch {
        sync::LogEntry entry;
        std::shared_ptr<MemoryDocument> source;
    };
    std::vector<Fetch> fetches;
    for (const auto& peer : peers) {
        for (const auto& entry : peer->entries()) {
            std::lock_guard lock(mutex_);
            if (!apply_entry_locked(entry)) {
                continue;
            }
            publish_locked(remote_insert_for(entry, dataset_, peer->node_id()));
            if (entry.content_size > 0) {
                fetches.push_back(Fetch{entry, peer});
            }
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    {
        std::lock_guard lock(mutex_);
        publish_locked(sync::RoundComplete{peers.empty() ? std::string{} : peers.front()->node_id(), elapsed});
    }
    spdlog::debug("[{}] metadata sync with {} peer(s) done, {} blob(s) to fetch",
                  dataset_, peers.size(), fetches.size());

    for (const auto& fetch : fetches) {
        if (fetch_content(fetch.entry, fetch.source->store())) {
            std::lock_guard lock(mutex_);
            publish_locked(sync::ContentReady{fetch.entry.content_digest});
        }
    }

    std::lock_guard lock(mutex_);
    publish_locked(sync::AllClear{});
}

void MemoryDocument::announce_peer_joined(const sync::PeerId& peer) {
    std::lock_guard lock(mutex_);
    publish_locked(sync::PeerJoined{peer});
}

void MemoryDocument::announce_peer_left(const sync::PeerId& peer) {
    std::lock_guard lock(mutex_);
    publish_locked(sync::PeerLeft{peer});
}

void MemoryDocument::fail_subscriptions(bool fail) {
    std::lock_guard lock(mutex_);
    fail_subscriptions_ = fail;
}

std::vector<sync::LogEntry> MemoryDocument::entries() const {
    std::vector<sync::LogEntry> result;
    std::lock_guard lock(mutex_);
    result.reserve(latest_.size());
    for (const auto& [key, entry] : latest_) {
        result.push_back(entry);
    }
    return result;
}

// ──────────────────────────────────────────────────────────
// Internals
// ──────────────────────────────────────────────────────────

bool MemoryDocument::apply_entry_locked(const sync::LogEntry& entry) {
    auto it = latest_.find(entry.key);
    if (it != latest_.end() && !is_newer(entry, it->second)) {
        return false;
    }
    latest_[entry.key] = entry;
    last_timestamp_us_ = std::max(last_timestamp_us_, entry.timestamp_us);
    return true;
}

void MemoryDocument::publish_locked(sync::DocEvent event) {
    if (!subscribed_once_) {
        backlog_.push_back(std::move(event));
        return;
    }

    channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                   [](const auto& channel) { return channel->is_shutdown(); }),
                    channels_.end());
    for (const auto& channel : channels_) {
        channel->try_push(event);
    }
}

bool MemoryDocument::fetch_content(const sync::LogEntry& entry, const MemoryContentStore& source) {
    if (store_->contains(entry.content_digest)) {
        return true;
    }
    auto content = source.resolve(entry.content_digest);
    if (content.is_error()) {
        spdlog::debug("[{}] cannot fetch {}: {}", dataset_, entry.content_digest, content.error().describe());
        return false;
    }
    store_->put(content.value());
    return true;
}

std::int64_t MemoryDocument::next_timestamp_locked() {
    const auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    last_timestamp_us_ = std::max<std::int64_t>(now, last_timestamp_us_ + 1);
    return last_timestamp_us_;
}

} // namespace docsync::memory
