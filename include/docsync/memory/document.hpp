#pragma once

/**
 * @file document.hpp
 * @brief In-process replicated document log
 *
 * WHY THIS FILE EXISTS:
 * Lets two nodes in one process replicate datasets without a network, so
 * sessions see the same event sequence a real transport would produce.
 *
 * EVENT SEQUENCES:
 *
 *   Local write (set_bytes / del on this replica):
 *     LocalInsert                         -> own subscribers
 *     RemoteInsert, then ContentReady     -> every other replica
 *     (tombstones carry no content and produce no ContentReady)
 *
 *   Joining an existing namespace (sync_from_peers):
 *     PeerJoined per live replica
 *     RemoteInsert per entry that is newer than ours
 *     RoundComplete
 *     ContentReady per fetched entry
 *     AllClear
 *
 * Events published before anyone subscribed are buffered and handed to
 * the first subscription, so nothing of the initial sync is lost between
 * import() and subscribe().
 *
 * LOCKING:
 * A replica never calls into another replica while holding its own
 * mutex; fan-out happens after the local state is updated and released.
 */

#include "docsync/events/event_queue.hpp"
#include "docsync/memory/content_store.hpp"
#include "docsync/memory/hub.hpp"
#include "docsync/sync/document.hpp"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docsync::memory {

/**
 * @brief Subscriber end of a document's event channel
 *
 * The document keeps the other end and stops delivering once the channel
 * is closed, either by close() or by destroying the subscription.
 */
class MemorySubscription : public sync::EventSubscription {
public:
    using Channel = events::BoundedQueue<sync::DocEvent>;

    explicit MemorySubscription(std::shared_ptr<Channel> channel) : channel_(std::move(channel)) {}
    ~MemorySubscription() override { channel_->shutdown(); }

    std::optional<sync::DocEvent> next() override { return channel_->pop(); }
    void close() override { channel_->shutdown(); }

private:
    std::shared_ptr<Channel> channel_;
};

class MemoryDocument : public sync::DocumentLog,
                       public std::enable_shared_from_this<MemoryDocument> {
public:
    MemoryDocument(std::string namespace_id,
                   std::string dataset,
                   std::string node_id,
                   std::shared_ptr<MemoryContentStore> store,
                   std::shared_ptr<MemoryHub> hub);
    ~MemoryDocument() override;

    MemoryDocument(const MemoryDocument&) = delete;
    MemoryDocument& operator=(const MemoryDocument&) = delete;

    // DocumentLog
    const std::string& id() const override { return namespace_id_; }
    Result<std::unique_ptr<sync::EventSubscription>> subscribe() override;
    Result<std::vector<sync::LogEntry>> latest_per_key() const override;
    Result<sync::ContentDigest> set_bytes(const sync::AuthorId& author,
                                          const Bytes& key,
                                          const Bytes& content) override;
    Result<std::string> share() override;

    /// Writes a tombstone for key; it disappears from latest_per_key().
    Result<void> del(const sync::AuthorId& author, const Bytes& key);

    /**
     * @brief Pulls every entry the other live replicas hold
     *
     * Called once by the provider right after joining.
     */
    void sync_from_peers();

    /// Entry written on another replica; `source` holds its content.
    void receive_remote(const sync::LogEntry& entry,
                        const sync::PeerId& from,
                        const MemoryContentStore& source);

    void announce_peer_joined(const sync::PeerId& peer);
    void announce_peer_left(const sync::PeerId& peer);

    /// Makes subscribe() fail with SubscriptionFailed.
    void fail_subscriptions(bool fail);

    const std::string& dataset() const noexcept { return dataset_; }
    const std::string& node_id() const noexcept { return node_id_; }
    const MemoryContentStore& store() const noexcept { return *store_; }

    /// Latest revision of every key, tombstones included.
    std::vector<sync::LogEntry> entries() const;

private:
    using EntryMap = std::map<Bytes, sync::LogEntry>;

    Result<sync::ContentDigest> write(const sync::AuthorId& author, const Bytes& key, const Bytes* content);

    /// Stores entry if it is newer than what we have for its key. Caller holds mutex_.
    bool apply_entry_locked(const sync::LogEntry& entry);
    void publish_locked(sync::DocEvent event);

    /// Copies content from `source`; true if it is now stored locally.
    bool fetch_content(const sync::LogEntry& entry, const MemoryContentStore& source);

    std::int64_t next_timestamp_locked();

    std::string namespace_id_;
    std::string dataset_;
    std::string node_id_;
    std::shared_ptr<MemoryContentStore> store_;
    std::shared_ptr<MemoryHub> hub_;

    mutable std::mutex mutex_;
    EntryMap latest_;
    std::int64_t last_timestamp_us_ = 0;
    bool subscribed_once_ = false;
    bool fail_subscriptions_ = false;
    std::deque<sync::DocEvent> backlog_;
    std::vector<std::shared_ptr<MemorySubscription::Channel>> channels_;
};

} // namespace docsync::memory
