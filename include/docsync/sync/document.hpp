#pragma once

/**
 * @file document.hpp
 * @brief Interfaces of the replicated log and the content store
 *
 * Sessions and tables only talk to these abstractions. The in-process
 * implementation lives in docsync/memory; a networked one plugs in the
 * same way.
 */

#include "docsync/core/result.hpp"
#include "docsync/sync/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsync::sync {

/**
 * @brief Ordered event stream of one document
 *
 * next() blocks until an event arrives; it returns nullopt once the
 * subscription is closed and drained. close() may be called from any
 * thread and wakes a blocked next().
 */
class EventSubscription {
public:
    virtual ~EventSubscription() = default;

    virtual std::optional<DocEvent> next() = 0;
    virtual void close() = 0;
};

class ContentStore {
public:
    virtual ~ContentStore() = default;

    /// ContentNotFound if the bytes are not stored locally.
    virtual Result<Bytes> resolve(const ContentDigest& digest) const = 0;
};

/**
 * @brief Append-only keyed log replicated between peers
 */
class DocumentLog {
public:
    virtual ~DocumentLog() = default;

    virtual const std::string& id() const = 0;

    /// SubscriptionFailed if the event stream cannot be established.
    virtual Result<std::unique_ptr<EventSubscription>> subscribe() = 0;

    /// Latest revision of every key.
    virtual Result<std::vector<LogEntry>> latest_per_key() const = 0;

    /// Stores content, appends a revision for key and returns its digest.
    virtual Result<ContentDigest> set_bytes(const AuthorId& author, const Bytes& key, const Bytes& content) = 0;

    /// Issues a shareable write ticket for this document.
    virtual Result<std::string> share() = 0;
};

/**
 * @brief Creates and joins documents on one local node
 */
class DocumentProvider {
public:
    virtual ~DocumentProvider() = default;

    virtual Result<std::shared_ptr<DocumentLog>> create(const std::string& dataset) = 0;
    virtual Result<std::shared_ptr<DocumentLog>> import(const std::string& dataset, const std::string& ticket) = 0;

    virtual Result<std::vector<AuthorId>> authors() const = 0;
    virtual Result<void> import_author(const AuthorId& author) = 0;

    virtual ContentStore& content_store() = 0;
};

} // namespace docsync::sync
