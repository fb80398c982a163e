#pragma once

/**
 * @file node.hpp
 * @brief DocumentProvider backed by the in-memory hub
 *
 * One MemoryNode per simulated process. Nodes sharing a MemoryHub
 * replicate every document they both hold.
 *
 * EXAMPLE:
 * auto hub = std::make_shared<MemoryHub>();
 * MemoryNode server("server", hub);
 * MemoryNode client("client", hub);
 *
 * auto doc = server.create("folder").value();
 * auto ticket = doc->share().value();
 * auto joined = client.import("folder", ticket);  // replays server's entries
 */

#include "docsync/memory/content_store.hpp"
#include "docsync/memory/document.hpp"
#include "docsync/memory/hub.hpp"
#include "docsync/sync/document.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace docsync::memory {

class MemoryNode : public sync::DocumentProvider {
public:
    MemoryNode(std::string node_id, std::shared_ptr<MemoryHub> hub);

    Result<std::shared_ptr<sync::DocumentLog>> create(const std::string& dataset) override;
    Result<std::shared_ptr<sync::DocumentLog>> import(const std::string& dataset, const std::string& ticket) override;

    Result<std::vector<sync::AuthorId>> authors() const override;
    Result<void> import_author(const sync::AuthorId& author) override;

    sync::ContentStore& content_store() override { return *store_; }
    MemoryContentStore& store() { return *store_; }

    const std::string& node_id() const noexcept { return node_id_; }

    /// Documents of this dataset opened afterwards refuse to subscribe.
    void fail_subscriptions_for(const std::string& dataset);

    /// Most recently opened document of a dataset, if it is still alive.
    std::shared_ptr<MemoryDocument> document(const std::string& dataset) const;

private:
    std::shared_ptr<MemoryDocument> open_document(const std::string& namespace_id, const std::string& dataset);

    std::string node_id_;
    std::shared_ptr<MemoryHub> hub_;
    std::shared_ptr<MemoryContentStore> store_;

    mutable std::mutex mutex_;
    std::set<sync::AuthorId> authors_;
    std::set<std::string> failing_subscriptions_;
    std::map<std::string, std::weak_ptr<MemoryDocument>> documents_;
};

} // namespace docsync::memory
