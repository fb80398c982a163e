#include "docsync/memory/node.hpp"

#include <spdlog/spdlog.h>

namespace docsync::memory {

MemoryNode::MemoryNode(std::string node_id, std::shared_ptr<MemoryHub> hub)
    : node_id_(std::move(node_id)),
      hub_(std::move(hub)),
      store_(std::make_shared<MemoryContentStore>()) {}

Result<std::shared_ptr<sync::DocumentLog>> MemoryNode::create(const std::string& dataset) {
    auto document = open_document(hub_->create_namespace(), dataset);
    spdlog::info("[{}] created document {} for {}", node_id_, document->id(), dataset);
    return Ok(std::shared_ptr<sync::DocumentLog>(document));
}

Result<std::shared_ptr<sync::DocumentLog>> MemoryNode::import(const std::string& dataset,
                                                              const std::string& ticket) {
    auto namespace_id = parse_ticket(ticket);
    if (namespace_id.is_error()) {
        return Err<std::shared_ptr<sync::DocumentLog>>(namespace_id.error());
    }
    if (!hub_->knows(namespace_id.value())) {
        return Err<std::shared_ptr<sync::DocumentLog>>(
            ErrorCode::InvalidTicket, "Unknown document in ticket for " + dataset + ": " + ticket);
    }

    auto document = open_document(namespace_id.value(), dataset);
    spdlog::info("[{}] joined document {} for {}", node_id_, document->id(), dataset);
    document->sync_from_peers();
    return Ok(std::shared_ptr<sync::DocumentLog>(document));
}

Result<std::vector<sync::AuthorId>> MemoryNode::authors() const {
    std::lock_guard lock(mutex_);
    return Ok(std::vector<sync::AuthorId>(authors_.begin(), authors_.end()));
}

Result<void> MemoryNode::import_author(const sync::AuthorId& author) {
    auto decoded = hex_decode(author);
    if (decoded.is_error()) {
        return Err<void>(decoded.error());
    }
    if (decoded.value().size() != 32) {
        return Err<void>(ErrorCode::DecodeFailed,
                         "Author must be 32 bytes, got " + std::to_string(decoded.value().size()));
    }
    std::lock_guard lock(mutex_);
    authors_.insert(author);
    return Ok();
}

void MemoryNode::fail_subscriptions_for(const std::string& dataset) {
    std::lock_guard lock(mutex_);
    failing_subscriptions_.insert(dataset);
}

std::shared_ptr<MemoryDocument> MemoryNode::document(const std::string& dataset) const {
    std::lock_guard lock(mutex_);
    auto it = documents_.find(dataset);
    if (it == documents_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

std::shared_ptr<MemoryDocument> MemoryNode::open_document(const std::string& namespace_id,
                                                          const std::string& dataset) {
    auto document = std::make_shared<MemoryDocument>(namespace_id, dataset, node_id_, store_, hub_);

    std::lock_guard lock(mutex_);
    if (failing_subscriptions_.count(dataset) > 0) {
        document->fail_subscriptions(true);
    }
    documents_[dataset] = document;
    hub_->attach(namespace_id, document);
    return document;
}

} // namespace docsync::memory
