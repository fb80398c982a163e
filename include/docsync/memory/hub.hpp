#pragma once

/**
 * @file hub.hpp
 * @brief In-process rendezvous point for replicas of the same document
 *
 * Replicas of one namespace find each other here instead of over the
 * network. The hub only holds weak references; a replica that goes away
 * simply stops being returned by replicas().
 */

#include "docsync/core/result.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace docsync::memory {

class MemoryDocument;

inline constexpr const char* kTicketPrefix = "docsync1:";

std::string make_ticket(const std::string& namespace_id);

/// Namespace id carried by a ticket, or InvalidTicket.
Result<std::string> parse_ticket(const std::string& ticket);

class MemoryHub {
public:
    MemoryHub() = default;

    MemoryHub(const MemoryHub&) = delete;
    MemoryHub& operator=(const MemoryHub&) = delete;

    /// Registers a fresh random namespace id.
    std::string create_namespace();

    bool knows(const std::string& namespace_id) const;

    void attach(const std::string& namespace_id, const std::shared_ptr<MemoryDocument>& replica);
    void detach(const std::string& namespace_id, const MemoryDocument* replica);

    /// Live replicas of a namespace, excluding `except`.
    std::vector<std::shared_ptr<MemoryDocument>> replicas(const std::string& namespace_id,
                                                         const MemoryDocument* except = nullptr) const;

private:
    struct Replica {
        const MemoryDocument* address;
        std::weak_ptr<MemoryDocument> handle;
    };

    mutable std::mutex mutex_;
    std::set<std::string> namespaces_;
    std::unordered_map<std::string, std::vector<Replica>> replicas_;
};

} // namespace docsync::memory
