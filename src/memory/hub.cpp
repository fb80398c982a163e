#include "docsync/memory/hub.hpp"

#include "docsync/core/encoding.hpp"
#include "docsync/memory/document.hpp"

#include <algorithm>
#include <cstring>

namespace docsync::memory {

std::string make_ticket(const std::string& namespace_id) {
    return kTicketPrefix + namespace_id;
}

Result<std::string> parse_ticket(const std::string& ticket) {
    const std::size_t prefix_length = std::strlen(kTicketPrefix);
    if (ticket.size() <= prefix_length || ticket.compare(0, prefix_length, kTicketPrefix) != 0) {
        return Err<std::string>(ErrorCode::InvalidTicket, "Malformed ticket: " + ticket);
    }
    return Ok(ticket.substr(prefix_length));
}

std::string MemoryHub::create_namespace() {
    auto namespace_id = make_uuid_v4();
    std::lock_guard lock(mutex_);
    namespaces_.insert(namespace_id);
    return namespace_id;
}

bool MemoryHub::knows(const std::string& namespace_id) const {
    std::lock_guard lock(mutex_);
    return namespaces_.count(namespace_id) > 0;
}

void MemoryHub::attach(const std::string& namespace_id, const std::shared_ptr<MemoryDocument>& replica) {
    std::lock_guard lock(mutex_);
    namespaces_.insert(namespace_id);
    replicas_[namespace_id].push_back(Replica{replica.get(), replica});
}

void MemoryHub::detach(const std::string& namespace_id, const MemoryDocument* replica) {
    std::lock_guard lock(mutex_);
    auto it = replicas_.find(namespace_id);
    if (it == replicas_.end()) {
        return;
    }
    auto& list = it->second;
    // Never lock() here: dropping the last strong reference under mutex_
    // would re-enter detach() from the replica's destructor
    list.erase(std::remove_if(list.begin(), list.end(),
                              [replica](const Replica& entry) {
                                  return entry.address == replica || entry.handle.expired();
                              }),
               list.end());
}

std::vector<std::shared_ptr<MemoryDocument>> MemoryHub::replicas(const std::string& namespace_id,
                                                                const MemoryDocument* except) const {
    std::vector<std::weak_ptr<MemoryDocument>> handles;
    {
        std::lock_guard lock(mutex_);
        auto it = replicas_.find(namespace_id);
        if (it == replicas_.end()) {
            return {};
        }
        for (const auto& entry : it->second) {
            if (entry.address != except) {
                handles.push_back(entry.handle);
            }
        }
    }

    std::vector<std::shared_ptr<MemoryDocument>> result;
    for (const auto& weak : handles) {
        if (auto strong = weak.lock()) {
            result.push_back(std::move(strong));
        }
    }
    return result;
}

} // namespace docsync::memory
