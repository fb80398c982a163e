#pragma once

/**
 * @file registry.hpp
 * @brief Owns every open dataset: its table, its session and its consumer
 *
 * WHY THIS FILE EXISTS:
 * Opening a dataset is a fixed sequence (author, document, ticket, table,
 * subscription, session, consumer, seed) that has to be done the same way
 * for all of them. The registry does it and keeps the results keyed by
 * dataset name.
 *
 * HOW IT INTEGRATES:
 * - The provider supplies documents (memory::MemoryNode in-process)
 * - Each open dataset gets one SyncSession fed by one consumer task
 * - Consumer tasks run on a boost::asio::thread_pool with one thread per
 *   configured dataset, since each task blocks on its subscription
 *
 * CONSUMER LIFETIME:
 *   posted -> apply events in order -> session fires its cancel handle on
 *   the all-clear -> loop sees the stop flag -> task returns
 * A dataset that never receives an all-clear (this side created it) keeps
 * its task until shutdown().
 *
 * EXAMPLE:
 * memory::MemoryNode node("server", hub);
 * SessionRegistry registry(node, make_registry_options(config), &bus);
 * auto opened = registry.open_all();
 * std::cout << registry.ticket_string();
 */

#include "docsync/core/config.hpp"
#include "docsync/events/event_bus.hpp"
#include "docsync/store/table.hpp"
#include "docsync/sync/document.hpp"
#include "docsync/sync/session.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace docsync::store {

struct RegistryOptions {
    std::vector<DatasetConfig> datasets = default_datasets();
    sync::SessionOptions session;
    TableOptions table;
    sync::AuthorId author{kDefaultAuthorHex};
    std::filesystem::path images_dir{"images"};
};

RegistryOptions make_registry_options(const NodeConfig& config);

/// Dataset name -> ticket to join it with.
using TicketMap = std::map<std::string, std::string>;

/**
 * @brief Splits a space separated ticket string into per-dataset tickets
 *
 * Tickets are matched to datasets by position. An empty string yields an
 * empty map; any other count than one ticket per dataset is InvalidTicket.
 */
Result<TicketMap> parse_ticket_string(const std::vector<DatasetConfig>& datasets, const std::string& tickets);

class SessionRegistry {
public:
    SessionRegistry(sync::DocumentProvider& provider,
                    RegistryOptions options,
                    events::EventBus* bus = nullptr);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Opens every configured dataset in order
     *
     * Datasets with a ticket are joined, the rest are created. Stops at the
     * first failure; datasets opened before it stay open.
     */
    Result<void> open_all(const TicketMap& tickets = {});

    Result<void> open(const std::string& dataset, const std::optional<std::string>& ticket = std::nullopt);

    /// nullptr unless the dataset is open.
    sync::SyncSession* session(const std::string& dataset) const;

    /// nullptr unless the dataset is open and stores Entity.
    template<typename Entity>
    Table<Entity>* table(const std::string& dataset) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(dataset);
        if (it == entries_.end()) {
            return nullptr;
        }
        auto* table = std::get_if<std::unique_ptr<Table<Entity>>>(&it->second->table);
        return table ? table->get() : nullptr;
    }

    /// Open datasets in configuration order.
    std::vector<std::string> opened() const;

    /// Tickets of the open datasets in configuration order, space separated.
    std::string ticket_string() const;

    std::size_t running_tasks() const noexcept { return running_.load(); }

    /// Waits until no consumer task is running; false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout) const;

    /// Stops every consumer and waits for the pool. Safe to call twice.
    void shutdown();

private:
    struct Worker {
        std::unique_ptr<sync::EventSubscription> subscription;
        std::atomic<bool> stop{false};
        std::atomic<bool> running{false};
    };

    using AnyTable = std::variant<std::unique_ptr<FolderTable>,
                                  std::unique_ptr<NodeTable>,
                                  std::unique_ptr<ResourceTable>>;

    struct Entry {
        DatasetConfig config;
        AnyTable table;
        std::unique_ptr<sync::SyncSession> session;
        std::unique_ptr<Worker> worker;
        bool created = false;
    };

    Result<void> ensure_author();
    AnyTable make_table(const DatasetConfig& config,
                        std::shared_ptr<sync::DocumentLog> document,
                        std::optional<std::string> ticket) const;
    void start_worker(Entry& entry);
    void run_worker(Entry& entry);
    Result<void> seed(Entry& entry);
    const DatasetConfig* find_config(const std::string& dataset) const;

    sync::DocumentProvider& provider_;
    RegistryOptions options_;
    events::EventBus* bus_;

    boost::asio::thread_pool pool_;
    std::atomic<std::size_t> running_{0};
    mutable std::mutex idle_mutex_;
    mutable std::condition_variable idle_cv_;

    std::mutex open_mutex_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;
    bool shut_down_ = false;
};

} // namespace docsync::store
