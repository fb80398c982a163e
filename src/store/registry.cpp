#include "docsync/store/registry.hpp"

#include "docsync/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <sstream>

namespace docsync::store {

RegistryOptions make_registry_options(const NodeConfig& config) {
    RegistryOptions options;
    options.datasets = config.datasets;
    options.session.notification_capacity = config.notification_capacity;
    options.session.untracked_datasets = config.untracked_datasets;
    options.table.max_entity_bytes = config.max_entity_bytes;
    options.table.missing_label = config.missing_label;
    options.author = config.author;
    options.images_dir = config.images_dir;
    return options;
}

Result<TicketMap> parse_ticket_string(const std::vector<DatasetConfig>& datasets, const std::string& tickets) {
    std::vector<std::string> parts;
    std::istringstream stream(tickets);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }

    TicketMap result;
    if (parts.empty()) {
        return Ok(std::move(result));
    }
    if (parts.size() != datasets.size()) {
        return Err<TicketMap>(ErrorCode::InvalidTicket,
                              "Expected " + std::to_string(datasets.size()) + " tickets, got " +
                                  std::to_string(parts.size()));
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        result.emplace(datasets[i].name, parts[i]);
    }
    return Ok(std::move(result));
}

SessionRegistry::SessionRegistry(sync::DocumentProvider& provider,
                                 RegistryOptions options,
                                 events::EventBus* bus)
    : provider_(provider),
      options_(std::move(options)),
      bus_(bus),
      pool_(std::max<std::size_t>(1, options_.datasets.size())) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

// ──────────────────────────────────────────────────────────
// Opening datasets
// ──────────────────────────────────────────────────────────

Result<void> SessionRegistry::open_all(const TicketMap& tickets) {
    for (const auto& [name, ticket] : tickets) {
        if (!find_config(name)) {
            return Err<void>(ErrorCode::UnknownDataset, "Ticket given for unknown dataset: " + name);
        }
    }

    for (const auto& config : options_.datasets) {
        std::optional<std::string> ticket;
        if (auto it = tickets.find(config.name); it != tickets.end()) {
            ticket = it->second;
        }
        auto result = open(config.name, ticket);
        if (result.is_error()) {
            spdlog::error("[Registry] failed to open {}: {}", config.name, result.error().describe());
            return result;
        }
    }
    return Ok();
}

Result<void> SessionRegistry::open(const std::string& dataset, const std::optional<std::string>& ticket) {
    std::lock_guard open_lock(open_mutex_);

    const DatasetConfig* config = find_config(dataset);
    if (!config) {
        return Err<void>(ErrorCode::UnknownDataset, "Dataset is not configured: " + dataset);
    }
    {
        std::shared_lock lock(mutex_);
        if (shut_down_) {
            return Err<void>(ErrorCode::AlreadyOpen, "Registry is shut down");
        }
        if (entries_.count(dataset) > 0) {
            return Err<void>(ErrorCode::AlreadyOpen, "Dataset already open: " + dataset);
        }
    }

    auto author = ensure_author();
    if (author.is_error()) {
        return author;
    }

    auto document = ticket ? provider_.import(dataset, *ticket) : provider_.create(dataset);
    if (document.is_error()) {
        return Err<void>(document.error());
    }

    // Only a dataset we created hands out a ticket
    std::optional<std::string> issued;
    if (!ticket) {
        auto shared = document.value()->share();
        if (shared.is_error()) {
            return Err<void>(shared.error());
        }
        issued = std::move(shared.value());
    }

    auto subscription = document.value()->subscribe();
    if (subscription.is_error()) {
        spdlog::error("[Registry] {} subscription failed: {}", dataset, subscription.error().describe());
        if (bus_) {
            bus_->emit(events::SubscriptionFailedEvent{dataset, subscription.error().message});
        }
        return Err<void>(ErrorCode::SubscriptionFailed, subscription.error().message);
    }

    auto entry = std::make_unique<Entry>();
    entry->config = *config;
    entry->created = !ticket.has_value();
    entry->table = make_table(*config, document.value(), std::move(issued));
    entry->session = std::make_unique<sync::SyncSession>(dataset, options_.session, bus_);
    entry->worker = std::make_unique<Worker>();
    entry->worker->subscription = std::move(subscription.value());

    Entry& opened = *entry;
    {
        std::unique_lock lock(mutex_);
        entries_.emplace(dataset, std::move(entry));
    }
    start_worker(opened);
    spdlog::info("[Registry] {} {} ({})", ticket ? "joined" : "created", dataset, to_string(config->kind));

    if (opened.created) {
        return seed(opened);
    }
    return Ok();
}

Result<void> SessionRegistry::ensure_author() {
    auto authors = provider_.authors();
    if (authors.is_error()) {
        return Err<void>(authors.error());
    }
    const auto& known = authors.value();
    if (std::find(known.begin(), known.end(), options_.author) != known.end()) {
        return Ok();
    }
    spdlog::debug("[Registry] importing author {}", options_.author);
    return provider_.import_author(options_.author);
}

SessionRegistry::AnyTable SessionRegistry::make_table(const DatasetConfig& config,
                                                      std::shared_ptr<sync::DocumentLog> document,
                                                      std::optional<std::string> ticket) const {
    auto& content = provider_.content_store();
    switch (config.kind) {
        case EntityKind::Folder:
            return std::make_unique<FolderTable>(config.name, std::move(document), content,
                                                 options_.author, std::move(ticket), options_.table);
        case EntityKind::Node:
            return std::make_unique<NodeTable>(config.name, std::move(document), content,
                                               options_.author, std::move(ticket), options_.table);
        case EntityKind::Resource:
            break;
    }
    return std::make_unique<ResourceTable>(config.name, std::move(document), content,
                                           options_.author, std::move(ticket), options_.table);
}

Result<void> SessionRegistry::seed(Entry& entry) {
    switch (entry.config.seed) {
        case SeedKind::None:
            return Ok();

        case SeedKind::Folders: {
            auto* folders = std::get_if<std::unique_ptr<FolderTable>>(&entry.table);
            if (!folders) {
                return Err<void>(ErrorCode::InvalidConfig, "Folder seed on non-folder dataset " + entry.config.name);
            }
            for (int i = 1; i <= 9; ++i) {
                auto id = insert_folder(**folders, "New Folder" + std::to_string(i));
                if (id.is_error()) {
                    return Err<void>(id.error());
                }
            }
            spdlog::info("[Registry] seeded {} with 9 folders", entry.config.name);
            return Ok();
        }

        case SeedKind::Images: {
            auto* resources = std::get_if<std::unique_ptr<ResourceTable>>(&entry.table);
            if (!resources) {
                return Err<void>(ErrorCode::InvalidConfig, "Image seed on non-resource dataset " + entry.config.name);
            }
            auto added = load_images(**resources, options_.images_dir);
            if (added.is_error()) {
                return Err<void>(added.error());
            }
            spdlog::info("[Registry] seeded {} with {} file(s) from {}",
                         entry.config.name, added.value(), options_.images_dir.string());
            return Ok();
        }
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Consumer tasks
// ──────────────────────────────────────────────────────────

void SessionRegistry::start_worker(Entry& entry) {
    Worker* worker = entry.worker.get();
    entry.session->bind_task([worker]() {
        worker->stop.store(true);
        worker->subscription->close();
    });

    worker->running.store(true);
    running_.fetch_add(1);
    boost::asio::post(pool_, [this, &entry]() { run_worker(entry); });
}

void SessionRegistry::run_worker(Entry& entry) {
    auto& worker = *entry.worker;
    const auto& name = entry.config.name;
    spdlog::debug("[Registry] {} consumer started", name);

    std::size_t applied = 0;
    while (!worker.stop.load()) {
        std::optional<sync::DocEvent> event;
        try {
            event = worker.subscription->next();
        } catch (const std::exception& e) {
            spdlog::error("[Registry] {} event stream failed: {}", name, e.what());
            break;
        }
        if (!event) {
            break;
        }

        // A failed event is dropped; the consumer keeps going
        try {
            entry.session->apply(*event);
            ++applied;
        } catch (const std::exception& e) {
            spdlog::error("[Registry] {} failed to apply event: {}", name, e.what());
        }
    }

    spdlog::info("[Registry] {} consumer finished after {} event(s)", name, applied);
    worker.running.store(false);
    {
        std::lock_guard lock(idle_mutex_);
        running_.fetch_sub(1);
    }
    idle_cv_.notify_all();
}

bool SessionRegistry::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return running_.load() == 0; });
}

void SessionRegistry::shutdown() {
    std::lock_guard open_lock(open_mutex_);
    {
        std::unique_lock lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (auto& [name, entry] : entries_) {
            entry->worker->stop.store(true);
            entry->worker->subscription->close();
            entry->session->close_notifications();
        }
    }
    pool_.join();
    spdlog::debug("[Registry] all consumers stopped");
}

// ──────────────────────────────────────────────────────────
// Lookups
// ──────────────────────────────────────────────────────────

sync::SyncSession* SessionRegistry::session(const std::string& dataset) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(dataset);
    return it == entries_.end() ? nullptr : it->second->session.get();
}

std::vector<std::string> SessionRegistry::opened() const {
    std::vector<std::string> names;
    std::shared_lock lock(mutex_);
    for (const auto& config : options_.datasets) {
        if (entries_.count(config.name) > 0) {
            names.push_back(config.name);
        }
    }
    return names;
}

std::string SessionRegistry::ticket_string() const {
    std::string result;
    std::shared_lock lock(mutex_);
    for (const auto& config : options_.datasets) {
        auto it = entries_.find(config.name);
        if (it == entries_.end()) {
            continue;
        }
        auto ticket = std::visit([](const auto& table) { return table->ticket_string(); }, it->second->table);
        if (ticket.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += ' ';
        }
        result += ticket;
    }
    return result;
}

const DatasetConfig* SessionRegistry::find_config(const std::string& dataset) const {
    for (const auto& config : options_.datasets) {
        if (config.name == dataset) {
            return &config;
        }
    }
    return nullptr;
}

} // namespace docsync::store
