#include "docsync/events/components.hpp"
#include "docsync/events/event_bus.hpp"
#include "docsync/memory/content_store.hpp"
#include "docsync/memory/hub.hpp"
#include "docsync/memory/node.hpp"
#include "docsync/store/registry.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

using docsync::ErrorCode;
using docsync::SeedKind;
using docsync::memory::MemoryHub;
using docsync::memory::MemoryNode;
using docsync::store::Folder;
using docsync::store::Node;
using docsync::store::RegistryOptions;
using docsync::store::Resource;
using docsync::store::SessionRegistry;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

/// Default datasets without the image seeds, so tests do not need a directory.
RegistryOptions options_without_images() {
    RegistryOptions options;
    for (auto& dataset : options.datasets) {
        if (dataset.seed == SeedKind::Images) {
            dataset.seed = SeedKind::None;
        }
    }
    return options;
}

std::vector<std::string> split(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> parts;
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::size_t drain_ready(docsync::sync::SyncSession& session) {
    std::size_t count = 0;
    while (session.try_next_ready()) {
        ++count;
    }
    return count;
}

/// Replays a fixed list of events, optionally failing the stream or its first close().
struct Script {
    std::vector<docsync::sync::DocEvent> events;
    bool fail_after_events = false;
    bool fail_first_close = false;
};

class ScriptedSubscription : public docsync::sync::EventSubscription {
public:
    explicit ScriptedSubscription(Script script) : script_(std::move(script)) {}

    std::optional<docsync::sync::DocEvent> next() override {
        if (position_ < script_.events.size()) {
            return script_.events[position_++];
        }
        if (script_.fail_after_events) {
            throw std::runtime_error("stream reset by peer");
        }
        return std::nullopt;
    }

    void close() override {
        if (script_.fail_first_close && !close_failed_.exchange(true)) {
            throw std::runtime_error("close failed");
        }
    }

private:
    Script script_;
    std::size_t position_ = 0;
    std::atomic<bool> close_failed_{false};
};

class ScriptedDocument : public docsync::sync::DocumentLog {
public:
    explicit ScriptedDocument(Script script) : script_(std::move(script)) {}

    const std::string& id() const override { return id_; }

    docsync::Result<std::unique_ptr<docsync::sync::EventSubscription>> subscribe() override {
        std::unique_ptr<docsync::sync::EventSubscription> subscription =
            std::make_unique<ScriptedSubscription>(script_);
        return docsync::Ok(std::move(subscription));
    }

    docsync::Result<std::vector<docsync::sync::LogEntry>> latest_per_key() const override {
        return docsync::Ok(std::vector<docsync::sync::LogEntry>{});
    }

    docsync::Result<docsync::sync::ContentDigest> set_bytes(const docsync::sync::AuthorId&,
                                                            const docsync::Bytes&,
                                                            const docsync::Bytes&) override {
        return docsync::Ok(docsync::sync::ContentDigest("unused"));
    }

    docsync::Result<std::string> share() override { return docsync::Ok(std::string("docsync1:scripted")); }

private:
    std::string id_{"scripted"};
    Script script_;
};

class ScriptedProvider : public docsync::sync::DocumentProvider {
public:
    explicit ScriptedProvider(Script script) : script_(std::move(script)) {}

    docsync::Result<std::shared_ptr<docsync::sync::DocumentLog>> create(const std::string&) override {
        return docsync::Ok(std::shared_ptr<docsync::sync::DocumentLog>(std::make_shared<ScriptedDocument>(script_)));
    }

    docsync::Result<std::shared_ptr<docsync::sync::DocumentLog>> import(const std::string& dataset,
                                                                       const std::string&) override {
        return create(dataset);
    }

    docsync::Result<std::vector<docsync::sync::AuthorId>> authors() const override {
        return docsync::Ok(std::vector<docsync::sync::AuthorId>{});
    }

    docsync::Result<void> import_author(const docsync::sync::AuthorId&) override { return docsync::Ok(); }

    docsync::sync::ContentStore& content_store() override { return store_; }

private:
    Script script_;
    docsync::memory::MemoryContentStore store_;
};

RegistryOptions single_folder_dataset() {
    RegistryOptions options;
    options.datasets = {{"folder", docsync::EntityKind::Folder, SeedKind::None}};
    return options;
}

} // namespace

TEST(SessionRegistryTest, CreatesEveryDatasetAndSeedsFolders) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    SessionRegistry registry(node, options_without_images());

    auto opened = registry.open_all();
    ASSERT_TRUE(opened.is_ok()) << opened.error().describe();

    EXPECT_EQ(registry.opened(),
              (std::vector<std::string>{"resource", "folder", "node", "resource1", "resource2", "resource3"}));
    EXPECT_EQ(registry.running_tasks(), 6u);

    auto* folders = registry.table<Folder>("folder");
    ASSERT_NE(folders, nullptr);
    auto all = folders->search();
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 9u);

    std::vector<std::string> names;
    for (const auto& folder : all.value()) {
        names.push_back(folder.folder_name);
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names.front(), "New Folder1");
    EXPECT_EQ(names.back(), "New Folder9");

    auto authors = node.authors();
    ASSERT_TRUE(authors.is_ok());
    EXPECT_EQ(authors.value(), std::vector<std::string>{docsync::kDefaultAuthorHex});
}

TEST(SessionRegistryTest, TicketStringFollowsDatasetOrder) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    SessionRegistry registry(node, options_without_images());
    ASSERT_TRUE(registry.open_all().is_ok());

    auto tickets = split(registry.ticket_string());
    ASSERT_EQ(tickets.size(), 6u);

    const std::vector<std::string> order{"resource", "folder", "node", "resource1", "resource2", "resource3"};
    for (std::size_t i = 0; i < order.size(); ++i) {
        auto document = node.document(order[i]);
        ASSERT_NE(document, nullptr);
        EXPECT_EQ(tickets[i], docsync::memory::make_ticket(document->id()));
    }
}

TEST(SessionRegistryTest, TypedLookupChecksKind) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    SessionRegistry registry(node, options_without_images());
    ASSERT_TRUE(registry.open("node").is_ok());

    EXPECT_NE(registry.table<Node>("node"), nullptr);
    EXPECT_EQ(registry.table<Folder>("node"), nullptr);
    EXPECT_EQ(registry.table<Node>("folder"), nullptr);
    EXPECT_NE(registry.session("node"), nullptr);
    EXPECT_EQ(registry.session("folder"), nullptr);
}

TEST(SessionRegistryTest, RejectsUnknownAndDuplicateDatasets) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    SessionRegistry registry(node, options_without_images());

    auto unknown = registry.open("photos");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownDataset);

    ASSERT_TRUE(registry.open("folder").is_ok());
    auto again = registry.open("folder");
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyOpen);

    auto stray = registry.open_all({{"photos", "docsync1:x"}});
    ASSERT_TRUE(stray.is_error());
    EXPECT_EQ(stray.error().code, ErrorCode::UnknownDataset);
}

TEST(SessionRegistryTest, InvalidTicketIsReported) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("client", hub);
    SessionRegistry registry(node, options_without_images());

    auto joined = registry.open("folder", std::string("docsync1:nobody-shared-this"));
    ASSERT_TRUE(joined.is_error());
    EXPECT_EQ(joined.error().code, ErrorCode::InvalidTicket);
    EXPECT_TRUE(registry.opened().empty());
}

TEST(SessionRegistryTest, SubscriptionFailureLeavesDatasetUnregistered) {
    docsync::events::EventBus bus;
    docsync::events::MetricsComponent metrics(bus);

    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    node.fail_subscriptions_for("node");
    SessionRegistry registry(node, options_without_images(), &bus);

    auto opened = registry.open_all();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, ErrorCode::SubscriptionFailed);

    // Datasets before the failing one stay open, later ones were never tried
    EXPECT_EQ(registry.opened(), (std::vector<std::string>{"resource", "folder"}));
    EXPECT_EQ(registry.session("node"), nullptr);
    EXPECT_EQ(registry.running_tasks(), 2u);
    EXPECT_EQ(metrics.get_stats().subscription_failures.load(), 1u);

    // Other datasets can still be opened afterwards
    EXPECT_TRUE(registry.open("resource1").is_ok());
}

TEST(SessionRegistryTest, ClientConvergesAndStopsItsConsumers) {
    docsync::events::EventBus bus;
    docsync::events::MetricsComponent metrics(bus);

    auto hub = std::make_shared<MemoryHub>();
    MemoryNode server_node("server", hub);
    MemoryNode client_node("client", hub);

    SessionRegistry server(server_node, options_without_images(), &bus);
    ASSERT_TRUE(server.open_all().is_ok());

    auto node_table = server.table<Node>("node");
    ASSERT_NE(node_table, nullptr);
    ASSERT_TRUE(node_table->insert_entity(Node{"root", 1, "n-1"}).is_ok());
    ASSERT_TRUE(node_table->insert_entity(Node{"leaf", 2, "n-2"}).is_ok());

    auto options = options_without_images();
    auto tickets = docsync::store::parse_ticket_string(options.datasets, server.ticket_string());
    ASSERT_TRUE(tickets.is_ok());
    ASSERT_EQ(tickets.value().size(), 6u);

    SessionRegistry client(client_node, options, &bus);
    ASSERT_TRUE(client.open_all(tickets.value()).is_ok());
    ASSERT_TRUE(client.wait_idle(5s));
    EXPECT_EQ(client.running_tasks(), 0u);
    EXPECT_TRUE(client.ticket_string().empty());

    auto* folder = client.session("folder");
    ASSERT_NE(folder, nullptr);
    EXPECT_TRUE(folder->metadata_caught_up());
    EXPECT_TRUE(folder->all_content_materialized());
    EXPECT_EQ(folder->lifetime_pending_count(), 9u);
    EXPECT_EQ(folder->queue_pending_count(), 0u);
    EXPECT_EQ(folder->queue_pending_bytes(), 0u);
    EXPECT_TRUE(folder->pending().empty());
    EXPECT_EQ(drain_ready(*folder), 9u);

    auto* nodes = client.session("node");
    ASSERT_NE(nodes, nullptr);
    EXPECT_EQ(nodes->lifetime_pending_count(), 2u);
    EXPECT_EQ(nodes->queue_pending_count(), 0u);

    // "resource" is excluded from progress accounting by default
    auto* resource = client.session("resource");
    ASSERT_NE(resource, nullptr);
    EXPECT_TRUE(resource->all_content_materialized());
    EXPECT_EQ(resource->lifetime_pending_count(), 0u);

    auto client_folders = client.table<Folder>("folder")->search();
    ASSERT_TRUE(client_folders.is_ok());
    EXPECT_EQ(client_folders.value().size(), 9u);

    EXPECT_EQ(metrics.get_stats().sessions_converged.load(), 6u);
    EXPECT_EQ(metrics.get_stats().items_materialized.load(), 11u);
}

TEST(SessionRegistryTest, WritesAfterConvergenceReplicateButDoNotCount) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode server_node("server", hub);
    MemoryNode client_node("client", hub);

    auto options = options_without_images();
    SessionRegistry server(server_node, options);
    ASSERT_TRUE(server.open_all().is_ok());

    auto tickets = docsync::store::parse_ticket_string(options.datasets, server.ticket_string());
    ASSERT_TRUE(tickets.is_ok());
    SessionRegistry client(client_node, options);
    ASSERT_TRUE(client.open_all(tickets.value()).is_ok());
    ASSERT_TRUE(client.wait_idle(5s));

    auto* folder = client.session("folder");
    ASSERT_NE(folder, nullptr);
    const auto lifetime = folder->lifetime_pending_count();

    ASSERT_TRUE(docsync::store::insert_folder(*server.table<Folder>("folder"), "Later").is_ok());

    auto client_folders = client.table<Folder>("folder")->search();
    ASSERT_TRUE(client_folders.is_ok());
    EXPECT_EQ(client_folders.value().size(), 10u);
    EXPECT_EQ(folder->lifetime_pending_count(), lifetime);
    EXPECT_EQ(folder->queue_pending_count(), 0u);
}

TEST(SessionRegistryTest, SeedsImagesIntoResourceDatasets) {
    const auto dir = fs::temp_directory_path() / ("docsync_seed_" + docsync::make_uuid_v4());
    fs::create_directories(dir);
    std::ofstream(dir / "one.png", std::ios::binary) << "1";
    std::ofstream(dir / "two.png", std::ios::binary) << "22";

    RegistryOptions options;
    options.images_dir = dir;

    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    SessionRegistry registry(node, options);
    auto opened = registry.open_all();
    fs::remove_all(dir);
    ASSERT_TRUE(opened.is_ok()) << opened.error().describe();

    for (const auto* name : {"resource", "resource1"}) {
        auto all = registry.table<Resource>(name)->search();
        ASSERT_TRUE(all.is_ok());
        EXPECT_EQ(all.value().size(), 2u) << name;
    }
    EXPECT_TRUE(registry.table<Resource>("resource2")->search().value().empty());
}

TEST(SessionRegistryTest, MissingImagesDirectoryFailsSeeding) {
    RegistryOptions options;
    options.images_dir = "/nonexistent/docsync/images";

    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    SessionRegistry registry(node, options);

    auto opened = registry.open_all();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, ErrorCode::Io);
    // The dataset itself was opened before seeding failed
    EXPECT_EQ(registry.opened(), std::vector<std::string>{"resource"});
}

TEST(SessionRegistryTest, ShutdownStopsServerConsumers) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode node("server", hub);
    SessionRegistry registry(node, options_without_images());
    ASSERT_TRUE(registry.open_all().is_ok());
    EXPECT_EQ(registry.running_tasks(), 6u);

    registry.shutdown();
    EXPECT_EQ(registry.running_tasks(), 0u);
    registry.shutdown();

    auto late = registry.open("folder");
    EXPECT_TRUE(late.is_error());
}

TEST(SessionRegistryTest, SeveralClientsJoinFromOneTicketString) {
    auto hub = std::make_shared<MemoryHub>();
    MemoryNode server_node("server", hub);
    MemoryNode first_node("client1", hub);
    MemoryNode second_node("client2", hub);

    auto options = options_without_images();
    SessionRegistry server(server_node, options);
    ASSERT_TRUE(server.open_all().is_ok());

    auto tickets = docsync::store::parse_ticket_string(options.datasets, server.ticket_string());
    ASSERT_TRUE(tickets.is_ok());

    SessionRegistry first(first_node, options);
    SessionRegistry second(second_node, options);
    ASSERT_TRUE(first.open_all(tickets.value()).is_ok());
    ASSERT_TRUE(second.open_all(tickets.value()).is_ok());
    ASSERT_TRUE(first.wait_idle(5s));
    ASSERT_TRUE(second.wait_idle(5s));

    for (auto* client : {&first, &second}) {
        auto* folder = client->session("folder");
        ASSERT_NE(folder, nullptr);
        EXPECT_TRUE(folder->all_content_materialized());
        EXPECT_EQ(folder->lifetime_pending_count(), 9u);
        EXPECT_EQ(folder->queue_pending_count(), 0u);

        auto folders = client->table<Folder>("folder")->search();
        ASSERT_TRUE(folders.is_ok());
        EXPECT_EQ(folders.value().size(), 9u);
    }
}

TEST(SessionRegistryTest, TicketsFromAnotherHubAreRejected) {
    auto server_hub = std::make_shared<MemoryHub>();
    MemoryNode server_node("server", server_hub);
    auto options = options_without_images();
    SessionRegistry server(server_node, options);
    ASSERT_TRUE(server.open_all().is_ok());

    auto tickets = docsync::store::parse_ticket_string(options.datasets, server.ticket_string());
    ASSERT_TRUE(tickets.is_ok());

    auto other_hub = std::make_shared<MemoryHub>();
    MemoryNode stranger("client", other_hub);
    SessionRegistry client(stranger, options);

    auto opened = client.open_all(tickets.value());
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().code, ErrorCode::InvalidTicket);
    EXPECT_TRUE(client.opened().empty());
    EXPECT_EQ(client.running_tasks(), 0u);
}

TEST(SessionRegistryTest, FailingEventStreamEndsConsumer) {
    Script script;
    script.events = {docsync::sync::PeerJoined{"peer-a"},
                     docsync::sync::RemoteInsert{"d1", 10, "k1", "folder", "peer-a"}};
    script.fail_after_events = true;
    ScriptedProvider provider(std::move(script));

    SessionRegistry registry(provider, single_folder_dataset());
    ASSERT_TRUE(registry.open_all().is_ok());
    ASSERT_TRUE(registry.wait_idle(5s));
    EXPECT_EQ(registry.running_tasks(), 0u);

    auto* folder = registry.session("folder");
    ASSERT_NE(folder, nullptr);
    EXPECT_EQ(folder->lifetime_pending_count(), 1u);
    EXPECT_EQ(folder->queue_pending_count(), 1u);
}

TEST(SessionRegistryTest, EventThatThrowsDoesNotKillConsumer) {
    // The consumer's cancel handle closes the subscription; the first close
    // throws from inside apply(AllClear)
    Script script;
    script.events = {docsync::sync::RemoteInsert{"d1", 10, "k1", "folder", "peer-a"},
                     docsync::sync::ContentReady{"d1"},
                     docsync::sync::AllClear{}};
    script.fail_first_close = true;
    ScriptedProvider provider(std::move(script));

    SessionRegistry registry(provider, single_folder_dataset());
    ASSERT_TRUE(registry.open_all().is_ok());
    ASSERT_TRUE(registry.wait_idle(5s));
    EXPECT_EQ(registry.running_tasks(), 0u);

    auto* folder = registry.session("folder");
    ASSERT_NE(folder, nullptr);
    EXPECT_TRUE(folder->all_content_materialized());
    EXPECT_EQ(folder->queue_pending_count(), 0u);
    EXPECT_EQ(folder->try_next_ready().value_or(""), "k1");

    registry.shutdown();
}

TEST(TicketStringTest, SplitsByPosition) {
    const auto datasets = docsync::default_datasets();

    auto empty = docsync::store::parse_ticket_string(datasets, "   ");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());

    auto full = docsync::store::parse_ticket_string(datasets, "t0 t1  t2 t3 t4 t5");
    ASSERT_TRUE(full.is_ok());
    EXPECT_EQ(full.value().at("resource"), "t0");
    EXPECT_EQ(full.value().at("folder"), "t1");
    EXPECT_EQ(full.value().at("resource3"), "t5");

    auto short_list = docsync::store::parse_ticket_string(datasets, "t0 t1");
    ASSERT_TRUE(short_list.is_error());
    EXPECT_EQ(short_list.error().code, ErrorCode::InvalidTicket);
}
