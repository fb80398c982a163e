#include "docsync/core/config.hpp"
#include "docsync/events/components.hpp"
#include "docsync/events/event_bus.hpp"
#include "docsync/memory/hub.hpp"
#include "docsync/memory/node.hpp"
#include "docsync/store/registry.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using docsync::store::SessionRegistry;

namespace {

volatile std::sig_atomic_t g_stop = 0;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_stop = 1;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>         JSON configuration file\n"
              << "  -n, --clients <count>       In-process nodes joining the server (default 1)\n"
              << "  -l, --log-level <level>     trace, debug, info, warn, error\n"
              << "  -h, --help                  Show this message\n"
              << "\n"
              << "The server creates every dataset and prints its tickets; each client\n"
              << "joins all of them through the same in-process hub.\n";
}

void print_help() {
    std::cout << "Commands:\n"
              << "  help         Show this message\n"
              << "  status       Progress of every session as JSON\n"
              << "  add          Load the images directory into 'resource'\n"
              << "  add_folder   Insert a folder named \"New Folder\"\n"
              << "  get          Number of resources\n"
              << "  get_folder   Number of folders\n"
              << "  drain        Print keys whose content just arrived\n"
              << "  quit, exit   Stop the node\n";
}

json snapshot_to_json(const docsync::sync::ProgressSnapshot& snap) {
    json j;
    j["dataset"] = snap.dataset;
    j["session_phase"] = docsync::sync::to_string(snap.session_phase);
    j["content_phase"] = docsync::sync::to_string(snap.content_phase);
    j["lifetime_pending_count"] = snap.lifetime_pending_count;
    j["lifetime_pending_bytes"] = snap.lifetime_pending_bytes;
    j["queue_pending_count"] = snap.queue_pending_count;
    j["queue_pending_bytes"] = snap.queue_pending_bytes;
    j["pending_index_size"] = snap.pending_index_size;
    j["notifications_queued"] = snap.notifications_queued;
    j["metadata_caught_up"] = snap.metadata_caught_up;
    j["all_content_materialized"] = snap.all_content_materialized;
    return j;
}

json registry_status(const SessionRegistry& registry) {
    json sessions = json::array();
    for (const auto& name : registry.opened()) {
        if (auto* session = registry.session(name)) {
            sessions.push_back(snapshot_to_json(session->snapshot()));
        }
    }
    return json{{"running_tasks", registry.running_tasks()}, {"sessions", sessions}};
}

void drain(const std::string& label, SessionRegistry& registry) {
    for (const auto& name : registry.opened()) {
        auto* session = registry.session(name);
        if (!session) {
            continue;
        }
        while (auto key = session->try_next_ready()) {
            std::cout << label << " " << name << ": " << *key << "\n";
        }
    }
}

struct Node {
    std::string label;
    std::unique_ptr<docsync::memory::MemoryNode> provider;
    std::unique_ptr<SessionRegistry> registry;
};

std::optional<Node> start_node(const std::string& label,
                               const std::shared_ptr<docsync::memory::MemoryHub>& hub,
                               const docsync::NodeConfig& config,
                               docsync::events::EventBus& bus,
                               const docsync::store::TicketMap& tickets) {
    std::error_code ec;
    auto options = docsync::store::make_registry_options(config);
    if (!tickets.empty() || !fs::is_directory(options.images_dir, ec)) {
        if (tickets.empty()) {
            spdlog::warn("Images directory {} not found, resource datasets start empty",
                         options.images_dir.string());
        }
        for (auto& dataset : options.datasets) {
            if (dataset.seed == docsync::SeedKind::Images) {
                dataset.seed = docsync::SeedKind::None;
            }
        }
    }

    Node node;
    node.label = label;
    node.provider = std::make_unique<docsync::memory::MemoryNode>(label, hub);
    node.registry = std::make_unique<SessionRegistry>(*node.provider, std::move(options), &bus);

    auto opened = node.registry->open_all(tickets);
    if (opened.is_error()) {
        spdlog::error("[{}] {}", label, opened.error().describe());
        return std::nullopt;
    }
    spdlog::info("[{}] opened {} dataset(s)", label, node.registry->opened().size());
    return std::optional<Node>{std::move(node)};
}

void add_folder(SessionRegistry& registry) {
    auto* folders = registry.table<docsync::store::Folder>("folder");
    if (!folders) {
        std::cout << "No folder dataset\n";
        return;
    }
    auto id = docsync::store::insert_folder(*folders, "New Folder");
    if (id.is_error()) {
        std::cout << "Error: " << id.error().describe() << "\n";
        return;
    }
    std::cout << "Added folder " << id.value() << "\n";
}

void add_images(SessionRegistry& registry, const fs::path& images_dir) {
    auto* resources = registry.table<docsync::store::Resource>("resource");
    if (!resources) {
        std::cout << "No resource dataset\n";
        return;
    }
    auto added = docsync::store::load_images(*resources, images_dir);
    if (added.is_error()) {
        std::cout << "Error: " << added.error().describe() << "\n";
        return;
    }
    std::cout << "Added " << added.value() << " file(s)\n";
}

template<typename Entity>
void count_entities(SessionRegistry& registry, const std::string& dataset) {
    auto* table = registry.table<Entity>(dataset);
    if (!table) {
        std::cout << "No " << dataset << " dataset\n";
        return;
    }
    auto entities = table->search();
    if (entities.is_error()) {
        std::cout << "Error: " << entities.error().describe() << "\n";
        return;
    }
    std::cout << dataset << ": " << entities.value().size() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<fs::path> config_path;
    std::optional<std::size_t> clients_override;
    std::optional<std::string> level_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-n" || arg == "--clients") && i + 1 < argc) {
            try {
                clients_override = static_cast<std::size_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid client count: " << argv[i] << "\n";
                return 1;
            }
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            level_override = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    docsync::NodeConfig config;
    if (config_path) {
        auto loaded = docsync::load_config(*config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error().describe() << "\n";
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (clients_override) {
        config.clients = *clients_override;
    }
    if (level_override) {
        config.log_level = *level_override;
    }
    auto valid = docsync::validate_config(config);
    if (valid.is_error()) {
        std::cerr << valid.error().describe() << "\n";
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    docsync::events::EventBus event_bus;
    docsync::events::LoggerComponent logger(event_bus);
    docsync::events::MetricsComponent metrics(event_bus);

    auto hub = std::make_shared<docsync::memory::MemoryHub>();
    auto server = start_node("server", hub, config, event_bus, {});
    if (!server) {
        return 1;
    }

    const auto ticket_string = server->registry->ticket_string();
    std::cout << "Tickets:\n" << ticket_string << "\n";

    auto tickets = docsync::store::parse_ticket_string(config.datasets, ticket_string);
    if (tickets.is_error()) {
        spdlog::error("Cannot join own tickets: {}", tickets.error().describe());
        return 1;
    }

    std::vector<Node> clients;
    for (std::size_t i = 1; i <= config.clients; ++i) {
        auto client = start_node("client" + std::to_string(i), hub, config, event_bus, tickets.value());
        if (!client) {
            return 1;
        }
        clients.push_back(std::move(*client));
    }

    std::signal(SIGINT, signal_handler);
    print_help();

    std::string line;
    while (!g_stop) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        if (line.empty()) {
            continue;
        } else if (line == "quit" || line == "exit") {
            break;
        } else if (line == "help") {
            print_help();
        } else if (line == "status") {
            json status;
            status[server->label] = registry_status(*server->registry);
            for (const auto& client : clients) {
                status[client.label] = registry_status(*client.registry);
            }
            std::cout << status.dump(2) << "\n";
        } else if (line == "add") {
            add_images(*server->registry, config.images_dir);
        } else if (line == "add_folder") {
            add_folder(*server->registry);
        } else if (line == "get") {
            count_entities<docsync::store::Resource>(*server->registry, "resource");
        } else if (line == "get_folder") {
            count_entities<docsync::store::Folder>(*server->registry, "folder");
        } else if (line == "drain") {
            drain(server->label, *server->registry);
            for (auto& client : clients) {
                drain(client.label, *client.registry);
            }
        } else {
            std::cout << "Unknown command: " << line << " (try 'help')\n";
        }
    }

    spdlog::info("Shutting down");
    for (auto& client : clients) {
        client.registry->shutdown();
    }
    server->registry->shutdown();
    metrics.print_stats();
    return 0;
}
