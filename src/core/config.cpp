#include "docsync/core/config.hpp"

#include "docsync/core/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace docsync {
using json = nlohmann::json;

namespace {

Result<EntityKind> parse_kind(const std::string& text) {
    if (text == "folder") {
        return Ok(EntityKind::Folder);
    }
    if (text == "node") {
        return Ok(EntityKind::Node);
    }
    if (text == "resource") {
        return Ok(EntityKind::Resource);
    }
    return Err<EntityKind>(ErrorCode::InvalidConfig, "Unknown dataset kind: " + text);
}

Result<SeedKind> parse_seed(const std::string& text) {
    if (text == "none") {
        return Ok(SeedKind::None);
    }
    if (text == "folders") {
        return Ok(SeedKind::Folders);
    }
    if (text == "images") {
        return Ok(SeedKind::Images);
    }
    return Err<SeedKind>(ErrorCode::InvalidConfig, "Unknown seed kind: " + text);
}

Result<std::vector<DatasetConfig>> parse_datasets(const json& arr) {
    if (!arr.is_array()) {
        return Err<std::vector<DatasetConfig>>(ErrorCode::InvalidConfig, "\"datasets\" must be an array");
    }
    std::vector<DatasetConfig> datasets;
    for (const auto& entry : arr) {
        if (!entry.is_object()) {
            return Err<std::vector<DatasetConfig>>(ErrorCode::InvalidConfig, "dataset entries must be objects");
        }
        DatasetConfig dataset;
        dataset.name = entry.value("name", std::string{});

        auto kind = parse_kind(entry.value("kind", std::string("resource")));
        if (kind.is_error()) {
            return Err<std::vector<DatasetConfig>>(kind.error());
        }
        dataset.kind = kind.value();

        auto seed = parse_seed(entry.value("seed", std::string("none")));
        if (seed.is_error()) {
            return Err<std::vector<DatasetConfig>>(seed.error());
        }
        dataset.seed = seed.value();
        datasets.push_back(std::move(dataset));
    }
    return Ok(std::move(datasets));
}

} // namespace

NodeConfig::NodeConfig() : datasets(default_datasets()) {}

std::vector<DatasetConfig> default_datasets() {
    return {
        {"resource", EntityKind::Resource, SeedKind::Images},
        {"folder", EntityKind::Folder, SeedKind::Folders},
        {"node", EntityKind::Node, SeedKind::None},
        {"resource1", EntityKind::Resource, SeedKind::Images},
        {"resource2", EntityKind::Resource, SeedKind::None},
        {"resource3", EntityKind::Resource, SeedKind::None},
    };
}

const char* to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::Folder: return "folder";
        case EntityKind::Node: return "node";
        case EntityKind::Resource: return "resource";
    }
    return "unknown";
}

const char* to_string(SeedKind kind) {
    switch (kind) {
        case SeedKind::None: return "none";
        case SeedKind::Folders: return "folders";
        case SeedKind::Images: return "images";
    }
    return "unknown";
}

Result<NodeConfig> parse_config(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<NodeConfig>(ErrorCode::InvalidConfig, "Invalid JSON");
    }
    if (!doc.is_object()) {
        return Err<NodeConfig>(ErrorCode::InvalidConfig, "Config root must be an object");
    }

    NodeConfig config;
    try {
        config.clients = doc.value("clients", config.clients);
        config.notification_capacity = doc.value("notification_capacity", config.notification_capacity);
        config.max_entity_bytes = doc.value("max_entity_bytes", config.max_entity_bytes);
        config.missing_label = doc.value("missing_label", config.missing_label);
        config.author = doc.value("author", config.author);
        config.images_dir = doc.value("images_dir", config.images_dir.string());
        config.log_level = doc.value("log_level", config.log_level);

        if (doc.contains("untracked_datasets")) {
            config.untracked_datasets = doc.at("untracked_datasets").get<std::set<std::string>>();
        }
        if (doc.contains("datasets")) {
            auto datasets = parse_datasets(doc.at("datasets"));
            if (datasets.is_error()) {
                return Err<NodeConfig>(datasets.error());
            }
            config.datasets = std::move(datasets.value());
        }
    } catch (const json::exception& e) {
        return Err<NodeConfig>(ErrorCode::InvalidConfig, e.what());
    }

    auto valid = validate_config(config);
    if (valid.is_error()) {
        return Err<NodeConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<NodeConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<NodeConfig>(ErrorCode::Io, "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    spdlog::debug("Loaded config from {}", path.string());
    return parse_config(buffer.str());
}

Result<void> validate_config(const NodeConfig& config) {
    if (config.datasets.empty()) {
        return Err<void>(ErrorCode::InvalidConfig, "At least one dataset is required");
    }
    std::set<std::string> names;
    for (const auto& dataset : config.datasets) {
        if (dataset.name.empty()) {
            return Err<void>(ErrorCode::InvalidConfig, "Dataset name must not be empty");
        }
        if (!names.insert(dataset.name).second) {
            return Err<void>(ErrorCode::InvalidConfig, "Duplicate dataset: " + dataset.name);
        }
    }
    if (config.notification_capacity == 0) {
        return Err<void>(ErrorCode::InvalidConfig, "notification_capacity must be > 0");
    }
    if (config.clients > kMaxClients) {
        return Err<void>(ErrorCode::InvalidConfig, "clients must be <= " + std::to_string(kMaxClients));
    }
    if (config.max_entity_bytes == 0) {
        return Err<void>(ErrorCode::InvalidConfig, "max_entity_bytes must be > 0");
    }
    auto author = hex_decode(config.author);
    if (author.is_error() || author.value().size() != 32) {
        return Err<void>(ErrorCode::InvalidConfig, "author must be 32 bytes of hex");
    }
    return Ok();
}

} // namespace docsync
