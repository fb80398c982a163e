#pragma once

/**
 * @file config.hpp
 * @brief Node configuration loaded from JSON
 *
 * Every field has a default, so an empty object "{}" is a valid config.
 *
 * EXAMPLE:
 * {
 *   "clients": 2,
 *   "untracked_datasets": ["resource"],
 *   "notification_capacity": 1000,
 *   "log_level": "debug",
 *   "datasets": [
 *     {"name": "folder", "kind": "folder", "seed": "folders"},
 *     {"name": "resource", "kind": "resource", "seed": "images"}
 *   ]
 * }
 *
 * The order of "datasets" is also the order of tickets in the shared
 * ticket string.
 */

#include "docsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace docsync {

enum class EntityKind {
    Folder,
    Node,
    Resource
};

/// What a freshly created (not joined) dataset is filled with.
enum class SeedKind {
    None,
    Folders,
    Images
};

struct DatasetConfig {
    std::string name;
    EntityKind kind = EntityKind::Resource;
    SeedKind seed = SeedKind::None;
};

inline constexpr std::uint64_t kDefaultMaxEntityBytes = 150ULL * 1024 * 1024;
inline constexpr std::size_t kDefaultNotificationCapacity = 1000;
inline constexpr std::size_t kMaxClients = 16;
inline constexpr const char* kDefaultAuthorHex =
    "0739eaedef97c927d2f480b2224326d8f74c7e31ff7029b74f008a42f9226d0e";

struct NodeConfig {
    /// In-process nodes that join the server's datasets.
    std::size_t clients = 1;
    std::vector<DatasetConfig> datasets;
    std::set<std::string> untracked_datasets{"resource"};
    std::size_t notification_capacity = kDefaultNotificationCapacity;
    std::uint64_t max_entity_bytes = kDefaultMaxEntityBytes;
    std::string missing_label{"File not found"};
    std::string author{kDefaultAuthorHex};
    std::filesystem::path images_dir{"images"};
    std::string log_level{"info"};

    NodeConfig();
};

/// resource, folder, node, resource1, resource2, resource3
std::vector<DatasetConfig> default_datasets();

const char* to_string(EntityKind kind);
const char* to_string(SeedKind kind);

Result<NodeConfig> parse_config(const std::string& json_text);
Result<NodeConfig> load_config(const std::filesystem::path& path);

/// Checks ranges and cross-field constraints; parse_config() calls it.
Result<void> validate_config(const NodeConfig& config);

} // namespace docsync
