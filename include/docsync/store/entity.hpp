#pragma once

/**
 * @file entity.hpp
 * @brief Payload types stored in datasets and their encoding contract
 *
 * CONTRACT:
 * A type Entity can be stored in a Table<Entity> when EntityTraits<Entity>
 * provides:
 *
 *   static Bytes serialize(const Entity&);
 *   static Result<Entity> deserialize(const Bytes&);
 *   static Entity missing_placeholder(const std::string& key, const std::string& label);
 *   static const std::string& key_of(const Entity&);
 *
 * missing_placeholder() builds the entity shown when an entry's content
 * cannot be resolved. It must carry the given key; label is the
 * configured display text for "not found".
 */

#include "docsync/core/encoding.hpp"
#include "docsync/core/result.hpp"

#include <cstdint>
#include <string>

namespace docsync::store {

struct Folder {
    std::string folder_id;
    std::string folder_name;
};

struct Node {
    std::string node_name;
    std::int64_t key = 0;
    std::string node_id;
};

struct Resource {
    std::string id;
    std::string name;
    Bytes blob;
};

template<typename Entity>
struct EntityTraits;

template<>
struct EntityTraits<Folder> {
    static Bytes serialize(const Folder& folder);
    static Result<Folder> deserialize(const Bytes& bytes);
    /// Folders ignore the label and are shown as "Untitled".
    static Folder missing_placeholder(const std::string& key, const std::string& label);
    static const std::string& key_of(const Folder& folder) { return folder.folder_id; }
};

template<>
struct EntityTraits<Node> {
    static Bytes serialize(const Node& node);
    static Result<Node> deserialize(const Bytes& bytes);
    static Node missing_placeholder(const std::string& key, const std::string& label);
    static const std::string& key_of(const Node& node) { return node.node_id; }
};

template<>
struct EntityTraits<Resource> {
    static Bytes serialize(const Resource& resource);
    static Result<Resource> deserialize(const Bytes& bytes);
    static Resource missing_placeholder(const std::string& key, const std::string& label);
    static const std::string& key_of(const Resource& resource) { return resource.id; }
};

} // namespace docsync::store
