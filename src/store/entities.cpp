#include "docsync/store/entity.hpp"

#include "docsync/store/serializer.hpp"

namespace docsync::store {
namespace {

constexpr std::uint8_t kFolderVersion = 1;
constexpr std::uint8_t kNodeVersion = 1;
constexpr std::uint8_t kResourceVersion = 1;

Result<void> expect_version(BinaryReader& reader, std::uint8_t expected, const char* type_name) {
    auto version = reader.read_uint8();
    if (version.is_error()) {
        return Err<void>(version.error());
    }
    if (version.value() != expected) {
        return Err<void>(ErrorCode::DecodeFailed,
                         std::string("Unsupported ") + type_name + " version: " +
                             std::to_string(version.value()));
    }
    return Ok();
}

Result<void> expect_end(const BinaryReader& reader, const char* type_name) {
    if (!reader.at_end()) {
        return Err<void>(ErrorCode::DecodeFailed,
                         std::string("Trailing bytes after ") + type_name + ": " +
                             std::to_string(reader.remaining()));
    }
    return Ok();
}

} // namespace

// ════════════════════════════════════════════════════════
// Folder
// ════════════════════════════════════════════════════════

Bytes EntityTraits<Folder>::serialize(const Folder& folder) {
    BinaryWriter out;
    out.write_uint8(kFolderVersion);
    out.write_string(folder.folder_id);
    out.write_string(folder.folder_name);
    return out.take();
}

Result<Folder> EntityTraits<Folder>::deserialize(const Bytes& bytes) {
    BinaryReader in(bytes);
    auto version = expect_version(in, kFolderVersion, "folder");
    if (version.is_error()) {
        return Err<Folder>(version.error());
    }

    Folder folder;
    auto id = in.read_string();
    if (id.is_error()) {
        return Err<Folder>(id.error());
    }
    folder.folder_id = std::move(id.value());

    auto name = in.read_string();
    if (name.is_error()) {
        return Err<Folder>(name.error());
    }
    folder.folder_name = std::move(name.value());

    auto end = expect_end(in, "folder");
    if (end.is_error()) {
        return Err<Folder>(end.error());
    }
    return Ok(std::move(folder));
}

Folder EntityTraits<Folder>::missing_placeholder(const std::string& key, const std::string&) {
    return Folder{key, "Untitled"};
}

// ════════════════════════════════════════════════════════
// Node
// ════════════════════════════════════════════════════════

Bytes EntityTraits<Node>::serialize(const Node& node) {
    BinaryWriter out;
    out.write_uint8(kNodeVersion);
    out.write_string(node.node_name);
    out.write_int64(node.key);
    out.write_string(node.node_id);
    return out.take();
}

Result<Node> EntityTraits<Node>::deserialize(const Bytes& bytes) {
    BinaryReader in(bytes);
    auto version = expect_version(in, kNodeVersion, "node");
    if (version.is_error()) {
        return Err<Node>(version.error());
    }

    Node node;
    auto name = in.read_string();
    if (name.is_error()) {
        return Err<Node>(name.error());
    }
    node.node_name = std::move(name.value());

    auto key = in.read_int64();
    if (key.is_error()) {
        return Err<Node>(key.error());
    }
    node.key = key.value();

    auto id = in.read_string();
    if (id.is_error()) {
        return Err<Node>(id.error());
    }
    node.node_id = std::move(id.value());

    auto end = expect_end(in, "node");
    if (end.is_error()) {
        return Err<Node>(end.error());
    }
    return Ok(std::move(node));
}

Node EntityTraits<Node>::missing_placeholder(const std::string& key, const std::string& label) {
    return Node{label, 0, key};
}

// ════════════════════════════════════════════════════════
// Resource
// ════════════════════════════════════════════════════════

Bytes EntityTraits<Resource>::serialize(const Resource& resource) {
    BinaryWriter out;
    out.write_uint8(kResourceVersion);
    out.write_string(resource.id);
    out.write_string(resource.name);
    out.write_blob(resource.blob);
    return out.take();
}

Result<Resource> EntityTraits<Resource>::deserialize(const Bytes& bytes) {
    BinaryReader in(bytes);
    auto version = expect_version(in, kResourceVersion, "resource");
    if (version.is_error()) {
        return Err<Resource>(version.error());
    }

    Resource resource;
    auto id = in.read_string();
    if (id.is_error()) {
        return Err<Resource>(id.error());
    }
    resource.id = std::move(id.value());

    auto name = in.read_string();
    if (name.is_error()) {
        return Err<Resource>(name.error());
    }
    resource.name = std::move(name.value());

    auto blob = in.read_blob();
    if (blob.is_error()) {
        return Err<Resource>(blob.error());
    }
    resource.blob = std::move(blob.value());

    auto end = expect_end(in, "resource");
    if (end.is_error()) {
        return Err<Resource>(end.error());
    }
    return Ok(std::move(resource));
}

Resource EntityTraits<Resource>::missing_placeholder(const std::string& key, const std::string& label) {
    return Resource{key, label, {}};
}

} // namespace docsync::store
