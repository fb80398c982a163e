#pragma once

/**
 * @file table.hpp
 * @brief Typed read/write surface over one dataset
 *
 * WHY THIS FILE EXISTS:
 * Callers want "all folders" or "add this resource", not log entries and
 * digests. Table<Entity> maps between the two through EntityTraits.
 *
 * HOW IT INTEGRATES:
 * - The registry builds one table per dataset next to its SyncSession
 * - Tables never read session state; a search may run while the session
 *   is still catching up and will show placeholders for missing content
 *
 * EXAMPLE:
 * auto folders = registry.table<Folder>("folder");
 * folders->insert_entity(Folder{make_uuid_v4(), "Inbox"});
 * auto all = folders->search();
 */

#include "docsync/core/encoding.hpp"
#include "docsync/core/result.hpp"
#include "docsync/store/entity.hpp"
#include "docsync/sync/document.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docsync::store {

struct TableOptions {
    /// Largest payload insert() accepts, in bytes.
    std::uint64_t max_entity_bytes = 150ULL * 1024 * 1024;
    /// Display text for entities whose content cannot be resolved.
    std::string missing_label{"File not found"};
};

template<typename Entity>
class Table {
public:
    using Traits = EntityTraits<Entity>;

    Table(std::string dataset,
          std::shared_ptr<sync::DocumentLog> document,
          const sync::ContentStore& content,
          sync::AuthorId author,
          std::optional<std::string> ticket,
          TableOptions options = {})
        : dataset_(std::move(dataset)),
          document_(std::move(document)),
          content_(content),
          author_(std::move(author)),
          ticket_(std::move(ticket)),
          options_(std::move(options)) {}

    /**
     * @brief Latest revision of every key, decoded
     *
     * ERRORS:
     * - KeyDecode if any key is not valid UTF-8 (fails the whole call)
     * - DecodeFailed if resolved content is not a valid Entity
     *
     * Content that cannot be resolved yields a placeholder for that key
     * instead of an error.
     */
    Result<std::vector<Entity>> search() const {
        auto entries = document_->latest_per_key();
        if (entries.is_error()) {
            return Err<std::vector<Entity>>(entries.error());
        }

        std::vector<Entity> entities;
        entities.reserve(entries.value().size());
        for (const auto& entry : entries.value()) {
            auto entity = entity_from_entry(entry);
            if (entity.is_error()) {
                return Err<std::vector<Entity>>(entity.error());
            }
            entities.push_back(std::move(entity.value()));
        }
        return Ok(std::move(entities));
    }

    /**
     * @brief Writes bytes as a new revision of key
     *
     * SizeLimitExceeded is reported before anything is written.
     */
    Result<void> insert(const std::string& key, const Bytes& bytes) {
        if (bytes.size() > options_.max_entity_bytes) {
            return Err<void>(ErrorCode::SizeLimitExceeded,
                             "Entity of " + std::to_string(bytes.size()) + " bytes exceeds limit of " +
                                 std::to_string(options_.max_entity_bytes));
        }
        auto digest = document_->set_bytes(author_, to_bytes(key), bytes);
        if (digest.is_error()) {
            return Err<void>(digest.error());
        }
        spdlog::debug("[{}] inserted key={} digest={} size={}", dataset_, key, digest.value(), bytes.size());
        return Ok();
    }

    Result<void> insert_entity(const Entity& entity) {
        return insert(Traits::key_of(entity), Traits::serialize(entity));
    }

    /// Empty when this side created the dataset without issuing a ticket.
    std::string ticket_string() const {
        return ticket_ ? *ticket_ : std::string{};
    }

    const std::string& dataset() const noexcept { return dataset_; }
    sync::DocumentLog& document() const noexcept { return *document_; }

private:
    Result<Entity> entity_from_entry(const sync::LogEntry& entry) const {
        if (!is_valid_utf8(entry.key)) {
            return Err<Entity>(ErrorCode::KeyDecode,
                               "Key is not valid UTF-8 in dataset " + dataset_ + ": " + hex_encode(entry.key));
        }
        std::string key = to_text(entry.key);

        auto content = content_.resolve(entry.content_digest);
        if (content.is_error()) {
            spdlog::debug("[{}] content for key={} unavailable ({}), using placeholder",
                          dataset_, key, content.error().describe());
            return Ok(Traits::missing_placeholder(key, options_.missing_label));
        }
        return Traits::deserialize(content.value());
    }

    std::string dataset_;
    std::shared_ptr<sync::DocumentLog> document_;
    const sync::ContentStore& content_;
    sync::AuthorId author_;
    std::optional<std::string> ticket_;
    TableOptions options_;
};

using FolderTable = Table<Folder>;
using NodeTable = Table<Node>;
using ResourceTable = Table<Resource>;

/// Inserts a folder under a fresh random id.
Result<std::string> insert_folder(FolderTable& table, const std::string& folder_name);

/// Inserts a resource under a fresh random id.
Result<std::string> add_file(ResourceTable& table, const std::string& name, Bytes blob);

/**
 * @brief Adds every regular, non-hidden file of a directory as a Resource
 *
 * RETURNS: number of files added; Io if the directory is missing or a
 * file cannot be read. Files added before a failure stay added.
 */
Result<std::size_t> load_images(ResourceTable& table, const std::filesystem::path& images_dir);

} // namespace docsync::store
