#pragma once

#include "docsync/core/encoding.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace docsync::sync {

/// Fixed-size identifier of a blob, rendered as hex text.
using ContentDigest = std::string;
using PeerId = std::string;
/// Hex-encoded 32-byte author identity.
using AuthorId = std::string;

/**
 * @brief One revision of one key in a document log
 */
struct LogEntry {
    Bytes key;
    ContentDigest content_digest;
    std::uint64_t content_size = 0;
    AuthorId author;
    std::int64_t timestamp_us = 0;
};

/**
 * @brief Content referenced by replicated metadata but not yet stored locally
 */
struct PendingItem {
    ContentDigest content_id;
    std::string logical_key;
    std::uint64_t size_bytes = 0;
    std::string dataset_name;
};

// ════════════════════════════════════════════════════════
// Replication events (per dataset, delivered in log order)
// ════════════════════════════════════════════════════════

/// A peer's entry arrived; its content may not be here yet.
struct RemoteInsert {
    ContentDigest content_digest;
    std::uint64_t content_size = 0;
    std::string logical_key;
    std::string dataset_name;
    PeerId peer_id;
};

/// This replica wrote an entry; its content is already local.
struct LocalInsert {
    LogEntry entry;
};

struct ContentReady {
    ContentDigest content_digest;
};

/// Everything referenced at initial sync time has been fetched.
struct AllClear {};

struct PeerJoined {
    PeerId peer_id;
};

struct PeerLeft {
    PeerId peer_id;
};

/// The log finished a reconciliation round with a peer (metadata only).
struct RoundComplete {
    PeerId peer_id;
    std::chrono::milliseconds duration{0};
};

using DocEvent = std::variant<
    RemoteInsert,
    LocalInsert,
    ContentReady,
    AllClear,
    PeerJoined,
    PeerLeft,
    RoundComplete>;

const char* event_name(const DocEvent& event);

// ════════════════════════════════════════════════════════
// Session state
// ════════════════════════════════════════════════════════

enum class SessionPhase {
    Starting,
    CatchingUp,
    MetadataCaughtUp
};

enum class ContentPhase {
    ContentPending,
    FullyMaterialized
};

const char* to_string(SessionPhase phase);
const char* to_string(ContentPhase phase);

/**
 * @brief Point-in-time copy of one session for status displays
 *
 * Each field is read atomically on its own; the snapshot as a whole is
 * not taken under a lock.
 */
struct ProgressSnapshot {
    std::string dataset;
    SessionPhase session_phase = SessionPhase::Starting;
    ContentPhase content_phase = ContentPhase::ContentPending;
    std::uint64_t lifetime_pending_count = 0;
    std::uint64_t lifetime_pending_bytes = 0;
    std::uint64_t queue_pending_count = 0;
    std::uint64_t queue_pending_bytes = 0;
    std::size_t pending_index_size = 0;
    std::size_t notifications_queued = 0;
    bool metadata_caught_up = false;
    bool all_content_materialized = false;
};

} // namespace docsync::sync
