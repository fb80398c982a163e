/**
 * @file events.hpp
 * @brief Observability events published by sync sessions
 *
 * WHY THIS FILE EXISTS:
 * Replication events (see sync/types.hpp) drive the sessions. The events
 * here are what the sessions tell the rest of the process about it.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: PeerJoinedEvent, SessionConvergedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace docsync::events {

// ════════════════════════════════════════════════════════
// Peer Events
// ════════════════════════════════════════════════════════

struct PeerJoinedEvent {
    std::string dataset;
    std::string peer_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PeerLeftEvent {
    std::string dataset;
    std::string peer_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Progress Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the log finished its first reconciliation round
 *
 * WHO EMITS: SyncSession on RoundComplete (first time only)
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct MetadataCaughtUpEvent {
    std::string dataset;
    std::string info;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a tracked item of the initial backlog arrived locally
 *
 * WHO EMITS: SyncSession on ContentReady before the all-clear
 * WHO SUBSCRIBES: Metrics (bytes fetched), status displays
 */
struct ContentMaterializedEvent {
    std::string dataset;
    std::string logical_key;
    std::uint64_t size_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when content arrived for a digest nobody was waiting for
 *
 * Benign: content resolved before its metadata, or a duplicate signal.
 */
struct UnknownContentEvent {
    std::string dataset;
    std::string content_digest;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted exactly once per session, on the all-clear edge
 *
 * Carries the frozen counters so listeners can render a final summary.
 */
struct SessionConvergedEvent {
    std::string dataset;
    std::uint64_t lifetime_pending_count = 0;
    std::uint64_t lifetime_pending_bytes = 0;
    std::uint64_t queue_pending_count = 0;
    std::uint64_t queue_pending_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SubscriptionFailedEvent {
    std::string dataset;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace docsync::events
