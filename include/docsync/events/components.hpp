/**
 * @file components.hpp
 * @brief Ready-made listeners for session observability events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Sessions constructed with &bus now get logged and counted
 */

#pragma once

#include "docsync/events/event_bus.hpp"
#include "docsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace docsync::events {

/**
 * @brief Logs every observability event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<PeerJoinedEvent>([](const PeerJoinedEvent& e) {
            spdlog::info("[PeerJoined] dataset={} peer={}", e.dataset, e.peer_id);
        });

        bus.subscribe<PeerLeftEvent>([](const PeerLeftEvent& e) {
            spdlog::info("[PeerLeft] dataset={} peer={}", e.dataset, e.peer_id);
        });

        bus.subscribe<MetadataCaughtUpEvent>([](const MetadataCaughtUpEvent& e) {
            spdlog::info("[MetadataCaughtUp] dataset={} info={}", e.dataset, e.info);
        });

        bus.subscribe<ContentMaterializedEvent>([](const ContentMaterializedEvent& e) {
            spdlog::debug("[ContentMaterialized] dataset={} key={} bytes={}",
                          e.dataset, e.logical_key, e.size_bytes);
        });

        bus.subscribe<UnknownContentEvent>([](const UnknownContentEvent& e) {
            spdlog::debug("[UnknownContent] dataset={} digest={}", e.dataset, e.content_digest);
        });

        bus.subscribe<SessionConvergedEvent>([](const SessionConvergedEvent& e) {
            spdlog::info("[SessionConverged] dataset={} lifetime={}/{}B queue={}/{}B",
                         e.dataset,
                         e.lifetime_pending_count, e.lifetime_pending_bytes,
                         e.queue_pending_count, e.queue_pending_bytes);
        });

        bus.subscribe<SubscriptionFailedEvent>([](const SubscriptionFailedEvent& e) {
            spdlog::error("[SubscriptionFailed] dataset={} error={}", e.dataset, e.error_message);
        });
    }
};

/**
 * @brief Process-wide counters across all sessions
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().sessions_converged.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> peers_joined{0};
        std::atomic<std::uint64_t> peers_left{0};
        std::atomic<std::uint64_t> datasets_caught_up{0};
        std::atomic<std::uint64_t> items_materialized{0};
        std::atomic<std::uint64_t> bytes_materialized{0};
        std::atomic<std::uint64_t> unknown_content{0};
        std::atomic<std::uint64_t> sessions_converged{0};
        std::atomic<std::uint64_t> subscription_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<PeerJoinedEvent>([this](const PeerJoinedEvent&) {
            stats_.peers_joined++;
        });
        bus.subscribe<PeerLeftEvent>([this](const PeerLeftEvent&) {
            stats_.peers_left++;
        });
        bus.subscribe<MetadataCaughtUpEvent>([this](const MetadataCaughtUpEvent&) {
            stats_.datasets_caught_up++;
        });
        bus.subscribe<ContentMaterializedEvent>([this](const ContentMaterializedEvent& e) {
            stats_.items_materialized++;
            stats_.bytes_materialized += e.size_bytes;
        });
        bus.subscribe<UnknownContentEvent>([this](const UnknownContentEvent&) {
            stats_.unknown_content++;
        });
        bus.subscribe<SessionConvergedEvent>([this](const SessionConvergedEvent&) {
            stats_.sessions_converged++;
        });
        bus.subscribe<SubscriptionFailedEvent>([this](const SubscriptionFailedEvent&) {
            stats_.subscription_failures++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Peers joined:        {}", stats_.peers_joined.load());
        spdlog::info("  Peers left:          {}", stats_.peers_left.load());
        spdlog::info("  Datasets caught up:  {}", stats_.datasets_caught_up.load());
        spdlog::info("  Items materialized:  {}", stats_.items_materialized.load());
        spdlog::info("  Bytes materialized:  {}", stats_.bytes_materialized.load());
        spdlog::info("  Unknown content:     {}", stats_.unknown_content.load());
        spdlog::info("  Sessions converged:  {}", stats_.sessions_converged.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
};

} // namespace docsync::events
