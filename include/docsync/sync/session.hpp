#pragma once

#include "docsync/events/event_bus.hpp"
#include "docsync/events/event_queue.hpp"
#include "docsync/sync/pending_index.hpp"
#include "docsync/sync/progress.hpp"
#include "docsync/sync/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace docsync::sync {

struct SessionOptions {
    std::size_t notification_capacity = 1000;
    /// Datasets whose remote inserts are not tracked for progress.
    std::set<std::string> untracked_datasets{"resource"};
};

/**
 * @brief Progress tracker of one dataset
 *
 * apply() is called by a single consumer in log order. Every query may be
 * called from any thread at any time.
 */
class SyncSession {
public:
    using CancelHandle = std::function<void()>;

    explicit SyncSession(std::string dataset_name,
                         SessionOptions options = {},
                         events::EventBus* bus = nullptr);

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    void apply(const DocEvent& event);

    /**
     * Stores the handle that stops the background consumer. It is invoked
     * exactly once, on the first all-clear; if the all-clear was already
     * seen the handle is invoked immediately.
     */
    void bind_task(CancelHandle cancel);

    [[nodiscard]] const std::string& dataset_name() const noexcept { return dataset_name_; }

    [[nodiscard]] std::uint64_t lifetime_pending_count() const noexcept { return counters_.lifetime_pending_count(); }
    [[nodiscard]] std::uint64_t lifetime_pending_bytes() const noexcept { return counters_.lifetime_pending_bytes(); }
    [[nodiscard]] std::uint64_t queue_pending_count() const noexcept { return counters_.queue_pending_count(); }
    [[nodiscard]] std::uint64_t queue_pending_bytes() const noexcept { return counters_.queue_pending_bytes(); }

    [[nodiscard]] bool metadata_caught_up() const noexcept { return metadata_caught_up_.load(); }
    [[nodiscard]] bool all_content_materialized() const noexcept { return all_content_materialized_.load(); }

    [[nodiscard]] SessionPhase session_phase() const noexcept;
    [[nodiscard]] ContentPhase content_phase() const noexcept;
    [[nodiscard]] ProgressSnapshot snapshot() const;

    [[nodiscard]] const PendingIndex& pending() const noexcept { return pending_; }

    /// Keys that just became available, oldest first.
    std::optional<std::string> try_next_ready();
    std::optional<std::string> next_ready_for(std::chrono::milliseconds timeout);
    [[nodiscard]] std::size_t ready_backlog() const { return outlet_.size(); }

    /// Releases a producer blocked on a full outlet; later keys are dropped.
    void close_notifications();

private:
    void handle(const RemoteInsert& event);
    void handle(const LocalInsert& event);
    void handle(const ContentReady& event);
    void handle(const AllClear& event);
    void handle(const PeerJoined& event);
    void handle(const PeerLeft& event);
    void handle(const RoundComplete& event);

    [[nodiscard]] bool is_tracked(const std::string& dataset) const;
    void on_all_content_materialized();

    std::string dataset_name_;
    SessionOptions options_;
    events::EventBus* bus_;

    PendingIndex pending_;
    ProgressCounters counters_;
    events::BoundedQueue<std::string> outlet_;

    std::atomic<bool> started_{false};
    std::atomic<bool> metadata_caught_up_{false};
    std::atomic<bool> all_content_materialized_{false};

    std::mutex task_mutex_;
    CancelHandle cancel_task_;
    bool task_cancelled_ = false;
};

} // namespace docsync::sync
