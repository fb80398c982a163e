#include "docsync/sync/session.hpp"

#include "docsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace docsync::sync {

SyncSession::SyncSession(std::string dataset_name, SessionOptions options, events::EventBus* bus)
    : dataset_name_(std::move(dataset_name)),
      options_(std::move(options)),
      bus_(bus),
      outlet_(options_.notification_capacity) {}

void SyncSession::apply(const DocEvent& event) {
    started_.store(true);
    std::visit([this](const auto& e) { handle(e); }, event);
}

void SyncSession::bind_task(CancelHandle cancel) {
    bool cancel_now = false;
    {
        std::lock_guard lock(task_mutex_);
        if (task_cancelled_) {
            cancel_now = true;
        } else if (all_content_materialized_.load()) {
            task_cancelled_ = true;
            cancel_now = true;
        } else {
            cancel_task_ = std::move(cancel);
        }
    }
    if (cancel_now && cancel) {
        spdlog::debug("[{}] task bound after all-clear, stopping it right away", dataset_name_);
        cancel();
    }
}

SessionPhase SyncSession::session_phase() const noexcept {
    if (metadata_caught_up_.load()) {
        return SessionPhase::MetadataCaughtUp;
    }
    return started_.load() ? SessionPhase::CatchingUp : SessionPhase::Starting;
}

ContentPhase SyncSession::content_phase() const noexcept {
    return all_content_materialized_.load() ? ContentPhase::FullyMaterialized : ContentPhase::ContentPending;
}

ProgressSnapshot SyncSession::snapshot() const {
    ProgressSnapshot snap;
    snap.dataset = dataset_name_;
    snap.session_phase = session_phase();
    snap.content_phase = content_phase();
    snap.lifetime_pending_count = counters_.lifetime_pending_count();
    snap.lifetime_pending_bytes = counters_.lifetime_pending_bytes();
    snap.queue_pending_count = counters_.queue_pending_count();
    snap.queue_pending_bytes = counters_.queue_pending_bytes();
    snap.pending_index_size = pending_.size();
    snap.notifications_queued = outlet_.size();
    snap.metadata_caught_up = metadata_caught_up_.load();
    snap.all_content_materialized = all_content_materialized_.load();
    return snap;
}

std::optional<std::string> SyncSession::try_next_ready() {
    return outlet_.try_pop();
}

std::optional<std::string> SyncSession::next_ready_for(std::chrono::milliseconds timeout) {
    return outlet_.pop_for(timeout);
}

void SyncSession::close_notifications() {
    outlet_.shutdown();
}

// ──────────────────────────────────────────────────────────
// Event handlers
// ──────────────────────────────────────────────────────────

void SyncSession::handle(const RemoteInsert& event) {
    const std::string& dataset = event.dataset_name.empty() ? dataset_name_ : event.dataset_name;
    if (!is_tracked(dataset)) {
        spdlog::debug("[RemoteInsert] {} untracked, key={}", dataset, event.logical_key);
        return;
    }

    // Zero-length content is a deletion marker
    if (event.content_size == 0) {
        spdlog::debug("[RemoteInsert] {} tombstone key={} from={}", dataset, event.logical_key, event.peer_id);
        return;
    }

    const bool inserted = pending_.insert(PendingItem{
        event.content_digest,
        event.logical_key,
        event.content_size,
        dataset,
    });
    if (!inserted) {
        spdlog::debug("[RemoteInsert] {} digest={} already pending", dataset, event.content_digest);
        return;
    }

    if (all_content_materialized_.load()) {
        spdlog::debug("[RemoteInsert] {} key={} indexed after all-clear, counters frozen",
                      dataset, event.logical_key);
        return;
    }

    counters_.record_pending(event.content_size);
    spdlog::debug("[RemoteInsert] {} key={} size={} from={} queue={}",
                  dataset, event.logical_key, event.content_size, event.peer_id,
                  counters_.queue_pending_count());
}

void SyncSession::handle(const LocalInsert& event) {
    spdlog::debug("[LocalInsert] {} key={} size={}",
                  dataset_name_, to_text(event.entry.key), event.entry.content_size);
}

void SyncSession::handle(const ContentReady& event) {
    auto item = pending_.take(event.content_digest);
    if (!item) {
        spdlog::debug("[ContentReady] {} digest={} not pending, ignoring", dataset_name_, event.content_digest);
        if (bus_) {
            bus_->emit(events::UnknownContentEvent{dataset_name_, event.content_digest});
        }
        return;
    }

    if (all_content_materialized_.load()) {
        spdlog::debug("[ContentReady] {} key={} after all-clear", dataset_name_, item->logical_key);
        return;
    }

    if (!outlet_.push(item->logical_key)) {
        spdlog::debug("[ContentReady] {} outlet closed, dropping key={}", dataset_name_, item->logical_key);
    }
    if (!counters_.record_materialized(item->size_bytes)) {
        spdlog::warn("[ContentReady] {} queue counters underflow on key={}", dataset_name_, item->logical_key);
    }
    if (bus_) {
        bus_->emit(events::ContentMaterializedEvent{dataset_name_, item->logical_key, item->size_bytes});
    }
}

void SyncSession::handle(const AllClear&) {
    const bool previous = all_content_materialized_.exchange(true);
    spdlog::info("[AllClear] {} all remote content synced (already={})", dataset_name_, previous);
    if (!previous) {
        on_all_content_materialized();
    }
}

void SyncSession::handle(const PeerJoined& event) {
    spdlog::info("[PeerJoined] {} peer={}", dataset_name_, event.peer_id);
    if (bus_) {
        bus_->emit(events::PeerJoinedEvent{dataset_name_, event.peer_id});
    }
}

void SyncSession::handle(const PeerLeft& event) {
    spdlog::info("[PeerLeft] {} peer={}", dataset_name_, event.peer_id);
    if (bus_) {
        bus_->emit(events::PeerLeftEvent{dataset_name_, event.peer_id});
    }
}

void SyncSession::handle(const RoundComplete& event) {
    const bool previous = metadata_caught_up_.exchange(true);
    spdlog::info("[RoundComplete] {} peer={} took {}ms", dataset_name_, event.peer_id, event.duration.count());
    if (!previous && bus_) {
        bus_->emit(events::MetadataCaughtUpEvent{dataset_name_, "peer " + event.peer_id});
    }
}

bool SyncSession::is_tracked(const std::string& dataset) const {
    return options_.untracked_datasets.count(dataset) == 0;
}

void SyncSession::on_all_content_materialized() {
    CancelHandle cancel;
    {
        std::lock_guard lock(task_mutex_);
        if (!task_cancelled_) {
            task_cancelled_ = true;
            cancel = std::move(cancel_task_);
            cancel_task_ = nullptr;
        }
    }
    if (cancel) {
        spdlog::debug("[AllClear] {} stopping background consumer", dataset_name_);
        cancel();
    }

    if (bus_) {
        bus_->emit(events::SessionConvergedEvent{
            dataset_name_,
            counters_.lifetime_pending_count(),
            counters_.lifetime_pending_bytes(),
            counters_.queue_pending_count(),
            counters_.queue_pending_bytes(),
        });
    }
}

} // namespace docsync::sync
