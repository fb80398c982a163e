#pragma once

#include <atomic>
#include <cstdint>

namespace docsync::sync {

/**
 * @brief Backlog counters of one session
 *
 * lifetime_* only grow: the whole initial backlog ever observed.
 * queue_*    grow and shrink: the part of it still outstanding.
 *
 * Each counter is an independent atomic, so readers on other threads never
 * see a torn value. Growth bumps lifetime before queue and shrinking only
 * touches queue, which keeps queue <= lifetime for any reader.
 */
class ProgressCounters {
public:
    ProgressCounters() = default;

    ProgressCounters(const ProgressCounters&) = delete;
    ProgressCounters& operator=(const ProgressCounters&) = delete;

    void record_pending(std::uint64_t size_bytes) noexcept;

    /// Saturates at zero; returns false if a counter would have underflowed.
    bool record_materialized(std::uint64_t size_bytes) noexcept;

    std::uint64_t lifetime_pending_count() const noexcept {
        return lifetime_count_.load(std::memory_order_acquire);
    }
    std::uint64_t lifetime_pending_bytes() const noexcept {
        return lifetime_bytes_.load(std::memory_order_acquire);
    }
    std::uint64_t queue_pending_count() const noexcept {
        return queue_count_.load(std::memory_order_acquire);
    }
    std::uint64_t queue_pending_bytes() const noexcept {
        return queue_bytes_.load(std::memory_order_acquire);
    }

private:
    static bool saturating_sub(std::atomic<std::uint64_t>& cell, std::uint64_t amount) noexcept;

    std::atomic<std::uint64_t> lifetime_count_{0};
    std::atomic<std::uint64_t> lifetime_bytes_{0};
    std::atomic<std::uint64_t> queue_count_{0};
    std::atomic<std::uint64_t> queue_bytes_{0};
};

} // namespace docsync::sync
