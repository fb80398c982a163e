#include "docsync/sync/progress.hpp"

namespace docsync::sync {

void ProgressCounters::record_pending(std::uint64_t size_bytes) noexcept {
    lifetime_count_.fetch_add(1, std::memory_order_acq_rel);
    lifetime_bytes_.fetch_add(size_bytes, std::memory_order_acq_rel);
    queue_count_.fetch_add(1, std::memory_order_acq_rel);
    queue_bytes_.fetch_add(size_bytes, std::memory_order_acq_rel);
}

bool ProgressCounters::record_materialized(std::uint64_t size_bytes) noexcept {
    const bool count_ok = saturating_sub(queue_count_, 1);
    const bool bytes_ok = saturating_sub(queue_bytes_, size_bytes);
    return count_ok && bytes_ok;
}

bool ProgressCounters::saturating_sub(std::atomic<std::uint64_t>& cell, std::uint64_t amount) noexcept {
    std::uint64_t current = cell.load(std::memory_order_acquire);
    while (true) {
        const std::uint64_t next = current >= amount ? current - amount : 0;
        if (cell.compare_exchange_weak(current, next, std::memory_order_acq_rel, std::memory_order_acquire)) {
            return current >= amount;
        }
    }
}

} // namespace docsync::sync
