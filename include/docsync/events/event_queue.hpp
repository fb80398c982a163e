/**
 * @file event_queue.hpp
 * @brief Thread-safe FIFO with optional capacity bound
 *
 * WHY THIS FILE EXISTS:
 * Two places in the system hand items from one thread to another:
 * - A document subscription hands replication events to a session worker
 *   (unbounded, the log never waits for us)
 * - A session hands "content ready" keys to whoever displays them
 *   (bounded, a slow consumer must slow the session down instead of
 *   losing notifications)
 *
 * EXAMPLE:
 * BoundedQueue<std::string> outlet(1000);
 * outlet.push("k1");          // Producer, blocks while 1000 items are queued
 * auto key = outlet.try_pop(); // Consumer
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace docsync::events {

/**
 * @brief Thread-safe FIFO queue with backpressure
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - capacity == 0 means unbounded
 *
 * SHUTDOWN:
 * After shutdown() producers are released (push returns false) and
 * consumers drain what is left, then receive nullopt.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push item, waiting for room when the queue is full
     *
     * RETURNS: false if the queue was shut down before the item was queued
     * BLOCKS: Yes, while full
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return shutdown_ || !full_locked();
            });
            if (shutdown_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push item only if there is room right now
     */
    bool try_push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_ || full_locked()) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_locked(lock);
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Item, or nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_locked(lock);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        })) {
            return std::nullopt;  // Timeout
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_locked(lock);
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

    /**
     * @brief Wake every waiting producer and consumer
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    bool full_locked() const {
        return capacity_ != 0 && queue_.size() >= capacity_;
    }

    T take_locked(std::unique_lock<std::mutex>& lock) {
        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_ = false;
};

} // namespace docsync::events
