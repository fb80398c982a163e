#include "docsync/sync/progress.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using docsync::sync::ProgressCounters;

TEST(ProgressCountersTest, PendingGrowsBothPairs) {
    ProgressCounters counters;

    counters.record_pending(500);
    counters.record_pending(1000);

    EXPECT_EQ(counters.lifetime_pending_count(), 2u);
    EXPECT_EQ(counters.lifetime_pending_bytes(), 1500u);
    EXPECT_EQ(counters.queue_pending_count(), 2u);
    EXPECT_EQ(counters.queue_pending_bytes(), 1500u);
}

TEST(ProgressCountersTest, MaterializedOnlyShrinksQueue) {
    ProgressCounters counters;
    counters.record_pending(500);
    counters.record_pending(1000);

    EXPECT_TRUE(counters.record_materialized(500));

    EXPECT_EQ(counters.queue_pending_count(), 1u);
    EXPECT_EQ(counters.queue_pending_bytes(), 1000u);
    EXPECT_EQ(counters.lifetime_pending_count(), 2u);
    EXPECT_EQ(counters.lifetime_pending_bytes(), 1500u);
}

TEST(ProgressCountersTest, UnderflowSaturatesAtZero) {
    ProgressCounters counters;
    counters.record_pending(10);

    EXPECT_FALSE(counters.record_materialized(50));
    EXPECT_EQ(counters.queue_pending_count(), 0u);
    EXPECT_EQ(counters.queue_pending_bytes(), 0u);

    EXPECT_FALSE(counters.record_materialized(1));
    EXPECT_EQ(counters.queue_pending_count(), 0u);
}

TEST(ProgressCountersTest, ConcurrentUpdatesBalance) {
    ProgressCounters counters;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&counters]() {
            for (int i = 0; i < 1000; ++i) {
                counters.record_pending(3);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    threads.clear();

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&counters]() {
            for (int i = 0; i < 1000; ++i) {
                counters.record_materialized(3);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(counters.lifetime_pending_count(), 4000u);
    EXPECT_EQ(counters.lifetime_pending_bytes(), 12000u);
    EXPECT_EQ(counters.queue_pending_count(), 0u);
    EXPECT_EQ(counters.queue_pending_bytes(), 0u);
}

TEST(ProgressCountersTest, QueueNeverExceedsLifetimeForReaders) {
    ProgressCounters counters;
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    // queue is read before lifetime: lifetime only grows, so a later read can
    // only be larger
    std::thread reader([&]() {
        while (!done.load()) {
            const auto queue_count = counters.queue_pending_count();
            const auto queue_bytes = counters.queue_pending_bytes();
            const auto lifetime_count = counters.lifetime_pending_count();
            const auto lifetime_bytes = counters.lifetime_pending_bytes();
            if (queue_count > lifetime_count || queue_bytes > lifetime_bytes) {
                violations.fetch_add(1);
            }
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 2; ++t) {
        writers.emplace_back([&counters]() {
            for (int i = 0; i < 5000; ++i) {
                counters.record_pending(7);
            }
        });
        writers.emplace_back([&counters]() {
            for (int i = 0; i < 5000; ++i) {
                counters.record_materialized(7);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(counters.lifetime_pending_count(), 10000u);
    EXPECT_LE(counters.queue_pending_count(), counters.lifetime_pending_count());
}
