/**
 * @file test_completion_queue.cpp
 * @brief Unit tests for the flush outcome queue and the flush worker pool
 */

#include <gtest/gtest.h>
#include <dag/completion_queue.hpp>
#include <dag/flush_workers.hpp>
#include "scripted_block_store.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace Dagstore;

TEST(CompletionQueueTest, TryPopOnEmptyReturnsNothing) {
    CompletionQueue queue;
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(CompletionQueueTest, SuccessAndFailureMessages) {
    CompletionQueue queue;
    queue.push(nullptr);
    queue.push(std::make_exception_ptr(std::runtime_error("boom")));

    auto ok = queue.try_pop();
    ASSERT_TRUE(ok.has_value());
    EXPECT_FALSE(*ok);

    auto failed = queue.pop();
    ASSERT_TRUE(failed);
    EXPECT_THROW(std::rethrow_exception(failed), std::runtime_error);
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(CompletionQueueTest, PopBlocksUntilPush) {
    CompletionQueue queue;
    std::atomic<bool> popped{false};

    std::thread consumer([&] {
        queue.pop();
        popped = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(popped.load());

    queue.push(nullptr);
    consumer.join();
    EXPECT_TRUE(popped.load());
}

TEST(CompletionQueueTest, ManyProducers) {
    CompletionQueue queue;
    std::vector<std::thread> producers;
    for (int t = 0; t < 8; ++t) {
        producers.emplace_back([&] {
            for (int i = 0; i < 100; ++i) queue.push(nullptr);
        });
    }
    for (auto& p : producers) p.join();

    size_t drained = 0;
    while (queue.try_pop()) ++drained;
    EXPECT_EQ(drained, 800u);
}

TEST(FlushWorkersTest, RejectsZeroWorkers) {
    EXPECT_THROW(FlushWorkers(0), std::invalid_argument);
}

TEST(FlushWorkersTest, RunsAllJobsBeforeDestruction) {
    std::atomic<int> ran{0};
    {
        FlushWorkers workers(4);
        for (int i = 0; i < 50; ++i) {
            workers.submit([&] { ran++; });
        }
    }
    EXPECT_EQ(ran.load(), 50);
}

TEST(FlushWorkersTest, ThreadsBoundedByMaximum) {
    FlushWorkers workers(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 9; ++i) {
        workers.submit([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
        });
    }
    EXPECT_LE(workers.thread_count(), 3u);

    // Give the pool time to finish before checking the peak
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_LE(peak.load(), 3);
}

TEST(FlushWorkersTest, StartsThreadsLazily) {
    FlushWorkers workers(8);
    EXPECT_EQ(workers.thread_count(), 0u);
    workers.submit([] {});
    EXPECT_GE(workers.thread_count(), 1u);
}

TEST(FlushWorkersTest, FailedThreadStartLeavesJobUnqueued) {
    std::atomic<int> ran{0};
    {
        FlushWorkers workers(1, Dagstore::testing::limited_threads(0, 1));
        EXPECT_THROW(workers.submit([&] { ran += 1; }), std::system_error);
        EXPECT_EQ(workers.thread_count(), 0u);

        workers.submit([&] { ran += 10; });
        EXPECT_EQ(workers.thread_count(), 1u);
    }
    // Only the second job ran; the refused one was never queued.
    EXPECT_EQ(ran.load(), 10);
}
