/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace crew_orchestrator;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, CancellableJobSeesCallerToken) {
    ThreadPool pool(1);
    std::stop_source source;

    auto future = pool.submit_cancellable(source.get_token(), [](std::stop_token stop) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return stop.stop_requested();
    });

    source.request_stop();
    EXPECT_TRUE(future.get());
}

TEST(ThreadPoolTest, StoppingOneJobLeavesOthersAlone) {
    ThreadPool pool(2);
    std::stop_source stopped;
    std::stop_source running;
    stopped.request_stop();

    auto a = pool.submit_cancellable(stopped.get_token(),
                                     [](std::stop_token stop) { return stop.stop_requested(); });
    auto b = pool.submit_cancellable(running.get_token(),
                                     [](std::stop_token stop) { return stop.stop_requested(); });

    EXPECT_TRUE(a.get());
    EXPECT_FALSE(b.get());
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.thread_count(), 1u);
}

TEST(ThreadPoolTest, GrowToAddsWorkersOnly) {
    ThreadPool pool(1);
    pool.grow_to(3);
    EXPECT_EQ(pool.thread_count(), 3u);
    pool.grow_to(2);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, GrownWorkerRunsJobQueuedBehindBusyOne) {
    ThreadPool pool(1);
    std::stop_source release;

    auto busy = pool.submit_cancellable(release.get_token(), [](std::stop_token stop) {
        while (!stop.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 0;
    });
    auto queued = pool.submit([] { return 7; });

    EXPECT_EQ(queued.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);
    pool.grow_to(2);
    ASSERT_EQ(queued.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(queued.get(), 7);

    release.request_stop();
    EXPECT_EQ(busy.get(), 0);
}
