/**
 * @file thread_pool.hpp
 * @brief std::jthread-based pool running delegate calls off the scheduler thread.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace crew_orchestrator {

/**
 * @brief Worker pool that can grow but never shrinks.
 *
 * grow_to() is for the owning thread only; it must not race with the
 * destructor or with another grow_to().
 *
 * Jobs still queued when the pool is destroyed are discarded; their futures
 * report std::future_errc::broken_promise. A job that is already running is
 * joined, so a job that never returns keeps the destructor waiting.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that observes a caller-owned stop token, so one job
    /// can be abandoned without stopping the pool.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(std::stop_token token,
                                                                            F&& func);

    /// Add workers until the pool has at least `num_threads`.
    void grow_to(size_t num_threads);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);
    void enqueue(std::function<void()> job);

    template <typename R, typename Body>
    static void fulfil(std::promise<R>& promise, Body& body);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <typename R, typename Body>
void ThreadPool::fulfil(std::promise<R>& promise, Body& body) {
    try {
        if constexpr (std::is_void_v<R>) {
            body();
            promise.set_value();
        } else {
            promise.set_value(body());
        }
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)]() mutable {
        fulfil(*p, f);
    });
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(
    std::stop_token token, F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func), token]() mutable {
        auto body = [&f, &token]() { return f(token); };
        fulfil(*p, body);
    });
    return future;
}

}  // namespace crew_orchestrator
