/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Worker pool for request handling, async handler tasks and timers.
 *
 * @details
 * The `Scheduler` is the concurrency backbone of Conduit. The transport hands
 * each accepted connection to it, async handlers run their deferred work on
 * it, and the async manager arms per-request timeouts through its delayed
 * task queue.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace conduit::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool with immediate and delayed tasks.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `schedule()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until an
 *   immediate task is queued or the earliest delayed task becomes due.
 *
 * Delayed tasks that are still pending at destruction time are discarded;
 * immediate tasks are drained before the workers exit.
 */
class Scheduler {
  public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Initializes the pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. Zero is promoted to one.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the immediate queue, then joins every worker.
     *
     * @note This is a **blocking** operation.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution as soon as a worker is free.
     *
     * @code
     * scheduler.enqueue([]() { run_deferred_handler(); });
     * @endcode
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a task to run no earlier than `delay` from now.
     *
     * Used for async request timeouts; the task is expected to be idempotent
     * with respect to an already-completed request.
     */
    void schedule(std::chrono::milliseconds delay, std::function<void()> task);

    /// @brief Number of worker threads owned by the pool.
    size_t size() const;

  private:
    struct DelayedTask {
        Clock::time_point due;
        unsigned long long sequence;
        std::function<void()> task;
    };

    struct LaterFirst {
        bool operator()(const DelayedTask& a, const DelayedTask& b) const
        {
            if (a.due != b.due) {
                return a.due > b.due;
            }
            return a.sequence > b.sequence;
        }
    };

    void worker_loop();

    /// @brief The container of active worker threads managed by this pool.
    std::vector<std::thread> workers_;

    /// @brief FIFO queue of tasks ready to run.
    std::queue<std::function<void()>> tasks_;

    /// @brief Heap (via `LaterFirst`) of delayed tasks; the front is due first.
    std::vector<DelayedTask> delayed_;

    /// @brief Tie breaker for delayed tasks sharing a due time.
    unsigned long long sequence_;

    /// @brief Protects `tasks_`, `delayed_` and `sequence_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers for new work, due timers or shutdown.
    std::condition_variable condition_;

    /// @brief Lifecycle flag for the worker loops.
    std::atomic<bool> stop_;
};

} // namespace conduit::infra
