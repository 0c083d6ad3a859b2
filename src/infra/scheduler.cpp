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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool and its delayed task queue.
 */

#include "conduit/infra/scheduler.hpp"

#include "conduit/infra/logger.hpp"

#include <algorithm>
#include <exception>

namespace conduit::infra {

Scheduler::Scheduler(size_t threads) : sequence_(0), stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Worker event loop.
 *
 * A worker either runs the next immediate task, promotes the earliest due
 * delayed task, or sleeps until one of those becomes possible. Exit happens
 * only once the scheduler is stopping and the immediate queue is drained.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            while (true) {
                if (!tasks_.empty()) {
                    task = std::move(tasks_.front());
                    tasks_.pop();
                    break;
                }
                if (stop_) {
                    return;
                }
                if (!delayed_.empty()) {
                    auto due = delayed_.front().due;
                    if (due <= Clock::now()) {
                        std::pop_heap(delayed_.begin(), delayed_.end(), LaterFirst());
                        task = std::move(delayed_.back().task);
                        delayed_.pop_back();
                        break;
                    }
                    condition_.wait_until(lock, due);
                } else {
                    condition_.wait(lock);
                }
            }
        }

        if (task) {
            // A throwing task must not take the worker down with it.
            try {
                task();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::ERROR,
                            std::string("Scheduler: Task terminated with exception: ") +
                                e.what());
            }
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

void Scheduler::schedule(std::chrono::milliseconds delay, std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        delayed_.push_back(DelayedTask{Clock::now() + delay, sequence_++, std::move(task)});
        std::push_heap(delayed_.begin(), delayed_.end(), LaterFirst());
    }
    // Every sleeper may be waiting on a later deadline than the new one.
    condition_.notify_all();
}

size_t Scheduler::size() const
{
    return workers_.size();
}

} // namespace conduit::infra
