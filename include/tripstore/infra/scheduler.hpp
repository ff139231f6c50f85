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
 * @brief Fixed-size worker pool used to run queued document writes.
 *
 * @details
 * The `Scheduler` is constructed once at startup and handed by reference to
 * the persistence layer. Tasks are dequeued strictly in FIFO order, which the
 * per-file write chain relies on: a write is always dequeued after the write
 * it waits for.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tripstore::infra {

/**
 * @class Scheduler
 * @brief A thread-safe FIFO worker pool.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Workers sleep on a condition variable until work arrives.
 * - **Shutdown:** The destructor drains the queue before joining.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero (undetectable hardware
     * concurrency) is raised to two.
     */
    explicit Scheduler(std::size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains pending tasks and joins every worker.
     * @note Blocking.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * Exceptions escaping @p task are caught by the worker and logged; callers
     * that need the outcome should report it through a promise.
     *
     * @param task The unit of work.
     * @throws std::runtime_error if the pool is already shutting down.
     */
    void enqueue(std::function<void()> task);

    /// @brief Number of worker threads in the pool.
    std::size_t size() const { return workers_.size(); }

    /// @brief Number of tasks waiting for a worker.
    std::size_t pending();

  private:
    /// @brief Worker event loop.
    void work();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace tripstore::infra
