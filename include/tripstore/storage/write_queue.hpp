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
 * @file write_queue.hpp
 * @brief Per-file ordering of asynchronous writes.
 *
 * @details
 * The queue keeps, for every path with a write in flight, the future of the
 * most recently submitted write. A new write for the same path chains after
 * it: it waits for the predecessor to finish (success or failure) and only
 * then runs. Writes to different paths never wait on each other.
 *
 * @code
 * WriteQueue queue(scheduler);
 * auto first = queue.submit(path, [&] { Engine::write_atomic(path, a); });
 * auto second = queue.submit(path, [&] { Engine::write_atomic(path, b); });
 * second.get(); // the file now holds `b`
 * @endcode
 */

#pragma once

#include "tripstore/infra/scheduler.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tripstore::storage {

/**
 * @class WriteQueue
 * @brief Path-keyed chain of pending writes run on a `Scheduler`.
 */
class WriteQueue {
  public:
    explicit WriteQueue(infra::Scheduler& scheduler);

    /// @brief Waits for every write still in flight.
    ~WriteQueue();

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    /**
     * @brief Queues @p write behind any pending write to @p path.
     *
     * @return std::shared_future<void> Ready when @p write has run; rethrows
     * whatever @p write threw.
     * @throws std::runtime_error if the scheduler is shutting down.
     */
    std::shared_future<void> submit(const std::string& path, std::function<void()> write);

    /// @brief Blocks until every write submitted so far has completed.
    void drain();

    /// @brief Number of paths with a write in flight.
    std::size_t in_flight();

  private:
    struct Tail {
        std::uint64_t ticket;
        std::shared_future<void> done;
    };

    infra::Scheduler& scheduler_;
    std::mutex mutex_;
    std::unordered_map<std::string, Tail> tails_;
    std::uint64_t next_ticket_ = 0;
};

} // namespace tripstore::storage
