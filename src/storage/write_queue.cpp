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
 * @file write_queue.cpp
 * @brief Implementation of the per-file write chain.
 *
 * @details
 * The predecessor lookup, the task hand-off to the scheduler and the table
 * update happen under one lock, so the FIFO scheduler always dequeues a write
 * after the write it waits for. A waiting task therefore never blocks a
 * worker that its predecessor would need.
 */

#include "tripstore/storage/write_queue.hpp"

#include <exception>
#include <memory>
#include <utility>
#include <vector>

namespace tripstore::storage {

WriteQueue::WriteQueue(infra::Scheduler& scheduler) : scheduler_(scheduler) {}

WriteQueue::~WriteQueue()
{
    drain();
}

std::shared_future<void> WriteQueue::submit(const std::string& path, std::function<void()> write)
{
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> done = promise->get_future().share();

    std::unique_lock<std::mutex> lock(mutex_);

    std::shared_future<void> previous;
    auto it = tails_.find(path);
    if (it != tails_.end()) {
        previous = it->second.done;
    }
    const std::uint64_t ticket = ++next_ticket_;

    scheduler_.enqueue([this, path, ticket, previous, promise, write = std::move(write)]() {
        // The predecessor's outcome belongs to its own caller.
        if (previous.valid()) {
            previous.wait();
        }

        std::exception_ptr failure;
        try {
            write();
        } catch (...) {
            failure = std::current_exception();
        }

        {
            std::unique_lock<std::mutex> table_lock(mutex_);
            auto tail = tails_.find(path);
            if (tail != tails_.end() && tail->second.ticket == ticket) {
                tails_.erase(tail);
            }
        }

        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    });

    tails_[path] = Tail{ticket, done};
    return done;
}

void WriteQueue::drain()
{
    std::vector<std::shared_future<void>> pending;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (const auto& entry : tails_) {
            pending.push_back(entry.second.done);
        }
    }
    for (auto& future : pending) {
        future.wait();
    }
}

std::size_t WriteQueue::in_flight()
{
    std::unique_lock<std::mutex> lock(mutex_);
    return tails_.size();
}

} // namespace tripstore::storage
