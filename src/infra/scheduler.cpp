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
 * @brief Implementation of the FIFO worker pool.
 */

#include "tripstore/infra/scheduler.hpp"

#include "tripstore/infra/logger.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace tripstore::infra {

Scheduler::Scheduler(std::size_t threads) : stop_(false)
{
    if (threads < 2) {
        threads = 2;
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { work(); });
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
 * Exits only once a stop was requested AND the queue is empty, so writes that
 * were accepted before shutdown still reach the disk.
 */
void Scheduler::work()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (!task) {
            continue;
        }

        // A failing task must not take the worker down with it.
        try {
            task();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR,
                        std::string("Scheduler: Task terminated with exception: ") + e.what());
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("Scheduler: enqueue on a stopped pool");
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

std::size_t Scheduler::pending()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

} // namespace tripstore::infra
