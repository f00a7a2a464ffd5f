/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "meshq/types.hpp"

namespace meshq {

// Bounded FIFO between channel registration and the worker.
// push() blocks while the queue is full; pop() blocks while it is empty.
class WorkQueue final {
public:
    explicit WorkQueue(std::size_t capacity);
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;
    WorkQueue(WorkQueue&&) = delete;
    WorkQueue& operator=(WorkQueue&&) = delete;

    // Returns false only if the queue was closed before space became available.
    [[nodiscard]] bool push(Job job);

    // Returns nullopt once the queue is closed and drained.
    [[nodiscard]] std::optional<Job> pop();

    // Wakes every blocked caller. Jobs already queued can still be popped.
    void close() noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool isClosed() const noexcept;

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<Job> jobs_;
    bool closed_ = false;
};

}
