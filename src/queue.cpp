/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/queue.hpp"
#include "meshq/logger.hpp"
#include <utility>

namespace meshq {

WorkQueue::WorkQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
    LOG_DEBUG("Work queue created with capacity " + std::to_string(capacity_));
}

WorkQueue::~WorkQueue() {
    close();
}

bool WorkQueue::push(Job job) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!closed_ && jobs_.size() >= capacity_) {
        LOG_WARN("Work queue full (" + std::to_string(capacity_) + "), waiting to enqueue job: " + job.id);
    }

    notFull_.wait(lock, [this] {
        return jobs_.size() < capacity_ || closed_;
    });

    if (closed_) {
        LOG_DEBUG("Cannot enqueue job on closed queue: " + job.id);
        return false;
    }

    LOG_DEBUG("Job queued: " + job.id);
    jobs_.push_back(std::move(job));
    lock.unlock();
    notEmpty_.notify_one();
    return true;
}

std::optional<Job> WorkQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait(lock, [this] {
        return !jobs_.empty() || closed_;
    });

    if (jobs_.empty()) {
        return std::nullopt;
    }

    Job job = std::move(jobs_.front());
    jobs_.pop_front();
    lock.unlock();
    notFull_.notify_one();
    return job;
}

void WorkQueue::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
    LOG_DEBUG("Work queue closed");
}

std::size_t WorkQueue::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool WorkQueue::isClosed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}
