/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <thread>

#include "meshq/types.hpp"

namespace meshq {

class WorkQueue;
class DedupCache;
class Registry;
class Transformer;

enum class ProcessResult : uint8_t {
    Rendered,
    Cached,
    Failed,
    Dropped
};

using JobFinished = std::function<void(const Job&, ProcessResult)>;

// The single consumer of the work queue. Jobs run one at a time in
// dequeue order.
class Worker final {
public:
    Worker(WorkQueue& queue, DedupCache& cache, Registry& registry,
           Transformer& transformer, const std::filesystem::path& outputDir);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    [[nodiscard]] bool start(JobFinished onFinished = {});

    // Finishes the current job, fails whatever is still queued with a
    // "failed" notification, and joins. Closes the queue.
    void stop() noexcept;

    // Runs one job on the calling thread.
    ProcessResult process(const Job& job) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::uint64_t processedCount() const noexcept { return processed_.load(); }

private:
    void loop();
    [[nodiscard]] bool outputExists(const std::string& outputRef) const noexcept;
    void discardOutput(const std::string& outputRef) const noexcept;

    WorkQueue& queue_;
    DedupCache& cache_;
    Registry& registry_;
    Transformer& transformer_;
    std::filesystem::path outputDir_;
    JobFinished onFinished_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::uint64_t> processed_{0};
    std::thread thread_;
};

}
