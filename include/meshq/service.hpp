/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "meshq/cache.hpp"
#include "meshq/config.hpp"
#include "meshq/queue.hpp"
#include "meshq/registry.hpp"
#include "meshq/types.hpp"

namespace meshq {

class Transformer;
class Worker;

enum class SubmitStatus : uint8_t {
    Cached,
    Pending
};

enum class SubmissionError : uint8_t {
    None = 0,
    EmptyContent,
    TooLarge,
    IoError
};

struct SubmitResult {
    bool ok = false;
    SubmitStatus status = SubmitStatus::Pending;
    Job job;                 // set for Pending
    std::string outputRef;   // set for both
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

enum class ClaimResult : uint8_t {
    Queued,
    AlreadyClaimed,
    UnknownJob,
    Closed
};

[[nodiscard]] const char* toString(ClaimResult result) noexcept;

// Owns the dedup cache, the correlation registry, the work queue and the
// worker. Submission creates a pending job; claim() moves it into the queue
// once its notification channel has registered.
class Service final {
public:
    Service(Config config, std::unique_ptr<Transformer> transformer);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
    Service(Service&&) = delete;
    Service& operator=(Service&&) = delete;

    // Creates the workspace and loads the cache. False means the daemon
    // must not start (corrupt cache or unusable workspace).
    [[nodiscard]] bool init();
    [[nodiscard]] bool start();
    void shutdown() noexcept;

    [[nodiscard]] SubmitResult submit(const std::string& content);

    // Blocks while the work queue is full.
    [[nodiscard]] ClaimResult claim(const JobId& id);

    [[nodiscard]] std::optional<JobPhase> phase(const JobId& id) const;

    // Drops pending jobs older than the configured TTL.
    std::size_t expirePending();

    [[nodiscard]] DedupCache& cache() noexcept { return cache_; }
    [[nodiscard]] Registry& registry() noexcept { return registry_; }
    [[nodiscard]] WorkQueue& queue() noexcept { return queue_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t trackedJobs() const;

private:
    struct Tracked {
        Job job;
        JobPhase phase = JobPhase::Pending;
        std::chrono::steady_clock::time_point created;
    };

    [[nodiscard]] bool createWorkspace() noexcept;
    [[nodiscard]] bool writeInput(const Fingerprint& fp, const std::string& content) const noexcept;
    [[nodiscard]] bool outputExists(const std::string& outputRef) const noexcept;
    [[nodiscard]] static JobId generateId();
    void finished(const Job& job) noexcept;

    Config config_;
    std::unique_ptr<Transformer> transformer_;

    DedupCache cache_;
    Registry registry_;
    WorkQueue queue_;
    std::unique_ptr<Worker> worker_;

    mutable std::mutex jobsMutex_;
    std::unordered_map<JobId, Tracked> jobs_;

    std::atomic<bool> running_{false};
};

}
