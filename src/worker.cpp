/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/worker.hpp"
#include "meshq/cache.hpp"
#include "meshq/fingerprint.hpp"
#include "meshq/logger.hpp"
#include "meshq/notification.hpp"
#include "meshq/queue.hpp"
#include "meshq/registry.hpp"
#include "meshq/transformer.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace meshq {

namespace {
void emit(Registry& registry, const Job& job, NoticeKind kind,
          const std::string& message, const std::string& outputRef = "") {
    Notification notice{job.id, kind, message, outputRef};
    registry.sinkFor(job.id)->notify(notice);
}

std::string seconds(std::chrono::steady_clock::duration elapsed) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1)
       << std::chrono::duration<double>(elapsed).count() << "s";
    return ss.str();
}
}

Worker::Worker(WorkQueue& queue, DedupCache& cache, Registry& registry,
               Transformer& transformer, const std::filesystem::path& outputDir)
    : queue_(queue), cache_(cache), registry_(registry),
      transformer_(transformer), outputDir_(outputDir) {
}

Worker::~Worker() {
    stop();
}

bool Worker::start(JobFinished onFinished) {
    if (running_.load()) {
        LOG_WARN("Worker already running");
        return false;
    }

    onFinished_ = std::move(onFinished);
    shutdown_.store(false);
    running_.store(true);

    try {
        thread_ = std::thread(&Worker::loop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
    LOG_INFO("Worker started");
    return true;
}

void Worker::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping worker...");
    shutdown_.store(true);
    queue_.close();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
    LOG_INFO("Worker stopped after " + std::to_string(processed_.load()) + " job(s)");
}

void Worker::loop() {
    setThreadName("Worker");
    LOG_DEBUG("Worker thread started");

    while (auto job = queue_.pop()) {
        ProcessResult result;
        if (shutdown_.load()) {
            LOG_INFO("Dropping queued job on shutdown: " + job->id);
            emit(registry_, *job, NoticeKind::Failed, "Server is shutting down. Please upload again.");
            result = ProcessResult::Dropped;
        } else {
            result = process(*job);
            processed_.fetch_add(1);
        }

        if (onFinished_) {
            try {
                onFinished_(*job, result);
            } catch (const std::exception& e) {
                LOG_ERROR("Job completion hook failed for " + job->id + ": " + e.what());
            }
        }
    }

    LOG_DEBUG("Worker thread stopped");
}

ProcessResult Worker::process(const Job& job) noexcept {
    try {
        LOG_INFO("Processing job " + job.id + " (" + job.inputRef + ")");
        emit(registry_, job, NoticeKind::Processing, "Processing your file...");

        auto fp = fingerprintFromInputRef(job.inputRef);
        if (!fp) {
            LOG_ERROR("Job " + job.id + " has an unrecognised input reference: " + job.inputRef);
            emit(registry_, job, NoticeKind::Failed, "Failed to render file. Please try again.");
            return ProcessResult::Failed;
        }

        // Identical content may have been rendered while this job waited.
        if (auto cached = cache_.lookup(*fp)) {
            if (outputExists(*cached)) {
                LOG_INFO("Job " + job.id + " served from cache: " + *cached);
                emit(registry_, job, NoticeKind::Complete, "Rendering complete!", *cached);
                return ProcessResult::Cached;
            }
        }

        auto startTime = std::chrono::steady_clock::now();
        TransformResult result = transformer_.transform(job);
        auto elapsed = std::chrono::steady_clock::now() - startTime;

        if (!result.ok) {
            LOG_WARN("Job " + job.id + " failed after " + seconds(elapsed) + ": " + result.error);
            discardOutput(job.outputRef);
            emit(registry_, job, NoticeKind::Failed, "Failed to render file. Please try again.");
            return ProcessResult::Failed;
        }

        if (!outputExists(result.outputRef)) {
            LOG_ERROR("Job " + job.id + " reported success but " + result.outputRef + " is missing");
            emit(registry_, job, NoticeKind::Failed, "Failed to render file. Please try again.");
            return ProcessResult::Failed;
        }

        if (!cache_.record(*fp, result.outputRef)) {
            LOG_WARN("Job " + job.id + " completed but its cache entry was not persisted");
        }

        LOG_INFO("Completed job " + job.id + " in " + seconds(elapsed) + " -> " + result.outputRef);
        emit(registry_, job, NoticeKind::Complete, "Rendering complete!", result.outputRef);
        return ProcessResult::Rendered;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + job.id + ": " + std::string(e.what()));
        emit(registry_, job, NoticeKind::Failed, "Failed to render file. Please try again.");
        return ProcessResult::Failed;
    }
}

bool Worker::outputExists(const std::string& outputRef) const noexcept {
    if (outputRef.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(outputDir_ / outputRef, ec);
}

void Worker::discardOutput(const std::string& outputRef) const noexcept {
    if (outputRef.empty()) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::remove(outputDir_ / outputRef, ec)) {
        LOG_DEBUG("Removed partial output: " + outputRef);
    }
}

}
