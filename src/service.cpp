/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/service.hpp"
#include "meshq/fingerprint.hpp"
#include "meshq/logger.hpp"
#include "meshq/transformer.hpp"
#include "meshq/worker.hpp"
#include <openssl/rand.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <unistd.h>

namespace meshq {

const char* toString(ClaimResult result) noexcept {
    switch (result) {
        case ClaimResult::Queued:         return "queued";
        case ClaimResult::AlreadyClaimed: return "already claimed";
        case ClaimResult::UnknownJob:     return "unknown job";
        case ClaimResult::Closed:         return "queue closed";
        default: return "unknown";
    }
}

Service::Service(Config config, std::unique_ptr<Transformer> transformer)
    : config_(std::move(config)),
      transformer_(std::move(transformer)),
      cache_(config_.cacheFile()),
      queue_(config_.queueCapacity) {
    LOG_DEBUG("Service created - workspace: " + config_.workspace.string() +
              ", queue capacity: " + std::to_string(queue_.capacity()));
}

Service::~Service() {
    shutdown();
}

bool Service::init() {
    if (!createWorkspace()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    switch (cache_.load()) {
        case CacheLoadResult::Loaded:
        case CacheLoadResult::Missing:
            return true;
        case CacheLoadResult::Corrupt:
        default:
            LOG_ERROR("Refusing to start with a corrupt cache file: " + cache_.storePath().string());
            return false;
    }
}

bool Service::start() {
    if (running_.load()) {
        LOG_WARN("Service already running");
        return false;
    }
    if (!transformer_) {
        LOG_ERROR("No transformer configured");
        return false;
    }

    try {
        worker_ = std::make_unique<Worker>(queue_, cache_, registry_, *transformer_, config_.outputDir());
        if (!worker_->start([this](const Job& job, ProcessResult) { finished(job); })) {
            LOG_ERROR("Failed to start worker");
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start service: " + std::string(e.what()));
        return false;
    }

    running_.store(true);
    LOG_DEBUG("Service started");
    return true;
}

void Service::shutdown() noexcept {
    if (!running_.load()) {
        queue_.close();
        return;
    }

    LOG_INFO("Shutting down service...");
    running_.store(false);

    if (worker_) {
        worker_->stop();
    }
    queue_.close();
    worker_.reset();

    LOG_INFO("Service shutdown complete");
}

SubmitResult Service::submit(const std::string& content) {
    SubmitResult result;

    if (content.empty()) {
        LOG_DEBUG("Rejected empty submission");
        result.error = SubmissionError::EmptyContent;
        result.message = "Uploaded file is empty";
        return result;
    }
    if (content.size() > config_.maxUploadBytes) {
        LOG_DEBUG("Submission exceeds size limit: " + std::to_string(content.size()));
        result.error = SubmissionError::TooLarge;
        result.message = "File exceeds maximum size (" + std::to_string(config_.maxUploadBytes) + " bytes)";
        return result;
    }

    Fingerprint fp;
    try {
        fp = fingerprint(content);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to calculate file hash: " + std::string(e.what()));
        result.error = SubmissionError::IoError;
        result.message = "Failed to calculate file hash";
        return result;
    }

    if (auto cached = cache_.lookup(fp)) {
        if (outputExists(*cached)) {
            LOG_INFO("Cache hit for " + fp + " -> " + *cached);
            result.ok = true;
            result.status = SubmitStatus::Cached;
            result.outputRef = *cached;
            return result;
        }
        LOG_WARN("Cache entry for " + fp + " points at missing output " + *cached + ", rendering again");
    }

    if (!writeInput(fp, content)) {
        result.error = SubmissionError::IoError;
        result.message = "Failed to save file";
        return result;
    }

    expirePending();

    Job job{generateId(), inputRefFor(fp), outputRefFor(fp)};
    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        jobs_[job.id] = Tracked{job, JobPhase::Pending, std::chrono::steady_clock::now()};
    }

    LOG_INFO("Job created: " + job.id + " for " + fp);
    result.ok = true;
    result.status = SubmitStatus::Pending;
    result.outputRef = job.outputRef;
    result.job = std::move(job);
    return result;
}

ClaimResult Service::claim(const JobId& id) {
    Job job;
    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return ClaimResult::UnknownJob;
        }
        if (it->second.phase != JobPhase::Pending) {
            return ClaimResult::AlreadyClaimed;
        }
        it->second.phase = JobPhase::Queued;
        job = it->second.job;
    }

    if (!queue_.push(job)) {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        jobs_.erase(id);
        return ClaimResult::Closed;
    }

    LOG_DEBUG("Job claimed and queued: " + id + " (queue depth " + std::to_string(queue_.size()) + ")");
    return ClaimResult::Queued;
}

std::optional<JobPhase> Service::phase(const JobId& id) const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.phase;
}

std::size_t Service::expirePending() {
    auto cutoff = std::chrono::steady_clock::now() - config_.pendingTtl;
    std::size_t expired = 0;

    std::lock_guard<std::mutex> lock(jobsMutex_);
    for (auto it = jobs_.begin(); it != jobs_.end(); ) {
        if (it->second.phase == JobPhase::Pending && it->second.created < cutoff) {
            LOG_INFO("Pending job expired without a channel: " + it->first);
            it = jobs_.erase(it);
            ++expired;
        } else {
            ++it;
        }
    }
    return expired;
}

std::size_t Service::trackedJobs() const {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    return jobs_.size();
}

bool Service::createWorkspace() noexcept {
    try {
        std::filesystem::create_directories(config_.uploadsDir());
        std::filesystem::create_directories(config_.outputDir());
        LOG_DEBUG("Workspace ready: " + config_.workspace.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

bool Service::writeInput(const Fingerprint& fp, const std::string& content) const noexcept {
    try {
        auto finalPath = config_.workspace / inputRefFor(fp);
        if (std::filesystem::exists(finalPath)) {
            LOG_DEBUG("Input already stored: " + finalPath.string());
            return true;
        }

        // Write under a unique name, then publish with an atomic rename.
        auto writingPath = config_.uploadsDir() / (".writing-" + generateId());
        {
            std::ofstream file(writingPath, std::ios::binary);
            if (!file) {
                LOG_ERROR("Failed to open upload file: " + writingPath.string());
                return false;
            }
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();
            if (!file.good()) {
                LOG_ERROR("Failed to write upload file: " + writingPath.string());
                file.close();
                std::error_code ec;
                std::filesystem::remove(writingPath, ec);
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(writingPath, finalPath, ec);
        if (ec) {
            LOG_ERROR("Failed to publish upload " + finalPath.string() + ": " + ec.message());
            std::filesystem::remove(writingPath, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save upload: " + std::string(e.what()));
        return false;
    }
}

bool Service::outputExists(const std::string& outputRef) const noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(config_.outputDir() / outputRef, ec);
}

JobId Service::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    unsigned char nonce[6] = {};
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        LOG_WARN("RAND_bytes failed, job id falls back to time/pid/counter");
    }

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter << "_";
    for (unsigned char b : nonce) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

void Service::finished(const Job& job) noexcept {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    jobs_.erase(job.id);
}

}
