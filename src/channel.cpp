/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/channel.hpp"
#include "meshq/logger.hpp"
#include "meshq/service.hpp"
#include <json/json.h>

namespace meshq {

namespace {
constexpr std::size_t kMaxJobIdLength = 128;

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool isIdChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
}
}

const char* toString(ChannelState state) noexcept {
    switch (state) {
        case ChannelState::Opened:     return "opened";
        case ChannelState::Registered: return "registered";
        case ChannelState::Notified:   return "notified";
        case ChannelState::Terminal:   return "terminal";
        case ChannelState::Closed:     return "closed";
        default: return "unknown";
    }
}

Channel::Channel(Service& service, std::weak_ptr<ChannelTransport> transport)
    : service_(service), transport_(std::move(transport)) {
    LOG_DEBUG("Notification channel opened");
}

Channel::~Channel() {
    onClosed();
}

std::optional<JobId> Channel::parseJobId(const std::string& text) {
    std::string id = trim(text.substr(0, text.find('|')));
    if (id.empty() || id.size() > kMaxJobIdLength) {
        return std::nullopt;
    }
    for (char c : id) {
        if (!isIdChar(c)) {
            return std::nullopt;
        }
    }
    return id;
}

void Channel::onMessage(const std::string& text) {
    JobId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Closed) {
            return;
        }
        if (state_ != ChannelState::Opened) {
            LOG_DEBUG("Ignoring message on " + std::string(toString(state_)) + " channel for job " + jobId_);
            return;
        }

        auto parsed = parseJobId(text);
        if (!parsed) {
            LOG_WARN("Received invalid job details format: " + text.substr(0, 200));
            sendError("Invalid job id");
            return;
        }
        if (!service_.phase(*parsed)) {
            LOG_WARN("Channel asked for unknown job: " + *parsed);
            sendError("Unknown or expired job id");
            return;
        }

        id = *parsed;
        jobId_ = id;
        state_ = ChannelState::Registered;
    }

    // Bind before enqueueing so the worker can find this channel.
    service_.registry().add(id, shared_from_this());
    LOG_INFO("WebSocket connection established for job ID: " + id);

    bool bound = true;
    ClaimResult claimed = service_.claim(id);
    switch (claimed) {
        case ClaimResult::Queued:
            break;
        case ClaimResult::AlreadyClaimed:
            LOG_INFO("Job " + id + " already queued, channel attached for remaining updates");
            break;
        case ClaimResult::UnknownJob:
            LOG_WARN("Job " + id + " expired before it could be queued");
            bound = false;
            break;
        case ClaimResult::Closed:
        default:
            LOG_WARN("Job " + id + " not queued: " + toString(claimed));
            bound = false;
            break;
    }

    if (!bound) {
        // Nothing will notify this id; drop the binding and accept another one.
        service_.registry().remove(id, this);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == ChannelState::Registered && jobId_ == id) {
                state_ = ChannelState::Opened;
                jobId_.clear();
            }
        }
        sendError(claimed == ClaimResult::UnknownJob ? "Unknown or expired job id"
                                                     : "Server is shutting down");
        return;
    }

    // A close that raced the registration above must not leave a binding.
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed = state_ == ChannelState::Closed;
    }
    if (closed) {
        service_.registry().remove(id, this);
    }
}

void Channel::notify(const Notification& notice) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (state_) {
                case ChannelState::Registered:
                case ChannelState::Notified:
                    state_ = notice.isTerminal() ? ChannelState::Terminal : ChannelState::Notified;
                    break;
                case ChannelState::Opened:
                case ChannelState::Terminal:
                case ChannelState::Closed:
                default:
                    LOG_DEBUG("Dropping " + std::string(toString(notice.kind)) + " for job " + notice.job +
                              " on " + toString(state_) + " channel");
                    return;
            }
        }

        auto transport = transport_.lock();
        if (!transport || !transport->sendText(encodeNotification(notice))) {
            LOG_WARN("Failed to send message to job ID " + notice.job);
            close();
            return;
        }
        LOG_DEBUG("Sent " + std::string(toString(notice.kind)) + " to job ID " + notice.job);
    } catch (const std::exception& e) {
        LOG_ERROR("Notification for job " + notice.job + " failed: " + e.what());
    }
}

void Channel::onClosed() noexcept {
    JobId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Closed) {
            return;
        }
        state_ = ChannelState::Closed;
        id = jobId_;
    }

    if (!id.empty()) {
        service_.registry().remove(id, this);
        LOG_INFO("WebSocket connection closed for job ID: " + id);
    } else {
        LOG_DEBUG("Unregistered notification channel closed");
    }
}

void Channel::close() noexcept {
    if (auto transport = transport_.lock()) {
        transport->close();
    }
    onClosed();
}

ChannelState Channel::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

JobId Channel::jobId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobId_;
}

void Channel::sendError(const std::string& message) noexcept {
    try {
        auto transport = transport_.lock();
        if (!transport) {
            return;
        }
        Json::Value root(Json::objectValue);
        root["status"] = "error";
        root["message"] = message;
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        transport->sendText(Json::writeString(builder, root));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to send error frame: " + std::string(e.what()));
    }
}

}
