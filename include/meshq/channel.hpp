/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "meshq/notification.hpp"
#include "meshq/types.hpp"

namespace meshq {

class Service;

enum class ChannelState : uint8_t {
    Opened,
    Registered,
    Notified,
    Terminal,
    Closed
};

[[nodiscard]] const char* toString(ChannelState state) noexcept;

// The connection underneath a channel. sendText() may complete
// asynchronously; a false return means the frame was not accepted.
class ChannelTransport {
public:
    virtual ~ChannelTransport() = default;
    virtual bool sendText(const std::string& text) = 0;
    virtual void close() noexcept = 0;
};

// Per-connection notification protocol:
// Opened -> Registered -> Notified -> Terminal -> Closed.
// Must be owned by a shared_ptr; it registers itself with the registry.
class Channel final : public NotificationSink,
                      public std::enable_shared_from_this<Channel> {
public:
    Channel(Service& service, std::weak_ptr<ChannelTransport> transport);
    ~Channel() override;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Handles one inbound text frame. The first valid frame registers the
    // channel and claims the job, which may block on a full work queue.
    void onMessage(const std::string& text);

    // Transport is gone (client close, error, shutdown).
    void onClosed() noexcept;

    // Server-initiated close.
    void close() noexcept;

    void notify(const Notification& notice) noexcept override;

    [[nodiscard]] ChannelState state() const;
    [[nodiscard]] JobId jobId() const;

    // Accepts "<id>" or "<id>|<input>|<output>"; only the id is used.
    [[nodiscard]] static std::optional<JobId> parseJobId(const std::string& text);

private:
    void sendError(const std::string& message) noexcept;

    Service& service_;
    std::weak_ptr<ChannelTransport> transport_;

    mutable std::mutex mutex_;
    ChannelState state_ = ChannelState::Opened;
    JobId jobId_;
};

}
