/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "meshq/types.hpp"

namespace meshq {

enum class NoticeKind : uint8_t {
    Processing,
    Complete,
    Failed
};

struct Notification {
    JobId job;
    NoticeKind kind = NoticeKind::Processing;
    std::string message;
    std::string outputRef;

    [[nodiscard]] bool isTerminal() const noexcept { return kind != NoticeKind::Processing; }
};

[[nodiscard]] const char* toString(NoticeKind kind) noexcept;

// Public URL under which a rendered output is served.
[[nodiscard]] std::string outputUrl(const std::string& outputRef);

// JSON text frame: {"job","status","message"[,"output","url"]}.
[[nodiscard]] std::string encodeNotification(const Notification& notice);

// Where the worker sends progress for one job. Delivery is best-effort:
// implementations drop what they cannot send.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const Notification& notice) noexcept = 0;
};

class NullSink final : public NotificationSink {
public:
    void notify(const Notification&) noexcept override {}
};

}
