/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <unordered_map>

#include "meshq/notification.hpp"
#include "meshq/types.hpp"

namespace meshq {

// Job id -> notification channel. Holds weak references only; a channel
// that has been destroyed looks the same as one that was never registered.
class Registry final {
public:
    Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry&&) = delete;

    // Replaces any channel already bound to the id.
    void add(const JobId& id, const std::shared_ptr<NotificationSink>& sink);

    [[nodiscard]] std::shared_ptr<NotificationSink> lookup(const JobId& id) const;

    // Never null: falls back to a shared NullSink.
    [[nodiscard]] std::shared_ptr<NotificationSink> sinkFor(const JobId& id) const;

    bool remove(const JobId& id);

    // Removes the binding only while it still points at owner, so a channel
    // that was replaced cannot evict its replacement.
    bool remove(const JobId& id, const NotificationSink* owner);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<JobId, std::weak_ptr<NotificationSink>> channels_;
    std::shared_ptr<NotificationSink> nullSink_;
};

}
