/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/registry.hpp"
#include "meshq/logger.hpp"

namespace meshq {

Registry::Registry()
    : nullSink_(std::make_shared<NullSink>()) {
}

void Registry::add(const JobId& id, const std::shared_ptr<NotificationSink>& sink) {
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(id);
        if (it != channels_.end()) {
            replaced = !it->second.expired();
            it->second = sink;
        } else {
            channels_.emplace(id, sink);
        }
    }

    if (replaced) {
        LOG_INFO("Channel for job " + id + " replaced by a newer registration");
    } else {
        LOG_DEBUG("Channel registered for job " + id);
    }
}

std::shared_ptr<NotificationSink> Registry::lookup(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(id);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

std::shared_ptr<NotificationSink> Registry::sinkFor(const JobId& id) const {
    auto sink = lookup(id);
    if (!sink) {
        LOG_DEBUG("No channel registered for job " + id + ", notification dropped");
        return nullSink_;
    }
    return sink;
}

bool Registry::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.erase(id) > 0;
}

bool Registry::remove(const JobId& id, const NotificationSink* owner) {
    // Released after the lock: the last reference may destroy a channel,
    // and a closing channel unregisters itself.
    std::shared_ptr<NotificationSink> current;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(id);
    if (it == channels_.end()) {
        return false;
    }

    current = it->second.lock();
    if (current && current.get() != owner) {
        return false;
    }
    channels_.erase(it);
    return true;
}

std::size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

}
