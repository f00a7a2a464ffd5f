/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/config.hpp"
#include "meshq/logger.hpp"
#include <cstdlib>
#include <limits>
#include <string>

namespace meshq {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::string text(val);
    if (text.find_first_not_of("0123456789") != std::string::npos) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(text));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

int env_int(const char* name, int defv, int maxv) {
    std::size_t parsed = env_size(name, static_cast<std::size_t>(defv));
    if (parsed > static_cast<std::size_t>(maxv)) {
        LOG_WARN(std::string("Ignoring out-of-range ") + name + "=" + std::to_string(parsed));
        return defv;
    }
    return static_cast<int>(parsed);
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}
}

Config Config::fromEnv() {
    Config config;
    config.host = env_string("MESHQ_HOST", config.host);

    std::size_t port = env_size("MESHQ_PORT", config.port);
    if (port <= std::numeric_limits<std::uint16_t>::max()) {
        config.port = static_cast<std::uint16_t>(port);
    } else {
        LOG_WARN("Ignoring out-of-range MESHQ_PORT=" + std::to_string(port));
    }

    config.workspace = env_string("MESHQ_WORKSPACE", config.workspace.string());
    config.webRoot = env_string("MESHQ_WEB_ROOT", config.webRoot.string());
    config.queueCapacity = env_size("MESHQ_QUEUE_CAPACITY", config.queueCapacity);
    config.maxUploadBytes = env_size("MESHQ_MAX_UPLOAD", config.maxUploadBytes);
    config.pendingTtl = std::chrono::seconds(
        env_size("MESHQ_PENDING_TTL", static_cast<std::size_t>(config.pendingTtl.count())));
    config.ioThreads = env_int("MESHQ_IO_THREADS", config.ioThreads, 256);
    config.renderWidth = env_int("MESHQ_RENDER_WIDTH", config.renderWidth, kMaxRenderSize);
    config.renderHeight = env_int("MESHQ_RENDER_HEIGHT", config.renderHeight, kMaxRenderSize);
    return config;
}

}
