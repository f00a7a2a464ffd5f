/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace meshq {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide logger writing one line per message to stderr:
//   [2025-01-31 12:00:00.123] [INFO ] [IO-0] message
// The level comes from MESHQ_LOG_LEVEL until setLevel() is called.
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    // Case-insensitive "error", "warn"/"warning", "info", "debug", "trace".
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& name) noexcept;

private:
    static const char* levelToString(LogLevel level) noexcept;
};

// Name shown in the thread column; unnamed threads show their id.
void setThreadName(const std::string& name);

}

// The message expression is only evaluated when the level is enabled.
#define MESHQ_LOG(level, msg)                              \
    do {                                                   \
        if (::meshq::Logger::enabled(level)) {             \
            ::meshq::Logger::log(level, msg);              \
        }                                                  \
    } while (0)

#define LOG_ERROR(msg) MESHQ_LOG(::meshq::LogLevel::ERROR, msg)
#define LOG_WARN(msg)  MESHQ_LOG(::meshq::LogLevel::WARN, msg)
#define LOG_INFO(msg)  MESHQ_LOG(::meshq::LogLevel::INFO, msg)
#define LOG_DEBUG(msg) MESHQ_LOG(::meshq::LogLevel::DEBUG, msg)
#define LOG_TRACE(msg) MESHQ_LOG(::meshq::LogLevel::TRACE, msg)
