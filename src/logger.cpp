/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/logger.hpp"
#include <atomic>
#include <cctype>
#include <cstdio>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace meshq {

namespace {
LogLevel envLevel() noexcept {
    const char* value = std::getenv("MESHQ_LOG_LEVEL");
    if (!value) {
        return LogLevel::INFO;
    }
    return Logger::parseLevel(value).value_or(LogLevel::INFO);
}

// Initialised from the environment on first use.
std::atomic<uint8_t>& levelSlot() noexcept {
    static std::atomic<uint8_t> slot{static_cast<uint8_t>(envLevel())};
    return slot;
}

std::mutex g_names_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;

// Serializes whole lines on stderr.
std::mutex g_write_mutex;

std::string threadLabel() {
    auto tid = std::this_thread::get_id();
    {
        std::lock_guard<std::mutex> lock(g_names_mutex);
        auto it = g_thread_names.find(tid);
        if (it != g_thread_names.end()) {
            return it->second;
        }
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}
}

void Logger::setLevel(LogLevel level) noexcept {
    levelSlot().store(static_cast<uint8_t>(level));
}

LogLevel Logger::level() noexcept {
    return static_cast<LogLevel>(levelSlot().load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= levelSlot().load(std::memory_order_relaxed);
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
             << " [" << levelToString(level) << "]"
             << " [" << threadLabel() << "] "
             << message << '\n';

        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::cerr << line.str() << std::flush;
    } catch (const std::exception&) {
        // Logging must not throw; the line is lost.
        std::fputs("meshq: failed to write log line\n", stderr);
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_names_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

}
