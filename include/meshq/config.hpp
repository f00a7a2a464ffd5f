/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace meshq {

// Largest accepted render width or height.
constexpr int kMaxRenderSize = 16384;

struct Config {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8080;
    std::filesystem::path workspace = ".";
    std::filesystem::path webRoot = "templates";
    std::size_t queueCapacity = 100;
    std::size_t maxUploadBytes = 64ULL * 1024 * 1024;
    std::chrono::seconds pendingTtl{600};
    int ioThreads = 2;
    int renderWidth = 1024;
    int renderHeight = 1024;

    [[nodiscard]] std::filesystem::path uploadsDir() const { return workspace / "uploads"; }
    [[nodiscard]] std::filesystem::path outputDir() const { return workspace / "output"; }
    [[nodiscard]] std::filesystem::path cacheFile() const { return workspace / "file_hashes.json"; }

    // Defaults overridden by MESHQ_* environment variables. Values that are
    // not plain unsigned numbers, or are out of range, keep the default.
    [[nodiscard]] static Config fromEnv();
};

}
