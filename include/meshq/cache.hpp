/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "meshq/types.hpp"

namespace meshq {

enum class CacheLoadResult : uint8_t {
    Loaded,
    Missing,
    Corrupt
};

// Persistent fingerprint -> output reference map. Every record() rewrites
// the whole file (temp file + rename) before returning.
class DedupCache final {
public:
    explicit DedupCache(const std::filesystem::path& storePath);

    DedupCache(const DedupCache&) = delete;
    DedupCache& operator=(const DedupCache&) = delete;
    DedupCache(DedupCache&&) = delete;
    DedupCache& operator=(DedupCache&&) = delete;

    // Replaces the in-memory map with the file contents. A missing file
    // leaves the cache empty.
    [[nodiscard]] CacheLoadResult load();

    [[nodiscard]] std::optional<std::string> lookup(const Fingerprint& fp) const;

    // Returns false if the flush failed. The in-memory entry is kept either way.
    [[nodiscard]] bool record(const Fingerprint& fp, const std::string& outputRef);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const std::filesystem::path& storePath() const noexcept { return storePath_; }

private:
    [[nodiscard]] bool flush() const noexcept;

    std::filesystem::path storePath_;

    mutable std::mutex mapMutex_;
    std::unordered_map<Fingerprint, std::string> entries_;

    // Serializes writers so the last flush always carries the newest map.
    mutable std::mutex fileMutex_;
};

}
