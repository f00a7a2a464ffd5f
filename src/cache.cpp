/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/cache.hpp"
#include "meshq/logger.hpp"
#include <json/json.h>
#include <fstream>

namespace meshq {

DedupCache::DedupCache(const std::filesystem::path& storePath)
    : storePath_(storePath) {
    LOG_DEBUG("Dedup cache store: " + storePath_.string());
}

CacheLoadResult DedupCache::load() {
    std::error_code ec;
    if (!std::filesystem::exists(storePath_, ec)) {
        LOG_INFO("No cache file at " + storePath_.string() + ", starting empty");
        std::lock_guard<std::mutex> lock(mapMutex_);
        entries_.clear();
        return CacheLoadResult::Missing;
    }

    std::ifstream file(storePath_, std::ios::binary);
    if (!file) {
        LOG_ERROR("Cannot open cache file: " + storePath_.string());
        return CacheLoadResult::Corrupt;
    }

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        LOG_ERROR("Cache file is not valid JSON: " + errors);
        return CacheLoadResult::Corrupt;
    }
    if (!root.isObject()) {
        LOG_ERROR("Cache file root is not an object: " + storePath_.string());
        return CacheLoadResult::Corrupt;
    }

    std::unordered_map<Fingerprint, std::string> loaded;
    for (const auto& key : root.getMemberNames()) {
        const Json::Value& value = root[key];
        if (!value.isString()) {
            LOG_ERROR("Cache entry for " + key + " is not a string");
            return CacheLoadResult::Corrupt;
        }
        loaded.emplace(key, value.asString());
    }

    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        entries_ = std::move(loaded);
    }
    LOG_INFO("Loaded " + std::to_string(size()) + " cache entries from " + storePath_.string());
    return CacheLoadResult::Loaded;
}

std::optional<std::string> DedupCache::lookup(const Fingerprint& fp) const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto it = entries_.find(fp);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DedupCache::record(const Fingerprint& fp, const std::string& outputRef) {
    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        entries_[fp] = outputRef;
    }

    if (!flush()) {
        LOG_ERROR("Cache entry " + fp + " kept in memory but not persisted");
        return false;
    }
    LOG_DEBUG("Cache recorded: " + fp + " -> " + outputRef);
    return true;
}

std::size_t DedupCache::size() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    return entries_.size();
}

bool DedupCache::flush() const noexcept {
    try {
        std::lock_guard<std::mutex> fileLock(fileMutex_);

        Json::Value root(Json::objectValue);
        {
            std::lock_guard<std::mutex> lock(mapMutex_);
            for (const auto& entry : entries_) {
                root[entry.first] = entry.second;
            }
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        std::string payload = Json::writeString(builder, root);

        if (storePath_.has_parent_path()) {
            std::filesystem::create_directories(storePath_.parent_path());
        }

        auto tempPath = storePath_;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                LOG_ERROR("Cannot open cache temp file: " + tempPath.string());
                return false;
            }
            file << payload;
            file.flush();
            if (!file.good()) {
                LOG_ERROR("Failed writing cache temp file: " + tempPath.string());
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, storePath_, ec);
        if (ec) {
            LOG_ERROR("Failed to replace cache file: " + ec.message());
            std::filesystem::remove(tempPath, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to flush cache: " + std::string(e.what()));
        return false;
    }
}

}
