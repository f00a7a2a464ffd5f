/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/fingerprint.hpp"
#include "meshq/logger.hpp"
#include <openssl/evp.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

namespace meshq {

namespace {
constexpr const char* kInputPrefix = "input-";
constexpr const char* kInputSuffix = ".stl";
constexpr std::size_t kChunkSize = 64 * 1024;

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtx = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpMdCtx newSha256() {
    EvpMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, std::size_t len) {
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Fingerprint finish(EVP_MD_CTX* ctx) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx, out, &outLen) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    static const char* hex = "0123456789abcdef";
    Fingerprint result;
    result.reserve(outLen * 2);
    for (unsigned int i = 0; i < outLen; ++i) {
        result.push_back(hex[out[i] >> 4]);
        result.push_back(hex[out[i] & 0x0f]);
    }
    return result;
}
}

Fingerprint fingerprint(const std::string& bytes) {
    auto ctx = newSha256();
    update(ctx.get(), bytes.data(), bytes.size());
    return finish(ctx.get());
}

std::optional<Fingerprint> fingerprint(std::istream& in) {
    try {
        auto ctx = newSha256();
        std::vector<char> buf(kChunkSize);
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            std::streamsize n = in.gcount();
            if (n > 0) {
                update(ctx.get(), buf.data(), static_cast<std::size_t>(n));
            }
        }
        if (in.bad() || !in.eof()) {
            LOG_WARN("Input stream failed before EOF");
            return std::nullopt;
        }
        return finish(ctx.get());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to fingerprint stream: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool isFingerprint(const std::string& value) noexcept {
    if (value.size() != 64) return false;
    for (char c : value) {
        bool digit = c >= '0' && c <= '9';
        bool lowerHex = c >= 'a' && c <= 'f';
        if (!digit && !lowerHex) return false;
    }
    return true;
}

std::string inputRefFor(const Fingerprint& fp) {
    return std::string("uploads/") + kInputPrefix + fp + kInputSuffix;
}

std::string outputRefFor(const Fingerprint& fp) {
    return "output-" + fp + ".png";
}

std::optional<Fingerprint> fingerprintFromInputRef(const std::string& inputRef) {
    std::string name = std::filesystem::path(inputRef).filename().string();
    const std::string prefix(kInputPrefix);
    const std::string suffix(kInputSuffix);
    if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

    Fingerprint fp = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (!isFingerprint(fp)) return std::nullopt;
    return fp;
}

}
