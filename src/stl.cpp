/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/stl.hpp"
#include "meshq/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>

namespace meshq {

namespace {
constexpr std::size_t kHeaderSize = 80;
constexpr std::size_t kFacetSize = 50;

// STL stores little-endian IEEE floats.
float readFloat(const char* p) noexcept {
    std::uint32_t bits = static_cast<std::uint32_t>(static_cast<unsigned char>(p[0])) |
                         static_cast<std::uint32_t>(static_cast<unsigned char>(p[1])) << 8 |
                         static_cast<std::uint32_t>(static_cast<unsigned char>(p[2])) << 16 |
                         static_cast<std::uint32_t>(static_cast<unsigned char>(p[3])) << 24;
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::uint32_t readCount(const std::string& data) noexcept {
    const char* p = data.data() + kHeaderSize;
    return static_cast<std::uint32_t>(static_cast<unsigned char>(p[0])) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(p[1])) << 8 |
           static_cast<std::uint32_t>(static_cast<unsigned char>(p[2])) << 16 |
           static_cast<std::uint32_t>(static_cast<unsigned char>(p[3])) << 24;
}

bool looksBinary(const std::string& data) noexcept {
    if (data.size() < kHeaderSize + 4) {
        return false;
    }
    std::uint64_t facets = readCount(data);
    return data.size() == kHeaderSize + 4 + facets * kFacetSize;
}

bool finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

StlParseResult parseBinary(const std::string& data) {
    StlParseResult result;
    std::uint32_t facets = readCount(data);
    result.mesh.triangles.reserve(facets);

    const char* p = data.data() + kHeaderSize + 4;
    for (std::uint32_t i = 0; i < facets; ++i, p += kFacetSize) {
        Triangle tri;
        // Skip the stored normal; it is recomputed from the vertices.
        const char* vp = p + 12;
        for (auto& vertex : tri.v) {
            vertex = {readFloat(vp), readFloat(vp + 4), readFloat(vp + 8)};
            vp += 12;
        }
        if (!finite(tri.v[0]) || !finite(tri.v[1]) || !finite(tri.v[2])) {
            result.error = "Non-finite vertex in facet " + std::to_string(i);
            result.mesh.triangles.clear();
            return result;
        }
        result.mesh.triangles.push_back(tri);
    }
    result.ok = true;
    return result;
}

StlParseResult parseAscii(const std::string& data) {
    StlParseResult result;
    std::istringstream in(data);
    std::string token;

    in >> token;
    if (token != "solid") {
        result.error = "Not an STL file";
        return result;
    }

    Triangle tri;
    int corner = 0;
    while (in >> token) {
        if (token != "vertex") {
            continue;
        }
        Vec3 v;
        if (!(in >> v.x >> v.y >> v.z) || !finite(v)) {
            result.error = "Malformed vertex after " +
                           std::to_string(result.mesh.triangles.size()) + " facets";
            result.mesh.triangles.clear();
            return result;
        }
        tri.v[corner++] = v;
        if (corner == 3) {
            result.mesh.triangles.push_back(tri);
            corner = 0;
        }
    }

    if (corner != 0) {
        result.error = "Truncated facet";
        result.mesh.triangles.clear();
        return result;
    }
    result.ok = true;
    return result;
}
}

double Vec3::length() const noexcept {
    return std::sqrt(dot(*this));
}

Vec3 Vec3::normalized() const noexcept {
    double len = length();
    if (len == 0.0) {
        return *this;
    }
    return *this * (1.0 / len);
}

Vec3 Triangle::normal() const noexcept {
    return (v[1] - v[0]).cross(v[2] - v[0]).normalized();
}

StlParseResult parseStl(const std::string& data) {
    if (looksBinary(data)) {
        return parseBinary(data);
    }
    // Binary files may also start with "solid", so the size check comes first.
    return parseAscii(data);
}

StlParseResult readStl(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        StlParseResult result;
        result.error = "Cannot open " + path.string();
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        StlParseResult result;
        result.error = "Failed to read " + path.string();
        return result;
    }

    auto result = parseStl(buffer.str());
    if (result.ok) {
        LOG_DEBUG("Parsed " + std::to_string(result.mesh.triangles.size()) +
                  " triangles from " + path.string());
    }
    return result;
}

void fitToUnitCube(Mesh& mesh) noexcept {
    if (mesh.empty()) {
        return;
    }

    constexpr double inf = std::numeric_limits<double>::infinity();
    Vec3 lo{inf, inf, inf};
    Vec3 hi{-inf, -inf, -inf};
    for (const auto& tri : mesh.triangles) {
        for (const auto& v : tri.v) {
            lo = {std::min(lo.x, v.x), std::min(lo.y, v.y), std::min(lo.z, v.z)};
            hi = {std::max(hi.x, v.x), std::max(hi.y, v.y), std::max(hi.z, v.z)};
        }
    }

    Vec3 size = hi - lo;
    double extent = std::max({size.x, size.y, size.z});
    double scale = extent > 0.0 ? 2.0 / extent : 1.0;
    Vec3 center = (lo + hi) * 0.5;

    for (auto& tri : mesh.triangles) {
        for (auto& v : tri.v) {
            v = (v - center) * scale;
        }
    }
}

}
