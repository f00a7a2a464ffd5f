/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace meshq {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3 operator+(const Vec3& o) const noexcept { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const noexcept { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(double s) const noexcept { return {x * s, y * s, z * s}; }

    [[nodiscard]] double dot(const Vec3& o) const noexcept { return x * o.x + y * o.y + z * o.z; }
    [[nodiscard]] Vec3 cross(const Vec3& o) const noexcept {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }
    [[nodiscard]] double length() const noexcept;
    [[nodiscard]] Vec3 normalized() const noexcept;
};

struct Triangle {
    std::array<Vec3, 3> v;

    // Face normal from the winding; zero for degenerate triangles.
    [[nodiscard]] Vec3 normal() const noexcept;
};

struct Mesh {
    std::vector<Triangle> triangles;

    [[nodiscard]] bool empty() const noexcept { return triangles.empty(); }
};

struct StlParseResult {
    bool ok = false;
    Mesh mesh;
    std::string error;
};

// Binary STL when the size matches the 84-byte header plus 50 bytes per
// facet, ASCII ("solid ... facet ... vertex") otherwise.
[[nodiscard]] StlParseResult parseStl(const std::string& data);
[[nodiscard]] StlParseResult readStl(const std::filesystem::path& path);

// Centers the mesh and scales it uniformly so its largest extent spans
// [-1, 1].
void fitToUnitCube(Mesh& mesh) noexcept;

}
