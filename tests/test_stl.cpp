/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>

#include "meshq/stl.hpp"
#include "test_util.hpp"

using namespace meshq;

namespace {
const char* kAsciiTriangle =
    "solid tri\n"
    "  facet normal 0 0 1\n"
    "    outer loop\n"
    "      vertex 0 0 0\n"
    "      vertex 2 0 0\n"
    "      vertex 0 4 0\n"
    "    endloop\n"
    "  endfacet\n"
    "endsolid tri\n";

void appendFloat(std::string& out, float value) {
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((bits >> (8 * i)) & 0xff));
    }
}

std::string binaryStl(const std::string& header, int facets) {
    std::string out = header;
    out.resize(80, '\0');
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((facets >> (8 * i)) & 0xff));
    }
    for (int f = 0; f < facets; ++f) {
        for (int i = 0; i < 3; ++i) appendFloat(out, 0.0f);   // normal
        appendFloat(out, 0.0f); appendFloat(out, 0.0f); appendFloat(out, static_cast<float>(f));
        appendFloat(out, 1.0f); appendFloat(out, 0.0f); appendFloat(out, static_cast<float>(f));
        appendFloat(out, 0.0f); appendFloat(out, 1.0f); appendFloat(out, static_cast<float>(f));
        out.push_back('\0');
        out.push_back('\0');
    }
    return out;
}
}

TEST(StlTest, ParsesAscii) {
    auto result = parseStl(kAsciiTriangle);
    ASSERT_TRUE(result.ok) << result.error;
    ASSERT_EQ(result.mesh.triangles.size(), 1u);

    const auto& tri = result.mesh.triangles[0];
    EXPECT_DOUBLE_EQ(tri.v[1].x, 2.0);
    EXPECT_DOUBLE_EQ(tri.v[2].y, 4.0);

    Vec3 n = tri.normal();
    EXPECT_NEAR(n.z, 1.0, 1e-12);
}

TEST(StlTest, ParsesBinary) {
    auto result = parseStl(binaryStl("binary", 3));
    ASSERT_TRUE(result.ok) << result.error;
    ASSERT_EQ(result.mesh.triangles.size(), 3u);
    EXPECT_DOUBLE_EQ(result.mesh.triangles[2].v[0].z, 2.0);
    EXPECT_DOUBLE_EQ(result.mesh.triangles[1].v[1].x, 1.0);
}

TEST(StlTest, BinaryHeaderMayStartWithSolid) {
    auto result = parseStl(binaryStl("solid exported by some CAD tool", 2));
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.mesh.triangles.size(), 2u);
}

TEST(StlTest, EmptyBinaryParsesToEmptyMesh) {
    auto result = parseStl(binaryStl("", 0));
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.mesh.empty());
}

TEST(StlTest, RejectsGarbage) {
    EXPECT_FALSE(parseStl("definitely not a mesh").ok);
    EXPECT_FALSE(parseStl("").ok);
}

TEST(StlTest, RejectsMalformedAscii) {
    auto badVertex = parseStl("solid x\nfacet normal 0 0 1\nouter loop\nvertex 0 zero 0\n");
    EXPECT_FALSE(badVertex.ok);

    auto truncated = parseStl("solid x\nfacet normal 0 0 1\nouter loop\nvertex 0 0 0\nvertex 1 0 0\n");
    EXPECT_FALSE(truncated.ok);
}

TEST(StlTest, FitToUnitCubeCentersAndScales) {
    auto result = parseStl(kAsciiTriangle);
    ASSERT_TRUE(result.ok);
    fitToUnitCube(result.mesh);

    double minY = 1e9, maxY = -1e9, minX = 1e9, maxX = -1e9;
    for (const auto& v : result.mesh.triangles[0].v) {
        minX = std::min(minX, v.x);
        maxX = std::max(maxX, v.x);
        minY = std::min(minY, v.y);
        maxY = std::max(maxY, v.y);
    }
    // Largest extent (y, 4 units) maps to [-1, 1]; x keeps the aspect ratio.
    EXPECT_DOUBLE_EQ(minY, -1.0);
    EXPECT_DOUBLE_EQ(maxY, 1.0);
    EXPECT_DOUBLE_EQ(minX, -0.5);
    EXPECT_DOUBLE_EQ(maxX, 0.5);
}

TEST(StlTest, ReadsFromDisk) {
    meshq::test::TempDir dir;
    meshq::test::writeFile(dir.path() / "tri.stl", kAsciiTriangle);

    auto result = readStl(dir.path() / "tri.stl");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.mesh.triangles.size(), 1u);

    EXPECT_FALSE(readStl(dir.path() / "missing.stl").ok);
}
