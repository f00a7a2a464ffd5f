/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <array>
#include <string>

#include <opencv2/imgcodecs.hpp>

#include "meshq/fingerprint.hpp"
#include "meshq/render.hpp"
#include "test_util.hpp"

using namespace meshq;

namespace {
Mesh cube(double h) {
    std::array<Vec3, 8> c = {{
        {-h, -h, -h}, {h, -h, -h}, {h, h, -h}, {-h, h, -h},
        {-h, -h, h},  {h, -h, h},  {h, h, h},  {-h, h, h},
    }};
    const int faces[12][3] = {
        {0, 2, 1}, {0, 3, 2},   // bottom
        {4, 5, 6}, {4, 6, 7},   // top
        {0, 1, 5}, {0, 5, 4},   // front
        {2, 3, 7}, {2, 7, 6},   // back
        {1, 2, 6}, {1, 6, 5},   // right
        {0, 4, 7}, {0, 7, 3},   // left
    };
    Mesh mesh;
    for (const auto& f : faces) {
        mesh.triangles.push_back(Triangle{{c[f[0]], c[f[1]], c[f[2]]}});
    }
    return mesh;
}

std::string asciiStl(const Mesh& mesh) {
    std::string out = "solid cube\n";
    for (const auto& tri : mesh.triangles) {
        out += "facet normal 0 0 0\nouter loop\n";
        for (const auto& v : tri.v) {
            out += "vertex " + std::to_string(v.x) + " " + std::to_string(v.y) + " " +
                   std::to_string(v.z) + "\n";
        }
        out += "endloop\nendfacet\n";
    }
    return out + "endsolid cube\n";
}

RenderOptions smallOptions() {
    RenderOptions options;
    options.width = 64;
    options.height = 64;
    return options;
}
}

TEST(RenderTest, DrawsShadedObjectOnWhite) {
    cv::Mat image = renderMesh(cube(0.5), smallOptions());

    ASSERT_EQ(image.rows, 64);
    ASSERT_EQ(image.cols, 64);
    ASSERT_EQ(image.type(), CV_8UC3);

    EXPECT_EQ(image.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 255, 255));
    EXPECT_EQ(image.at<cv::Vec3b>(63, 63), cv::Vec3b(255, 255, 255));

    cv::Vec3b center = image.at<cv::Vec3b>(32, 32);
    EXPECT_LT(center[0], 250);
    EXPECT_GT(center[0], 20);
    EXPECT_EQ(center[0], center[1]);
    EXPECT_EQ(center[1], center[2]);
}

TEST(RenderTest, EmptyMeshIsBlank) {
    cv::Mat image = renderMesh(Mesh{}, smallOptions());
    EXPECT_EQ(cv::countNonZero(image.reshape(1) != 255), 0);
}

class StlRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories(dir_.path() / "uploads");
        std::filesystem::create_directories(dir_.path() / "output");
    }

    Job stage(const std::string& content) {
        Fingerprint fp = fingerprint(content);
        Job job{"job-1", inputRefFor(fp), outputRefFor(fp)};
        meshq::test::writeFile(dir_.path() / job.inputRef, content);
        return job;
    }

    meshq::test::TempDir dir_;
};

TEST_F(StlRendererTest, WritesPng) {
    StlRenderer renderer(dir_.path(), dir_.path() / "output", smallOptions());
    Job job = stage(asciiStl(cube(3.0)));

    TransformResult result = renderer.transform(job);
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.outputRef, job.outputRef);

    auto path = dir_.path() / "output" / job.outputRef;
    cv::Mat image = cv::imread(path.string());
    ASSERT_FALSE(image.empty());
    EXPECT_EQ(image.cols, 64);
    EXPECT_EQ(image.rows, 64);
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp.png"));
}

TEST_F(StlRendererTest, ReportsUnreadableInput) {
    StlRenderer renderer(dir_.path(), dir_.path() / "output", smallOptions());
    Job job = stage("this is not an stl file");

    TransformResult result = renderer.transform(job);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "output" / job.outputRef));
}

TEST_F(StlRendererTest, ReportsEmptyMesh) {
    StlRenderer renderer(dir_.path(), dir_.path() / "output", smallOptions());
    Job job = stage("solid nothing\nendsolid nothing\n");

    TransformResult result = renderer.transform(job);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("no triangles"), std::string::npos);
}

TEST_F(StlRendererTest, ReportsMissingInput) {
    StlRenderer renderer(dir_.path(), dir_.path() / "output", smallOptions());
    Job job{"job-2", "uploads/input-" + std::string(64, 'a') + ".stl", "output-x.png"};

    EXPECT_FALSE(renderer.transform(job).ok);
}
