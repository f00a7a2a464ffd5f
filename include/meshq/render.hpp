/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>

#include <opencv2/core.hpp>

#include "meshq/stl.hpp"
#include "meshq/transformer.hpp"

namespace meshq {

struct RenderOptions {
    int width = 1024;
    int height = 1024;
    double fovDegrees = 30.0;
    Vec3 eye{3.0, 3.0, 3.0};
    Vec3 center{0.0, 0.0, 0.0};
    Vec3 up{0.0, 0.0, 1.0};
    double zNear = 1.0;
    double zFar = 10.0;
    double objectGray = 0.75;
    double ambient = 0.2;
    double diffuse = 0.8;
    Vec3 light{1.0, 1.0, 1.0};
    double specularPower = 100.0;
};

// Z-buffered Phong rendering of a mesh onto a white 8-bit BGR image.
[[nodiscard]] cv::Mat renderMesh(const Mesh& mesh, const RenderOptions& options);

// Reads <workspace>/<inputRef> as STL and writes <outputDir>/<outputRef>
// as PNG.
class StlRenderer final : public Transformer {
public:
    StlRenderer(std::filesystem::path workspace, std::filesystem::path outputDir,
                RenderOptions options = {});

    [[nodiscard]] TransformResult transform(const Job& job) override;

    [[nodiscard]] const RenderOptions& options() const noexcept { return options_; }

private:
    std::filesystem::path workspace_;
    std::filesystem::path outputDir_;
    RenderOptions options_;
};

}
