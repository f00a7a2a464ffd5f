/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/render.hpp"
#include "meshq/logger.hpp"
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <system_error>
#include <utility>
#include <vector>

namespace meshq {

namespace {
constexpr double kPi = 3.14159265358979323846;

// Row-major 4x4.
struct Mat4 {
    std::array<double, 16> m{};

    Mat4 operator*(const Mat4& o) const noexcept {
        Mat4 r;
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                double sum = 0.0;
                for (int k = 0; k < 4; ++k) {
                    sum += m[i * 4 + k] * o.m[k * 4 + j];
                }
                r.m[i * 4 + j] = sum;
            }
        }
        return r;
    }
};

struct Vec4 {
    double x, y, z, w;
};

Vec4 apply(const Mat4& t, const Vec3& v) noexcept {
    const auto& m = t.m;
    return {m[0] * v.x + m[1] * v.y + m[2] * v.z + m[3],
            m[4] * v.x + m[5] * v.y + m[6] * v.z + m[7],
            m[8] * v.x + m[9] * v.y + m[10] * v.z + m[11],
            m[12] * v.x + m[13] * v.y + m[14] * v.z + m[15]};
}

Mat4 lookAt(const Vec3& eye, const Vec3& center, const Vec3& up) noexcept {
    Vec3 z = (eye - center).normalized();
    Vec3 x = up.cross(z).normalized();
    Vec3 y = z.cross(x);
    return Mat4{{x.x, x.y, x.z, -x.dot(eye),
                 y.x, y.y, y.z, -y.dot(eye),
                 z.x, z.y, z.z, -z.dot(eye),
                 0.0, 0.0, 0.0, 1.0}};
}

Mat4 perspective(double fovy, double aspect, double zNear, double zFar) noexcept {
    double top = zNear * std::tan(fovy * kPi / 360.0);
    double right = top * aspect;
    double depth = zFar - zNear;
    return Mat4{{zNear / right, 0.0, 0.0, 0.0,
                 0.0, zNear / top, 0.0, 0.0,
                 0.0, 0.0, -(zFar + zNear) / depth, -2.0 * zNear * zFar / depth,
                 0.0, 0.0, -1.0, 0.0}};
}

struct ScreenVertex {
    double x, y, z;   // pixels, pixels, depth in [0, 1]
    double invW;
    Vec3 world;
};

double edge(const ScreenVertex& a, const ScreenVertex& b, double px, double py) noexcept {
    return (b.x - a.x) * (py - a.y) - (b.y - a.y) * (px - a.x);
}

double shade(const RenderOptions& o, const Vec3& light, Vec3 normal, const Vec3& position) noexcept {
    Vec3 toCamera = (o.eye - position).normalized();
    // Two-sided: meshes with flipped winding still light up.
    if (normal.dot(toCamera) < 0.0) {
        normal = normal * -1.0;
    }

    double intensity = o.ambient;
    double diffuse = std::max(normal.dot(light), 0.0);
    intensity += o.diffuse * diffuse;
    if (diffuse > 0.0 && o.specularPower > 0.0) {
        Vec3 incident = light * -1.0;
        Vec3 reflected = incident - normal * (2.0 * normal.dot(incident));
        double specular = std::max(toCamera.dot(reflected), 0.0);
        if (specular > 0.0) {
            intensity += std::pow(specular, o.specularPower);
        }
    }
    return std::min(o.objectGray * intensity, 1.0);
}
}

cv::Mat renderMesh(const Mesh& mesh, const RenderOptions& options) {
    const int width = options.width;
    const int height = options.height;
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<double> depth(static_cast<std::size_t>(width) * height,
                              std::numeric_limits<double>::max());

    Mat4 transform = perspective(options.fovDegrees, static_cast<double>(width) / height,
                                 options.zNear, options.zFar) *
                     lookAt(options.eye, options.center, options.up);
    Vec3 light = options.light.normalized();

    for (const auto& tri : mesh.triangles) {
        Vec3 normal = tri.normal();
        if (normal.length() == 0.0) {
            continue;
        }

        std::array<ScreenVertex, 3> sv;
        bool visible = true;
        for (int i = 0; i < 3; ++i) {
            Vec4 clip = apply(transform, tri.v[i]);
            if (clip.w <= 0.0) {
                visible = false;
                break;
            }
            double invW = 1.0 / clip.w;
            sv[i] = {(clip.x * invW + 1.0) * 0.5 * width,
                     (1.0 - clip.y * invW) * 0.5 * height,
                     (clip.z * invW + 1.0) * 0.5,
                     invW,
                     tri.v[i]};
        }
        if (!visible) {
            continue;
        }

        double area = edge(sv[0], sv[1], sv[2].x, sv[2].y);
        if (area == 0.0) {
            continue;
        }

        int x0 = std::max(0, static_cast<int>(std::floor(std::min({sv[0].x, sv[1].x, sv[2].x}))));
        int x1 = std::min(width - 1, static_cast<int>(std::ceil(std::max({sv[0].x, sv[1].x, sv[2].x}))));
        int y0 = std::max(0, static_cast<int>(std::floor(std::min({sv[0].y, sv[1].y, sv[2].y}))));
        int y1 = std::min(height - 1, static_cast<int>(std::ceil(std::max({sv[0].y, sv[1].y, sv[2].y}))));

        for (int y = y0; y <= y1; ++y) {
            auto* row = image.ptr<cv::Vec3b>(y);
            for (int x = x0; x <= x1; ++x) {
                double px = x + 0.5;
                double py = y + 0.5;
                double b0 = edge(sv[1], sv[2], px, py) / area;
                double b1 = edge(sv[2], sv[0], px, py) / area;
                double b2 = edge(sv[0], sv[1], px, py) / area;
                if (b0 < 0.0 || b1 < 0.0 || b2 < 0.0) {
                    continue;
                }

                double z = b0 * sv[0].z + b1 * sv[1].z + b2 * sv[2].z;
                auto& stored = depth[static_cast<std::size_t>(y) * width + x];
                if (z < 0.0 || z > 1.0 || z >= stored) {
                    continue;
                }
                stored = z;

                // Perspective-correct world position for the specular term.
                double w0 = b0 * sv[0].invW;
                double w1 = b1 * sv[1].invW;
                double w2 = b2 * sv[2].invW;
                double sum = w0 + w1 + w2;
                Vec3 position = (sv[0].world * w0 + sv[1].world * w1 + sv[2].world * w2) * (1.0 / sum);

                auto value = static_cast<unsigned char>(
                    std::lround(shade(options, light, normal, position) * 255.0));
                row[x] = cv::Vec3b(value, value, value);
            }
        }
    }
    return image;
}

StlRenderer::StlRenderer(std::filesystem::path workspace, std::filesystem::path outputDir,
                         RenderOptions options)
    : workspace_(std::move(workspace)), outputDir_(std::move(outputDir)), options_(options) {
    LOG_DEBUG("STL renderer " + std::to_string(options_.width) + "x" + std::to_string(options_.height) +
              " writing to " + outputDir_.string());
}

TransformResult StlRenderer::transform(const Job& job) {
    TransformResult result;

    auto parsed = readStl(workspace_ / job.inputRef);
    if (!parsed.ok) {
        result.error = "Failed to read STL file: " + parsed.error;
        return result;
    }
    if (parsed.mesh.empty()) {
        result.error = "STL file contains no triangles";
        return result;
    }

    Mesh& mesh = parsed.mesh;
    fitToUnitCube(mesh);

    auto finalPath = outputDir_ / job.outputRef;
    auto tempPath = outputDir_ / (job.outputRef + ".tmp.png");
    try {
        cv::Mat image = renderMesh(mesh, options_);
        if (!cv::imwrite(tempPath.string(), image)) {
            result.error = "Failed to save PNG file: " + tempPath.string();
            return result;
        }
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);
        result.error = "Failed to render: " + std::string(e.what());
        return result;
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        result.error = "Failed to publish " + finalPath.string() + ": " + ec.message();
        std::filesystem::remove(tempPath, ec);
        return result;
    }

    LOG_DEBUG("Rendered " + std::to_string(mesh.triangles.size()) + " triangles to " + finalPath.string());
    result.ok = true;
    result.outputRef = job.outputRef;
    return result;
}

}
