// SphericalProjector.cpp
#include "SphericalProjector.hpp"
#include "ErrorHandler.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace pano {

namespace {

    double deg2rad(double deg) { return deg * M_PI / 180.0; }

} // anonymous namespace

SphericalProjector::SphericalProjector(const SphericalProjectionConfig& cfg)
    : cfg_(cfg)
{
    THROW_CONTEXT_AS_IF(!(cfg_.radius > 0.0), ConversionError,
                        "SphericalProjector: radius must be positive, got " + std::to_string(cfg_.radius));
}

Eigen::Vector3d SphericalProjector::pixelToSphere(int row, int col, int height, int width, double radius)
{
    const double theta = static_cast<double>(row) / (height - 1) * M_PI;
    const double phi   = static_cast<double>(col) / (width - 1) * 2.0 * M_PI;

    return Eigen::Vector3d(radius * std::sin(theta) * std::cos(phi),
                           radius * std::cos(theta),                    // Y is vertical
                           radius * std::sin(theta) * std::sin(phi));
}

Eigen::Matrix3d SphericalProjector::rotationMatrix(const RotationAngles& angles_deg)
{
    const double rx = deg2rad(angles_deg.x);
    const double ry = deg2rad(angles_deg.y);
    const double rz = deg2rad(angles_deg.z);

    const double cx = std::cos(rx), sx = std::sin(rx);
    const double cy = std::cos(ry), sy = std::sin(ry);
    const double cz = std::cos(rz), sz = std::sin(rz);

    Eigen::Matrix3d Rx;
    Rx << 1.0, 0.0, 0.0,
          0.0,  cx, -sx,
          0.0,  sx,  cx;

    Eigen::Matrix3d Ry;
    Ry <<  cy, 0.0,  sy,
          0.0, 1.0, 0.0,
          -sy, 0.0,  cy;

    Eigen::Matrix3d Rz;
    Rz <<  cz, -sz, 0.0,
           sz,  cz, 0.0,
          0.0, 0.0, 1.0;

    // First X, then Y, then Z
    return Rz * Ry * Rx;
}

PointCloud SphericalProjector::project(const DitherMask& mask, const GrayImage* original) const
{
    const int H = mask.height;
    const int W = mask.width;
    requireNonDegenerate(H, W, "SphericalProjector: mask");

    const bool filter_brightness = original != nullptr && cfg_.brightness.isActive();
    if (filter_brightness &&
        (original->height != H || original->width != W || original->channels != 1)) {
        THROW_CONTEXT_AS(ConversionError,
                         "SphericalProjector: brightness image does not match mask shape");
    }

    // 1) Select pixels in scan order
    std::vector<std::pair<int, int>> pixels;
    pixels.reserve(mask.data.size());
    for (int r = 0; r < H; ++r) {
        for (int c = 0; c < W; ++c) {
            if (mask.at(r, c) != cfg_.invert) {
                pixels.emplace_back(r, c);
            }
        }
    }

    // 2) Brightness filter on the original intensity
    if (filter_brightness) {
        std::vector<std::pair<int, int>> kept;
        kept.reserve(pixels.size());
        for (const auto& [r, c] : pixels) {
            const double brightness = original->at(r, c) / 255.0;
            if (cfg_.brightness.contains(brightness)) {
                kept.emplace_back(r, c);
            }
        }
        pixels = std::move(kept);
    }

    // 3) Map to the sphere
    PointCloud points;
    points.reserve(pixels.size());
    for (const auto& [r, c] : pixels) {
        points.push_back(pixelToSphere(r, c, H, W, cfg_.radius));
    }

    // 4) Rotate (before height filtering)
    if (!cfg_.rotation.isZero()) {
        const Eigen::Matrix3d R = rotationMatrix(cfg_.rotation);
        for (auto& p : points) {
            p = R * p;
        }
    }

    // 5) Height filter on rotated Y: 0 -> -radius, 1 -> +radius
    if (cfg_.height.isActive()) {
        const double y_min = -cfg_.radius + cfg_.height.min * 2.0 * cfg_.radius;
        const double y_max = -cfg_.radius + cfg_.height.max * 2.0 * cfg_.radius;

        PointCloud kept;
        kept.reserve(points.size());
        for (const auto& p : points) {
            if (p.y() >= y_min && p.y() <= y_max) {
                kept.push_back(p);
            }
        }
        points = std::move(kept);
    }

    return points;
}

} // namespace pano
