#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <Eigen/Core>

namespace pano {

/**
 * @brief Dense H x W raster with interleaved channels.
 *
 * Stores samples in row-major order ((r * width + c) * channels + ch).
 * Row index maps to polar angle theta in [0, pi] (0 = top), column index
 * maps to azimuth phi in [0, 2*pi) (0 = left).
 */
template <typename T>
struct Raster {
    /// @brief Flattened samples in row-major, channel-interleaved order.
    std::vector<T> data;

    /// @brief Image height (number of rows).
    int height = 0;

    /// @brief Image width (number of columns).
    int width = 0;

    /// @brief Samples per pixel (1 = grayscale).
    int channels = 1;

    Raster() = default;

    Raster(int h, int w, int c = 1, T fill = T())
        : data(static_cast<std::size_t>(h) * w * c, fill)
        , height(h), width(w), channels(c) {}

    T& at(int r, int c, int ch = 0) {
        return data[(static_cast<std::size_t>(r) * width + c) * channels + ch];
    }

    const T& at(int r, int c, int ch = 0) const {
        return data[(static_cast<std::size_t>(r) * width + c) * channels + ch];
    }

    bool empty() const { return data.empty(); }
};

/// @brief 8-bit grayscale intensity image (0 = black, 255 = white).
using GrayImage = Raster<std::uint8_t>;

/**
 * @brief Binary foreground/background mask produced by dithering.
 *
 * Same shape as the grayscale image it was produced from.
 * Non-zero = foreground (white after dithering).
 */
struct DitherMask {
    std::vector<std::uint8_t> data;
    int height = 0;
    int width = 0;

    DitherMask() = default;
    DitherMask(int h, int w)
        : data(static_cast<std::size_t>(h) * w, 0), height(h), width(w) {}

    bool at(int r, int c) const {
        return data[static_cast<std::size_t>(r) * width + c] != 0;
    }

    void set(int r, int c, bool value) {
        data[static_cast<std::size_t>(r) * width + c] = value ? 1 : 0;
    }
};

/**
 * @brief Camera orientation of a panorama, in radians.
 *
 * pitch:   positive = looking up
 * roll:    positive = clockwise tilt when looking forward
 * heading: rotation about the vertical axis
 */
struct Orientation {
    double pitch = 0.0;
    double roll = 0.0;
    double heading = 0.0;
};

/// @brief Rotation applied to projected points, in degrees per axis.
struct RotationAngles {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    bool isZero() const { return x == 0.0 && y == 0.0 && z == 0.0; }
};

/**
 * @brief Inclusive [min, max] range in normalized [0, 1] space.
 *
 * Used for sphere height (0 = bottom, 1 = top) and for source
 * brightness (0 = black, 1 = white).
 */
struct RangeFilter {
    double min = 0.0;
    double max = 1.0;

    /// @brief True when the range is narrower than [0, 1].
    bool isActive() const { return min > 0.0 || max < 1.0; }

    bool contains(double v) const { return v >= min && v <= max; }
};

/// @brief Points in scan order of the surviving mask pixels (row-major).
using PointCloud = std::vector<Eigen::Vector3d>;

}  // namespace pano
