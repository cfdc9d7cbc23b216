// SphericalProjector.hpp
#pragma once

#include "Types.hpp"

#include <Eigen/Core>

namespace pano {

/**
 * @brief Configuration for projecting a dither mask onto a sphere.
 *
 * Example for a 100 mm sphere engraved upper half only, tilted 15 deg:
 *   radius        = 50.0;
 *   rotation.x    = 15.0;
 *   height.min    = 0.5;
 */
struct SphericalProjectionConfig {
    double radius = 50.0;      ///< Sphere radius (mm)
    bool invert = false;       ///< Select background (false) pixels instead of foreground

    RotationAngles rotation;   ///< Degrees, applied X then Y then Z
    RangeFilter height;        ///< 0 = bottom of sphere (y = -r), 1 = top (y = +r)
    RangeFilter brightness;    ///< Source intensity normalized to [0, 1]
};

class SphericalProjector {
public:
    explicit SphericalProjector(const SphericalProjectionConfig& cfg);

    /**
     * @brief Project selected mask pixels to points on the sphere.
     *
     * @param[in] mask      Dither mask, at least 2x2.
     * @param[in] original  Optional grayscale source of the mask, used for
     *                      brightness filtering. Must match the mask shape.
     * @return Surviving points in row-major scan order of the mask.
     *
     * Selection (with invert) happens first, then the brightness filter,
     * then angle mapping, rotation and finally the height filter.
     *
     * @throws DegenerateImageError if height or width is below 2.
     * @throws ConversionError if original does not match the mask shape.
     */
    PointCloud project(const DitherMask& mask, const GrayImage* original = nullptr) const;

    /**
     * @brief Point on a sphere of given radius for pixel (row, col).
     *
     * theta = row / (h - 1) * pi, phi = col / (w - 1) * 2 * pi,
     * x = r sin(theta) cos(phi), y = r cos(theta), z = r sin(theta) sin(phi).
     */
    static Eigen::Vector3d pixelToSphere(int row, int col, int height, int width, double radius);

    /**
     * @brief R = Rz * Ry * Rx from angles in degrees.
     */
    static Eigen::Matrix3d rotationMatrix(const RotationAngles& angles_deg);

    const SphericalProjectionConfig& config() const { return cfg_; }

private:
    SphericalProjectionConfig cfg_;
};

} // namespace pano
