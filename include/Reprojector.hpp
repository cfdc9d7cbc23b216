// Reprojector.hpp
#pragma once

#include "Types.hpp"

#include <Eigen/Core>

namespace pano {

/**
 * @brief Configuration for leveling an equirectangular panorama.
 */
struct ReprojectorConfig {
    /// Below this magnitude (radians) every angle counts as zero and the
    /// input is returned unchanged, without interpolation.
    double identity_epsilon = 0.001;
};

/**
 * @brief Corrects pitch, roll and heading of an equirectangular image.
 *
 * Every output pixel is mapped to a unit direction (Y-up), rotated back
 * into the camera's tilted frame and sampled bilinearly from the input.
 * Longitude wraps around, latitude clamps at the poles.
 *
 * Each output pixel is a pure function of the input raster; no state is
 * shared between pixels.
 */
class Reprojector {
public:
    explicit Reprojector(const ReprojectorConfig& cfg = ReprojectorConfig());

    /**
     * @brief Level a panorama.
     *
     * @param[in] image        Input raster (any channel count), at least 2x2.
     * @param[in] orientation  Camera pitch/roll/heading in radians.
     * @return Raster of identical shape and element type. Interpolated
     *         samples are truncated back to T.
     *
     * @throws DegenerateImageError if height or width is below 2.
     */
    template <typename T>
    Raster<T> level(const Raster<T>& image, const Orientation& orientation) const;

    /**
     * @brief Direction in the source image seen by an output direction.
     *
     * Applies inverse heading (about Y, -heading), inverse pitch
     * (about Z, -pitch), then roll (about X, +roll) in that order.
     * Roll is not negated.
     */
    static Eigen::Vector3d sourceDirection(const Eigen::Vector3d& dir,
                                           const Orientation& orientation);

    /// @brief True if all three angles are within the identity epsilon.
    bool isIdentity(const Orientation& orientation) const;

private:
    ReprojectorConfig cfg_;
};

} // namespace pano
