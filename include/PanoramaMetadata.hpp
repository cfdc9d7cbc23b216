#pragma once

#include "Types.hpp"

#include <optional>
#include <string>

namespace pano {

/**
 * @brief Sidecar metadata stored next to an acquired panorama.
 *
 * Persisted as a JSON object with keys id, date, lat, lon, pitch, roll,
 * heading, elevation and auto_leveled. Angles are in radians.
 */
struct PanoramaMetadata {
    std::string id;
    std::string date;                  ///< Capture timestamp as text
    double lat = 0.0;
    double lon = 0.0;
    double pitch = 0.0;
    double roll = 0.0;
    double heading = 0.0;
    std::optional<double> elevation;   ///< null in JSON when unknown
    bool auto_leveled = false;         ///< Leveling has been applied to the image

    /**
     * @brief Orientation to undo when leveling.
     *
     * Roll is brought into [-pi, pi]. Heading is only included when
     * correct_heading is set; otherwise the original orientation is kept.
     */
    Orientation levelingOrientation(bool correct_heading = false) const;
};

/// @brief Roll in (pi, 2*pi] is mapped to roll - 2*pi.
double normalizeRoll(double roll);

/// @brief Image path with its extension replaced by ".json".
std::string sidecarPathFor(const std::string& image_path);

/**
 * @brief Read a sidecar file.
 *
 * @throws InputNotFoundError if the file does not exist.
 * @throws ConversionError on malformed JSON or missing pitch/roll.
 */
PanoramaMetadata loadMetadata(const std::string& path);

/**
 * @brief Write a sidecar file with 2-space indentation.
 *
 * @throws ConversionError if the file cannot be written.
 */
void saveMetadata(const std::string& path, const PanoramaMetadata& meta);

} // namespace pano
