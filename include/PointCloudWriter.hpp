#pragma once

#include "Types.hpp"

#include <ostream>
#include <string>

namespace pano {

enum class CloudFormat {
    PLY,  ///< ASCII PLY 1.0 with float x y z vertex properties
    XYZ   ///< One "x y z" line per point, no header
};

/**
 * @brief Writes point clouds as ASCII PLY or plain XYZ text.
 *
 * Coordinates are written with 6 decimal places, space-separated, one
 * point per line, in the order of the cloud.
 */
class PointCloudWriter {
public:
    /**
     * @brief Pick the format from the destination extension.
     *
     * ".xyz" (any case) selects XYZ; anything else selects PLY.
     */
    static CloudFormat formatForPath(const std::string& path);

    static void writePLY(std::ostream& os, const PointCloud& points);
    static void writeXYZ(std::ostream& os, const PointCloud& points);

    /**
     * @brief Save to file in the format given by formatForPath().
     *
     * @throws ConversionError if the file cannot be opened or written.
     */
    static void save(const PointCloud& points, const std::string& filename);

    static void saveToPLY(const PointCloud& points, const std::string& filename);
    static void saveToXYZ(const PointCloud& points, const std::string& filename);
};

} // namespace pano
