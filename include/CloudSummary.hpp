#pragma once

#include "Types.hpp"

#include <cstddef>
#include <memory>
#include <string>

#include <pcl/point_cloud.h>
#include <pcl/point_types.h>

namespace pano {

/**
 * @brief Size and axis-aligned extent of a generated point cloud.
 */
class CloudSummary {
public:
    struct Summary {
        std::size_t num_points = 0;
        Eigen::Vector3d min = Eigen::Vector3d::Zero();  ///< Lower corner of the bounding box
        Eigen::Vector3d max = Eigen::Vector3d::Zero();  ///< Upper corner of the bounding box

        /// @brief max - min per axis (zero for an empty cloud)
        Eigen::Vector3d extent() const { return max - min; }
    };

    /**
     * @brief Copy points into a PCL cloud (single precision).
     */
    static pcl::PointCloud<pcl::PointXYZ>::Ptr toPclCloud(const PointCloud& points);

    /**
     * @brief Compute point count and bounds.
     *
     * An empty cloud yields num_points = 0 and zero bounds.
     */
    static Summary compute(const PointCloud& points);

    /**
     * @brief Print summary to stdout.
     */
    static void print(const Summary& summary);

    /// @brief Count with comma thousands separators, e.g. 1234567 -> "1,234,567"
    static std::string formatCount(std::size_t count);

    /**
     * @brief Fraction as a whole percentage, e.g. 0.25 -> "25%".
     *
     * Halves round to even (0.125 -> "12%").
     */
    static std::string formatPercent(double fraction);
};

} // namespace pano
