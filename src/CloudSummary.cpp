#include "CloudSummary.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

#include <pcl/common/common.h>      // pcl::getMinMax3D

namespace pano {

pcl::PointCloud<pcl::PointXYZ>::Ptr CloudSummary::toPclCloud(const PointCloud& points)
{
    auto cloud = std::make_shared<pcl::PointCloud<pcl::PointXYZ>>();
    cloud->reserve(points.size());

    for (const auto& p : points) {
        pcl::PointXYZ pt;
        pt.x = static_cast<float>(p.x());
        pt.y = static_cast<float>(p.y());
        pt.z = static_cast<float>(p.z());
        cloud->push_back(pt);
    }

    return cloud;
}

CloudSummary::Summary CloudSummary::compute(const PointCloud& points)
{
    Summary summary;
    summary.num_points = points.size();

    if (points.empty()) {
        return summary;
    }

    auto cloud = toPclCloud(points);

    pcl::PointXYZ min_pt;
    pcl::PointXYZ max_pt;
    pcl::getMinMax3D(*cloud, min_pt, max_pt);

    summary.min = Eigen::Vector3d(min_pt.x, min_pt.y, min_pt.z);
    summary.max = Eigen::Vector3d(max_pt.x, max_pt.y, max_pt.z);
    return summary;
}

void CloudSummary::print(const Summary& summary)
{
    std::cout << "\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Point Cloud Summary\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Points: " << formatCount(summary.num_points) << "\n";
    if (summary.num_points > 0) {
        const Eigen::Vector3d extent = summary.extent();
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "Bounds:\n";
        std::cout << "  X: [" << summary.min.x() << ", " << summary.max.x() << "]\n";
        std::cout << "  Y: [" << summary.min.y() << ", " << summary.max.y() << "]\n";
        std::cout << "  Z: [" << summary.min.z() << ", " << summary.max.z() << "]\n";
        std::cout << "Extent: " << extent.x() << " x " << extent.y() << " x " << extent.z() << "\n";
        std::cout << std::defaultfloat;
    }
    std::cout << "═══════════════════════════════════════════════════════════\n";
}

std::string CloudSummary::formatCount(std::size_t count)
{
    std::string digits = std::to_string(count);
    for (int pos = static_cast<int>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<std::size_t>(pos), ",");
    }
    return digits;
}

std::string CloudSummary::formatPercent(double fraction)
{
    // nearbyint honours the default round-to-nearest-even mode
    const double rounded = std::nearbyint(fraction * 100.0);
    return std::to_string(static_cast<long long>(rounded)) + "%";
}

} // namespace pano
