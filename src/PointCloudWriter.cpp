#include "PointCloudWriter.hpp"
#include "ErrorHandler.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <ios>

namespace pano {

namespace {

    void writeCoordinates(std::ostream& os, const PointCloud& points)
    {
        const std::ios::fmtflags flags = os.flags();
        const std::streamsize precision = os.precision();

        os << std::fixed << std::setprecision(6);
        for (const auto& p : points) {
            os << p.x() << " " << p.y() << " " << p.z() << "\n";
        }

        os.flags(flags);
        os.precision(precision);
    }

    template <typename Writer>
    void writeFile(const std::string& filename, const PointCloud& points, Writer writer)
    {
        std::ofstream file(filename);
        if (!file.is_open()) {
            THROW_CONTEXT_AS(ConversionError, "PointCloudWriter: Cannot open file for writing: " + filename);
        }

        writer(file, points);

        file.close();
        if (file.fail()) {
            THROW_CONTEXT_AS(ConversionError, "PointCloudWriter: Failed writing file: " + filename);
        }
    }

} // anonymous namespace

CloudFormat PointCloudWriter::formatForPath(const std::string& path)
{
    const std::string ext = ".xyz";
    if (path.size() < ext.size()) {
        return CloudFormat::PLY;
    }

    std::string tail = path.substr(path.size() - ext.size());
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    return tail == ext ? CloudFormat::XYZ : CloudFormat::PLY;
}

void PointCloudWriter::writePLY(std::ostream& os, const PointCloud& points)
{
    // Write PLY header
    os << "ply\n";
    os << "format ascii 1.0\n";
    os << "element vertex " << points.size() << "\n";
    os << "property float x\n";
    os << "property float y\n";
    os << "property float z\n";
    os << "end_header\n";

    writeCoordinates(os, points);
}

void PointCloudWriter::writeXYZ(std::ostream& os, const PointCloud& points)
{
    writeCoordinates(os, points);
}

void PointCloudWriter::saveToPLY(const PointCloud& points, const std::string& filename)
{
    writeFile(filename, points, &PointCloudWriter::writePLY);
}

void PointCloudWriter::saveToXYZ(const PointCloud& points, const std::string& filename)
{
    writeFile(filename, points, &PointCloudWriter::writeXYZ);
}

void PointCloudWriter::save(const PointCloud& points, const std::string& filename)
{
    if (formatForPath(filename) == CloudFormat::XYZ) {
        saveToXYZ(points, filename);
    } else {
        saveToPLY(points, filename);
    }
}

} // namespace pano
