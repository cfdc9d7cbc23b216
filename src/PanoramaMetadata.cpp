#include "PanoramaMetadata.hpp"
#include "ErrorHandler.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace pano {

namespace fs = std::filesystem;

double normalizeRoll(double roll)
{
    if (roll > M_PI) {
        return roll - 2.0 * M_PI;
    }
    return roll;
}

Orientation PanoramaMetadata::levelingOrientation(bool correct_heading) const
{
    Orientation o;
    o.pitch = pitch;
    o.roll = normalizeRoll(roll);
    o.heading = correct_heading ? heading : 0.0;
    return o;
}

std::string sidecarPathFor(const std::string& image_path)
{
    return fs::path(image_path).replace_extension(".json").string();
}

PanoramaMetadata loadMetadata(const std::string& path)
{
    if (!fs::exists(path)) {
        THROW_CONTEXT_AS(InputNotFoundError, "Metadata file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONTEXT_AS(ConversionError, "PanoramaMetadata: Cannot open file: " + path);
    }

    PanoramaMetadata meta;
    try {
        const nlohmann::json j = nlohmann::json::parse(file);

        if (!j.contains("pitch") || !j.contains("roll")) {
            THROW_CONTEXT_AS(ConversionError, "PanoramaMetadata: pitch and roll are required in " + path);
        }

        meta.id           = j.value("id", std::string());
        meta.date         = j.value("date", std::string());
        meta.lat          = j.value("lat", 0.0);
        meta.lon          = j.value("lon", 0.0);
        meta.pitch        = j.at("pitch").get<double>();
        meta.roll         = j.at("roll").get<double>();
        meta.heading      = j.value("heading", 0.0);
        meta.auto_leveled = j.value("auto_leveled", false);

        if (j.contains("elevation") && !j.at("elevation").is_null()) {
            meta.elevation = j.at("elevation").get<double>();
        }
    } catch (const nlohmann::json::exception& e) {
        THROW_CONTEXT_AS(ConversionError, "PanoramaMetadata: Invalid JSON in " + path + ": " + e.what());
    }

    return meta;
}

void saveMetadata(const std::string& path, const PanoramaMetadata& meta)
{
    nlohmann::json j;
    j["id"] = meta.id;
    j["date"] = meta.date;
    j["lat"] = meta.lat;
    j["lon"] = meta.lon;
    j["pitch"] = meta.pitch;
    j["roll"] = meta.roll;
    j["heading"] = meta.heading;
    if (meta.elevation) {
        j["elevation"] = *meta.elevation;
    } else {
        j["elevation"] = nullptr;
    }
    j["auto_leveled"] = meta.auto_leveled;

    std::ofstream file(path);
    if (!file.is_open()) {
        THROW_CONTEXT_AS(ConversionError, "PanoramaMetadata: Cannot open file for writing: " + path);
    }
    file << j.dump(2) << "\n";
    file.close();
    if (file.fail()) {
        THROW_CONTEXT_AS(ConversionError, "PanoramaMetadata: Failed writing file: " + path);
    }
}

} // namespace pano
