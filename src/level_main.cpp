#include "Types.hpp"
#include "ImageIO.hpp"
#include "PanoramaMetadata.hpp"
#include "Reprojector.hpp"
#include "ErrorHandler.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace {

void printUsage(const char* prog, const po::options_description& desc)
{
    std::cout << "Usage: " << prog << " <input> [options]\n"
              << "Level an equirectangular panorama using its sidecar metadata.\n\n"
              << desc << "\n";
}

double degrees(double rad) { return rad * 180.0 / M_PI; }

} // namespace

int main(int argc, char* argv[]) {
    std::string input_path;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Print help")
        ("output,o", po::value<std::string>(), "Leveled image path. Defaults to overwriting the input")
        ("metadata,m", po::value<std::string>(), "Sidecar JSON. Defaults to input name with .json extension")
        ("correct-heading", "Also undo the camera heading")
        ("force", "Level even if the sidecar says the image is already leveled");

    po::options_description hidden("Hidden");
    hidden.add_options()
        ("input", po::value<std::string>(&input_path), "Input equirectangular panorama");

    po::options_description all_options;
    all_options.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all_options).positional(positional).run(), vm);

        if (vm.count("help")) {
            printUsage(argv[0], desc);
            return 0;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0], desc);
        return 1;
    }

    if (input_path.empty()) {
        std::cerr << "Error: missing input image\n\n";
        printUsage(argv[0], desc);
        return 1;
    }

    if (!fs::exists(input_path)) {
        std::cerr << "Error: Input file not found: " << input_path << "\n";
        return 1;
    }

    const std::string output_path = vm.count("output") ? vm["output"].as<std::string>() : input_path;
    const std::string metadata_path = vm.count("metadata") ? vm["metadata"].as<std::string>()
                                                           : pano::sidecarPathFor(input_path);

    try {
        pano::PanoramaMetadata meta = pano::loadMetadata(metadata_path);

        if (meta.auto_leveled && !vm.count("force")) {
            std::cout << "[Level] " << input_path << " is already leveled, nothing to do (use --force to override)\n";
            return 0;
        }

        const pano::Orientation orientation = meta.levelingOrientation(vm.count("correct-heading") > 0);

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "[Level] Correcting pitch=" << degrees(orientation.pitch)
                  << "°, roll=" << degrees(orientation.roll)
                  << "°, heading=" << degrees(orientation.heading) << "°\n";
        std::cout << std::defaultfloat;

        pano::Raster<std::uint8_t> image = pano::ImageIO::loadImage(input_path);
        pano::Reprojector reprojector;
        pano::Raster<std::uint8_t> leveled = reprojector.level(image, orientation);

        pano::ImageIO::saveImage(output_path, leveled);
        std::cout << "[Level] Panorama saved: " << output_path
                  << " (" << leveled.width << "x" << leveled.height << ")\n";

        meta.auto_leveled = true;
        const std::string out_metadata = pano::sidecarPathFor(output_path);
        pano::saveMetadata(out_metadata, meta);
        std::cout << "[Level] Metadata saved: " << out_metadata << "\n";
    } catch (const std::exception& e) {
        pano::printErrorWithContext(e, "leveling of " + input_path);
        return 1;
    }

    return 0;
}
