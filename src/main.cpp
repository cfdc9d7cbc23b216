#include "Types.hpp"
#include "Converter.hpp"
#include "CloudSummary.hpp"
#include "ErrorHandler.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace {

void printUsage(const char* prog, const po::options_description& desc)
{
    std::cout << "Usage: " << prog << " <input> [options]\n"
              << "Convert panorama to dithered spherical point cloud for laser engraving.\n\n"
              << desc << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    pano::ConversionOptions opts;
    pano::SphericalProjectionConfig& proj = opts.projection;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Print help")
        ("output,o", po::value<std::string>(), "Output file path (.ply or .xyz). Defaults to input name with .ply extension")
        ("radius,r", po::value<double>(&proj.radius)->default_value(50.0), "Sphere radius in mm")
        ("max-size", po::value<int>(&opts.max_dimension)->default_value(2000), "Maximum image dimension. Larger = more points but slower")
        ("invert", po::bool_switch(&proj.invert), "Invert: dark areas get points instead of bright areas")
        ("rotate-x", po::value<double>(&proj.rotation.x)->default_value(0.0), "Rotation around X axis in degrees (applied before height filter)")
        ("rotate-y", po::value<double>(&proj.rotation.y)->default_value(0.0), "Rotation around Y axis in degrees (applied before height filter)")
        ("rotate-z", po::value<double>(&proj.rotation.z)->default_value(0.0), "Rotation around Z axis in degrees (applied before height filter)")
        ("height-min", po::value<double>(&proj.height.min)->default_value(0.0), "Minimum height as fraction (0=bottom, 1=top)")
        ("height-max", po::value<double>(&proj.height.max)->default_value(1.0), "Maximum height as fraction (0=bottom, 1=top)")
        ("brightness-min", po::value<double>(&proj.brightness.min)->default_value(0.0), "Minimum original brightness to include (0-1)")
        ("brightness-max", po::value<double>(&proj.brightness.max)->default_value(1.0), "Maximum original brightness to include (0-1)")
        ("preview", "Generate dithered image preview")
        ("preview-dither", po::value<std::string>(), "Custom path for dithered preview PNG");

    po::options_description hidden("Hidden");
    hidden.add_options()
        ("input", po::value<std::string>(&opts.input_path), "Input equirectangular panorama");

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

    if (opts.input_path.empty()) {
        std::cerr << "Error: missing input image\n\n";
        printUsage(argv[0], desc);
        return 1;
    }

    // Validate input
    if (!fs::exists(opts.input_path)) {
        std::cerr << "Error: Input file not found: " << opts.input_path << "\n";
        return 1;
    }

    // Determine output path
    if (vm.count("output")) {
        opts.output_path = vm["output"].as<std::string>();
    } else {
        opts.output_path = fs::path(opts.input_path).replace_extension(".ply").string();
    }

    // Handle preview
    if (vm.count("preview-dither")) {
        opts.preview_path = vm["preview-dither"].as<std::string>();
    } else if (vm.count("preview")) {
        const fs::path out(opts.output_path);
        opts.preview_path = (out.parent_path() / (out.stem().string() + "_dithered.png")).string();
    }

    std::cout << "Loading panorama: " << opts.input_path << "\n";
    std::cout << "Parameters: radius=" << proj.radius << "mm, max_size=" << opts.max_dimension << "px\n";
    if (proj.invert) {
        std::cout << "Mode: Inverted (dark areas -> points)\n";
    } else {
        std::cout << "Mode: Normal (bright areas -> points)\n";
    }

    if (!proj.rotation.isZero()) {
        std::cout << "Rotation: X=" << proj.rotation.x << "°, Y=" << proj.rotation.y
                  << "°, Z=" << proj.rotation.z << "°\n";
    }

    if (proj.height.isActive()) {
        std::cout << "Height range: " << pano::CloudSummary::formatPercent(proj.height.min)
                  << " - " << pano::CloudSummary::formatPercent(proj.height.max) << "\n";
    }

    if (proj.brightness.isActive()) {
        std::cout << "Brightness range: " << pano::CloudSummary::formatPercent(proj.brightness.min)
                  << " - " << pano::CloudSummary::formatPercent(proj.brightness.max) << "\n";
    }
    std::cout.flush();

    try {
        pano::PointCloud points = pano::convert(opts);

        pano::CloudSummary::print(pano::CloudSummary::compute(points));

        std::cout << "Generated " << pano::CloudSummary::formatCount(points.size()) << " points\n";
        std::cout << "Point cloud saved to: " << opts.output_path << "\n";
        if (opts.preview_path) {
            std::cout << "Dither preview saved to: " << *opts.preview_path << "\n";
        }
    } catch (const std::exception& e) {
        pano::printErrorWithContext(e, "conversion of " + opts.input_path);
        return 1;
    }

    return 0;
}
