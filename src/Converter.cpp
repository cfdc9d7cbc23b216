#include "Converter.hpp"
#include "ErrorHandler.hpp"
#include "ImageIO.hpp"
#include "PointCloudWriter.hpp"

#include <iostream>
#include <stdexcept>

namespace pano {

Converter::Converter(const ConversionOptions& options)
    : options_(options)
{
    if (options_.input_path.empty()) {
        throw std::invalid_argument("Converter: input_path must not be empty");
    }
    if (options_.output_path.empty()) {
        throw std::invalid_argument("Converter: output_path must not be empty");
    }
}

PointCloud Converter::run() const
{
    // 1) Load as grayscale, shrinking to max_dimension
    GrayImage image = ImageIO::loadGrayscale(options_.input_path, options_.max_dimension);
    requireNonDegenerate(image.height, image.width, "Converter: input image");

    // 2) Floyd-Steinberg dithering
    Ditherer ditherer(options_.dither);
    DitherMask mask = ditherer.dither(image);
    std::cout << "[Converter] Dithered " << mask.width << "x" << mask.height << " image\n";

    // 3) Preview before projecting, so it survives later failures
    if (options_.preview_path) {
        ImageIO::saveDitherPreview(*options_.preview_path, mask);
        std::cout << "[Converter] Dither preview written to " << *options_.preview_path << "\n";
    }

    // 4) Project onto the sphere, resized image is the brightness source
    SphericalProjector projector(options_.projection);
    PointCloud points = projector.project(mask, &image);

    // 5) Save by extension
    PointCloudWriter::save(points, options_.output_path);
    std::cout << "[Converter] Wrote " << points.size() << " points to " << options_.output_path
              << (PointCloudWriter::formatForPath(options_.output_path) == CloudFormat::XYZ ? " (XYZ)" : " (PLY)")
              << "\n";

    return points;
}

PointCloud convert(const ConversionOptions& options)
{
    return Converter(options).run();
}

} // namespace pano
