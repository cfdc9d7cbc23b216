#pragma once

#include "Types.hpp"
#include "Ditherer.hpp"
#include "SphericalProjector.hpp"

#include <optional>
#include <string>

namespace pano {

/**
 * @brief Parameters of one panorama to point cloud conversion.
 */
struct ConversionOptions {
    std::string input_path;
    std::string output_path;             ///< .xyz (any case) writes XYZ, anything else PLY

    int max_dimension = 2000;            ///< Longest image side after resampling (pixels)

    SphericalProjectionConfig projection;
    DitherConfig dither;

    /// Where to write the dither mask preview, if at all
    std::optional<std::string> preview_path;
};

/**
 * @brief Full pipeline: load, dither, optional preview, project, save.
 *
 * Stages run in sequence; the first failure aborts the rest. Artifacts
 * written before the failure (e.g. the preview) are left in place.
 */
class Converter {
public:
    explicit Converter(const ConversionOptions& options);

    /**
     * @brief Run the conversion.
     *
     * @return The generated point cloud, as written to output_path.
     *
     * @throws InputNotFoundError if the input image does not exist.
     * @throws DegenerateImageError if the (resampled) image is smaller than 2x2.
     * @throws ConversionError on any other stage failure.
     */
    PointCloud run() const;

    const ConversionOptions& options() const { return options_; }

private:
    ConversionOptions options_;
};

/**
 * @brief Convenience wrapper around Converter::run().
 */
PointCloud convert(const ConversionOptions& options);

} // namespace pano
