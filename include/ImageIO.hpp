#pragma once

#include "Types.hpp"

#include <string>

namespace pano {

/**
 * @brief Image decode/encode and resampling on top of OpenCV.
 *
 * The rest of the code base only sees Raster / DitherMask; cv::Mat stays
 * inside this module. Colour images keep OpenCV's channel order (BGR).
 */
class ImageIO {
public:
    /**
     * @brief Load an image as 8-bit grayscale, shrinking it if needed.
     *
     * If either dimension exceeds max_dimension the image is resized to
     * (int(w * ratio), int(h * ratio)) with ratio = max_dimension / max(w, h),
     * using Lanczos interpolation.
     *
     * @throws InputNotFoundError if the file does not exist.
     * @throws ConversionError if the file cannot be decoded or max_dimension <= 0.
     */
    static GrayImage loadGrayscale(const std::string& path, int max_dimension);

    /**
     * @brief Load an 8-bit image with its channel count unchanged.
     *
     * @throws InputNotFoundError if the file does not exist.
     * @throws ConversionError if it cannot be decoded or is not 8-bit.
     */
    static Raster<std::uint8_t> loadImage(const std::string& path);

    /**
     * @brief Resample to an explicit size with Lanczos interpolation.
     */
    static Raster<std::uint8_t> resample(const Raster<std::uint8_t>& image, int new_width, int new_height);

    /**
     * @brief Shrink so that neither dimension exceeds max_dimension.
     *
     * Aspect ratio is preserved; images already small enough are returned as-is.
     */
    static Raster<std::uint8_t> resampleToMax(const Raster<std::uint8_t>& image, int max_dimension);

    /**
     * @brief Encode an 8-bit raster. JPEG output uses quality 95.
     *
     * @throws ConversionError if encoding or writing fails.
     */
    static void saveImage(const std::string& path, const Raster<std::uint8_t>& image);

    /**
     * @brief Write a dither mask as 8-bit grayscale (true -> 255, false -> 0).
     */
    static void saveDitherPreview(const std::string& path, const DitherMask& mask);
};

} // namespace pano
