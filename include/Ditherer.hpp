#pragma once

#include "Types.hpp"

namespace pano {

/**
 * @brief Constants of the Floyd-Steinberg error diffusion.
 *
 * Values above `threshold` become `foreground_level` (white), others
 * `background_level` (black). The quantization error is pushed to the
 * four not-yet-visited neighbours with the weights below.
 */
struct DitherConfig {
    float threshold = 127.0f;
    float foreground_level = 255.0f;
    float background_level = 0.0f;

    float weight_right       = 7.0f / 16.0f;  ///< (r,   c+1)
    float weight_below_left  = 3.0f / 16.0f;  ///< (r+1, c-1)
    float weight_below       = 5.0f / 16.0f;  ///< (r+1, c)
    float weight_below_right = 1.0f / 16.0f;  ///< (r+1, c+1)
};

/**
 * @brief Reduces a grayscale image to a binary mask by error diffusion.
 *
 * Pixels are visited strictly in row-major order. Each pixel's output
 * depends on error accumulated from already-visited neighbours, so the
 * pass cannot be split across rows or columns.
 */
class Ditherer {
public:
    explicit Ditherer(const DitherConfig& cfg = DitherConfig());

    /**
     * @brief Dither a grayscale image.
     *
     * @param image  8-bit grayscale image, at least 2x2.
     * @return Mask of the same shape, true where the quantized value is white.
     *
     * @throws DegenerateImageError if height or width is below 2.
     * @throws ConversionError if the image has more than one channel.
     */
    DitherMask dither(const GrayImage& image) const;

    const DitherConfig& config() const { return cfg_; }

private:
    DitherConfig cfg_;
};

} // namespace pano
