#include "Ditherer.hpp"
#include "ErrorHandler.hpp"

#include <stdexcept>
#include <vector>

namespace pano {

Ditherer::Ditherer(const DitherConfig& cfg)
    : cfg_(cfg)
{
    if (cfg_.foreground_level <= cfg_.threshold || cfg_.background_level > cfg_.threshold) {
        throw std::invalid_argument("Ditherer: threshold must lie between background and foreground levels");
    }
}

DitherMask Ditherer::dither(const GrayImage& image) const
{
    requireNonDegenerate(image.height, image.width, "Ditherer: input image");
    THROW_CONTEXT_AS_IF(image.channels != 1, ConversionError,
                        "Ditherer: expected a single-channel image, got " +
                        std::to_string(image.channels) + " channels");

    const int H = image.height;
    const int W = image.width;

    // Float working buffer: error accumulates across many pixels and
    // must not be truncated to 8 bits in between.
    std::vector<float> buf(image.data.begin(), image.data.end());
    auto px = [&buf, W](int r, int c) -> float& {
        return buf[static_cast<std::size_t>(r) * W + c];
    };

    DitherMask mask(H, W);

    for (int r = 0; r < H; ++r) {
        for (int c = 0; c < W; ++c) {
            const float old_value = px(r, c);
            const bool white = old_value > cfg_.threshold;
            const float new_value = white ? cfg_.foreground_level : cfg_.background_level;
            px(r, c) = new_value;
            mask.set(r, c, white);

            const float error = old_value - new_value;

            // In-bounds neighbours only; missing neighbours lose their share.
            if (c + 1 < W) {
                px(r, c + 1) += error * cfg_.weight_right;
            }
            if (r + 1 < H) {
                if (c > 0) {
                    px(r + 1, c - 1) += error * cfg_.weight_below_left;
                }
                px(r + 1, c) += error * cfg_.weight_below;
                if (c + 1 < W) {
                    px(r + 1, c + 1) += error * cfg_.weight_below_right;
                }
            }
        }
    }

    return mask;
}

} // namespace pano
