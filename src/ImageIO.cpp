#include "ImageIO.hpp"
#include "ErrorHandler.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace pano {

namespace fs = std::filesystem;

namespace {

    Raster<std::uint8_t> fromMat(const cv::Mat& mat)
    {
        Raster<std::uint8_t> raster(mat.rows, mat.cols, mat.channels());
        const std::size_t row_bytes = static_cast<std::size_t>(mat.cols) * mat.channels();
        for (int r = 0; r < mat.rows; ++r) {
            std::memcpy(&raster.data[static_cast<std::size_t>(r) * row_bytes], mat.ptr<std::uint8_t>(r), row_bytes);
        }
        return raster;
    }

    // Wraps the raster's storage without copying; the raster must outlive the Mat.
    cv::Mat asMat(const Raster<std::uint8_t>& raster)
    {
        return cv::Mat(raster.height, raster.width, CV_8UC(raster.channels),
                       const_cast<std::uint8_t*>(raster.data.data()));
    }

    void requireExists(const std::string& path)
    {
        if (!fs::exists(path)) {
            THROW_CONTEXT_AS(InputNotFoundError, "Input file not found: " + path);
        }
    }

    void writeMat(const std::string& path, const cv::Mat& mat)
    {
        std::vector<int> params;
        std::string ext = fs::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (ext == ".jpg" || ext == ".jpeg") {
            params = {cv::IMWRITE_JPEG_QUALITY, 95};
        }

        bool ok = false;
        try {
            ok = cv::imwrite(path, mat, params);
        } catch (const cv::Exception& e) {
            THROW_CONTEXT_AS(ConversionError, "ImageIO: Cannot write image " + path + ": " + e.what());
        }
        if (!ok) {
            THROW_CONTEXT_AS(ConversionError, "ImageIO: Cannot write image: " + path);
        }
    }

} // anonymous namespace

GrayImage ImageIO::loadGrayscale(const std::string& path, int max_dimension)
{
    requireExists(path);
    THROW_CONTEXT_AS_IF(max_dimension <= 0, ConversionError,
                        "ImageIO: max_dimension must be positive");

    cv::Mat img = cv::imread(path, cv::IMREAD_GRAYSCALE);
    if (img.empty()) {
        THROW_CONTEXT_AS(ConversionError, "ImageIO: Cannot decode image: " + path);
    }

    std::cout << "[ImageIO] Loaded " << path << " (" << img.cols << "x" << img.rows << ")\n";

    GrayImage gray = fromMat(img);
    GrayImage resized = resampleToMax(gray, max_dimension);
    if (resized.width != gray.width || resized.height != gray.height) {
        std::cout << "[ImageIO] Resized to " << resized.width << "x" << resized.height << "\n";
    }
    return resized;
}

Raster<std::uint8_t> ImageIO::loadImage(const std::string& path)
{
    requireExists(path);

    cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        THROW_CONTEXT_AS(ConversionError, "ImageIO: Cannot decode image: " + path);
    }
    if (img.depth() != CV_8U) {
        THROW_CONTEXT_AS(ConversionError, "ImageIO: Only 8-bit images are supported: " + path);
    }

    std::cout << "[ImageIO] Loaded " << path << " (" << img.cols << "x" << img.rows
              << ", " << img.channels() << " channels)\n";
    return fromMat(img);
}

Raster<std::uint8_t> ImageIO::resample(const Raster<std::uint8_t>& image, int new_width, int new_height)
{
    THROW_CONTEXT_AS_IF(new_width <= 0 || new_height <= 0, ConversionError,
                        "ImageIO: resample target size must be positive, got " +
                        std::to_string(new_width) + "x" + std::to_string(new_height));

    cv::Mat resized;
    try {
        cv::resize(asMat(image), resized, cv::Size(new_width, new_height), 0, 0, cv::INTER_LANCZOS4);
    } catch (const cv::Exception& e) {
        THROW_CONTEXT_AS(ConversionError, std::string("ImageIO: resample failed: ") + e.what());
    }
    return fromMat(resized);
}

Raster<std::uint8_t> ImageIO::resampleToMax(const Raster<std::uint8_t>& image, int max_dimension)
{
    const int largest = std::max(image.width, image.height);
    if (largest <= max_dimension) {
        return image;
    }

    const double ratio = static_cast<double>(max_dimension) / largest;
    const int new_width  = static_cast<int>(image.width * ratio);
    const int new_height = static_cast<int>(image.height * ratio);
    requireNonDegenerate(new_height, new_width, "ImageIO: resampled image");
    return resample(image, new_width, new_height);
}

void ImageIO::saveImage(const std::string& path, const Raster<std::uint8_t>& image)
{
    writeMat(path, asMat(image));
}

void ImageIO::saveDitherPreview(const std::string& path, const DitherMask& mask)
{
    cv::Mat preview(mask.height, mask.width, CV_8UC1);
    for (int r = 0; r < mask.height; ++r) {
        auto* row = preview.ptr<std::uint8_t>(r);
        for (int c = 0; c < mask.width; ++c) {
            row[c] = mask.at(r, c) ? 255 : 0;
        }
    }
    writeMat(path, preview);
}

} // namespace pano
