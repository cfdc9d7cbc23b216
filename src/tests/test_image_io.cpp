#include "ImageIO.hpp"
#include "ErrorHandler.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace pano;

namespace fs = std::filesystem;

namespace {

class ImageIOTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               (std::string("pano2points_imageio_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    fs::path dir_;
};

} // namespace

TEST_F(ImageIOTest, LoadGrayscaleKeepsSmallImages)
{
    cv::Mat img(10, 20, CV_8UC1);
    for (int r = 0; r < img.rows; ++r) {
        for (int c = 0; c < img.cols; ++c) {
            img.at<std::uint8_t>(r, c) = static_cast<std::uint8_t>(r * 10 + c);
        }
    }
    ASSERT_TRUE(cv::imwrite(path("small.png"), img));

    GrayImage gray = ImageIO::loadGrayscale(path("small.png"), 2000);
    EXPECT_EQ(gray.width, 20);
    EXPECT_EQ(gray.height, 10);
    EXPECT_EQ(gray.channels, 1);
    EXPECT_EQ(gray.at(3, 7), 37);
}

TEST_F(ImageIOTest, LoadGrayscaleShrinksPreservingAspect)
{
    cv::Mat img(30, 100, CV_8UC3, cv::Scalar(255, 255, 255));
    ASSERT_TRUE(cv::imwrite(path("wide.png"), img));

    GrayImage gray = ImageIO::loadGrayscale(path("wide.png"), 40);
    EXPECT_EQ(gray.width, 40);
    EXPECT_EQ(gray.height, 12);
    EXPECT_EQ(gray.at(5, 20), 255);
}

TEST_F(ImageIOTest, ResampleToMaxTruncatesSize)
{
    Raster<std::uint8_t> img(7, 10, 1, 80);
    Raster<std::uint8_t> out = ImageIO::resampleToMax(img, 4);
    EXPECT_EQ(out.width, 4);
    EXPECT_EQ(out.height, 2);   // int(7 * 0.4)
}

TEST_F(ImageIOTest, ResampleToMaxRejectsCollapsedSide)
{
    Raster<std::uint8_t> strip(3, 50, 1, 80);
    EXPECT_THROW(ImageIO::resampleToMax(strip, 20), DegenerateImageError);   // 20x1
}

TEST_F(ImageIOTest, MissingFileIsInputNotFound)
{
    EXPECT_THROW(ImageIO::loadGrayscale(path("nope.png"), 100), InputNotFoundError);
    EXPECT_THROW(ImageIO::loadImage(path("nope.png")), InputNotFoundError);
}

TEST_F(ImageIOTest, UndecodableFileIsConversionError)
{
    {
        std::ofstream bogus(path("bogus.png"));
        bogus << "not an image";
    }
    EXPECT_THROW(ImageIO::loadGrayscale(path("bogus.png"), 100), ConversionError);
}

TEST_F(ImageIOTest, DitherPreviewIsBlackAndWhite)
{
    DitherMask mask(3, 4);
    mask.set(0, 0, true);
    mask.set(2, 3, true);

    ImageIO::saveDitherPreview(path("preview.png"), mask);

    cv::Mat back = cv::imread(path("preview.png"), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(back.empty());
    EXPECT_EQ(back.type(), CV_8UC1);
    EXPECT_EQ(back.rows, 3);
    EXPECT_EQ(back.cols, 4);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 4; ++c) {
            EXPECT_EQ(back.at<std::uint8_t>(r, c), mask.at(r, c) ? 255 : 0);
        }
    }
}

TEST_F(ImageIOTest, ColorImageRoundTripKeepsChannels)
{
    Raster<std::uint8_t> img(4, 6, 3);
    for (std::size_t i = 0; i < img.data.size(); ++i) {
        img.data[i] = static_cast<std::uint8_t>(i);
    }

    ImageIO::saveImage(path("color.png"), img);
    Raster<std::uint8_t> back = ImageIO::loadImage(path("color.png"));

    EXPECT_EQ(back.channels, 3);
    EXPECT_EQ(back.data, img.data);
}
