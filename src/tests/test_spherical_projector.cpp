#include "SphericalProjector.hpp"
#include "ErrorHandler.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace pano;

namespace {

DitherMask checkerMask(int H, int W)
{
    DitherMask mask(H, W);
    for (int r = 0; r < H; ++r) {
        for (int c = 0; c < W; ++c) {
            mask.set(r, c, (r + c) % 2 == 0);
        }
    }
    return mask;
}

DitherMask fullMask(int H, int W)
{
    DitherMask mask(H, W);
    for (auto& v : mask.data) {
        v = 1;
    }
    return mask;
}

void expectSameCloud(const PointCloud& a, const PointCloud& b, double tol)
{
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_NEAR(a[i].x(), b[i].x(), tol) << "i=" << i;
        EXPECT_NEAR(a[i].y(), b[i].y(), tol) << "i=" << i;
        EXPECT_NEAR(a[i].z(), b[i].z(), tol) << "i=" << i;
    }
}

} // namespace

TEST(SphericalProjector, PixelToSphereAnchors)
{
    const double r = 50.0;

    // Top row is the north pole
    Eigen::Vector3d top = SphericalProjector::pixelToSphere(0, 3, 5, 9, r);
    EXPECT_NEAR(top.x(), 0.0, 1e-12);
    EXPECT_NEAR(top.y(), r, 1e-12);
    EXPECT_NEAR(top.z(), 0.0, 1e-12);

    // Bottom row is the south pole
    Eigen::Vector3d bottom = SphericalProjector::pixelToSphere(4, 3, 5, 9, r);
    EXPECT_NEAR(bottom.y(), -r, 1e-12);

    // Equator, phi = 0 -> +X; phi = pi/2 -> +Z
    Eigen::Vector3d px = SphericalProjector::pixelToSphere(2, 0, 5, 9, r);
    EXPECT_NEAR(px.x(), r, 1e-12);
    EXPECT_NEAR(px.y(), 0.0, 1e-12);
    Eigen::Vector3d pz = SphericalProjector::pixelToSphere(2, 2, 5, 9, r);
    EXPECT_NEAR(pz.z(), r, 1e-12);
    EXPECT_NEAR(pz.x(), 0.0, 1e-12);
}

TEST(SphericalProjector, PointsLieOnSphereInScanOrder)
{
    SphericalProjectionConfig cfg;
    cfg.radius = 12.5;
    const int H = 6;
    const int W = 8;

    PointCloud points = SphericalProjector(cfg).project(fullMask(H, W));
    ASSERT_EQ(points.size(), static_cast<std::size_t>(H * W));

    std::size_t i = 0;
    for (int r = 0; r < H; ++r) {
        for (int c = 0; c < W; ++c, ++i) {
            EXPECT_NEAR(points[i].norm(), cfg.radius, 1e-9);
            const Eigen::Vector3d expected = SphericalProjector::pixelToSphere(r, c, H, W, cfg.radius);
            EXPECT_EQ(points[i], expected);
        }
    }
}

TEST(SphericalProjector, InvertSelectsComplement)
{
    const int H = 5;
    const int W = 7;
    DitherMask mask = checkerMask(H, W);

    SphericalProjectionConfig cfg;
    PointCloud normal = SphericalProjector(cfg).project(mask);
    cfg.invert = true;
    PointCloud inverted = SphericalProjector(cfg).project(mask);

    EXPECT_EQ(normal.size() + inverted.size(), static_cast<std::size_t>(H * W));

    // Pole rows and the seam column map several pixels to one position,
    // so the partition is checked on the pixels each point came from.
    PointCloud expected_normal;
    PointCloud expected_inverted;
    for (int r = 0; r < H; ++r) {
        for (int c = 0; c < W; ++c) {
            const Eigen::Vector3d p = SphericalProjector::pixelToSphere(r, c, H, W, cfg.radius);
            (mask.at(r, c) ? expected_normal : expected_inverted).push_back(p);
        }
    }
    expectSameCloud(normal, expected_normal, 0.0);
    expectSameCloud(inverted, expected_inverted, 0.0);
}

TEST(SphericalProjector, FullRotationMatchesNoRotation)
{
    DitherMask mask = checkerMask(7, 11);

    SphericalProjectionConfig cfg;
    PointCloud plain = SphericalProjector(cfg).project(mask);
    cfg.rotation.y = 360.0;
    PointCloud rotated = SphericalProjector(cfg).project(mask);

    expectSameCloud(plain, rotated, 1e-9);
}

TEST(SphericalProjector, RotationMatrixComposesXThenYThenZ)
{
    RotationAngles angles{90.0, 90.0, 0.0};
    const Eigen::Matrix3d R = SphericalProjector::rotationMatrix(angles);

    // X first: +Y -> +Z, then Y: +Z -> +X
    Eigen::Vector3d v = R * Eigen::Vector3d(0.0, 1.0, 0.0);
    EXPECT_NEAR(v.x(), 1.0, 1e-12);
    EXPECT_NEAR(v.y(), 0.0, 1e-12);
    EXPECT_NEAR(v.z(), 0.0, 1e-12);

    EXPECT_TRUE(R.isUnitary(1e-12));
}

TEST(SphericalProjector, RotationAboutXMovesPoleToZ)
{
    DitherMask mask(3, 3);
    mask.set(0, 0, true);  // north pole

    SphericalProjectionConfig cfg;
    cfg.radius = 10.0;
    cfg.rotation.x = 90.0;
    PointCloud points = SphericalProjector(cfg).project(mask);

    ASSERT_EQ(points.size(), 1u);
    EXPECT_NEAR(points[0].x(), 0.0, 1e-9);
    EXPECT_NEAR(points[0].y(), 0.0, 1e-9);
    EXPECT_NEAR(points[0].z(), 10.0, 1e-9);
}

TEST(SphericalProjector, FullRangeFiltersAreNoOps)
{
    const int H = 6;
    const int W = 9;
    DitherMask mask = checkerMask(H, W);
    GrayImage original(H, W, 1, 30);

    SphericalProjectionConfig cfg;
    PointCloud baseline = SphericalProjector(cfg).project(mask);
    PointCloud with_original = SphericalProjector(cfg).project(mask, &original);

    expectSameCloud(baseline, with_original, 0.0);
}

TEST(SphericalProjector, HeightFilterKeepsUpperHalf)
{
    const int H = 5;
    const int W = 8;

    SphericalProjectionConfig cfg;
    cfg.height.min = 0.5;
    PointCloud points = SphericalProjector(cfg).project(fullMask(H, W));

    // Rows 0, 1 and the equator row 2
    EXPECT_EQ(points.size(), static_cast<std::size_t>(3 * W));
    for (const auto& p : points) {
        EXPECT_GE(p.y(), 0.0);
    }
}

TEST(SphericalProjector, HeightFilterAppliesAfterRotation)
{
    const int H = 5;
    const int W = 8;

    // Turned upside down, the upper band holds what used to be the bottom rows
    SphericalProjectionConfig cfg;
    cfg.rotation.x = 180.0;
    cfg.height.min = 0.9;
    PointCloud points = SphericalProjector(cfg).project(fullMask(H, W));

    // Only the former south pole row (y = -r -> +r) survives
    ASSERT_EQ(points.size(), static_cast<std::size_t>(W));
    for (const auto& p : points) {
        EXPECT_NEAR(p.y(), cfg.radius, 1e-9);
    }
}

TEST(SphericalProjector, BrightnessFilterOnCheckerboard)
{
    const int H = 4;
    const int W = 6;
    GrayImage original(H, W);
    for (int r = 0; r < H; ++r) {
        for (int c = 0; c < W; ++c) {
            original.at(r, c) = ((r + c) % 2 == 0) ? 200 : 50;
        }
    }

    SphericalProjectionConfig cfg;
    cfg.brightness.min = 0.6;
    cfg.brightness.max = 1.0;
    PointCloud points = SphericalProjector(cfg).project(fullMask(H, W), &original);

    EXPECT_EQ(points.size(), static_cast<std::size_t>(H * W / 2));

    // Without a brightness source the filter is skipped
    EXPECT_EQ(SphericalProjector(cfg).project(fullMask(H, W)).size(), static_cast<std::size_t>(H * W));
}

TEST(SphericalProjector, BrightnessFilterIsInclusive)
{
    GrayImage original(2, 2, 1, 51);  // 51 / 255 = 0.2 exactly
    SphericalProjectionConfig cfg;
    cfg.brightness.min = 0.2;
    cfg.brightness.max = 0.2;
    EXPECT_EQ(SphericalProjector(cfg).project(fullMask(2, 2), &original).size(), 4u);
}

TEST(SphericalProjector, BrightnessFilterAppliesAfterInvert)
{
    const int H = 2;
    const int W = 4;
    DitherMask mask(H, W);  // all background
    GrayImage original(H, W);
    for (int c = 0; c < W; ++c) {
        original.at(0, c) = 255;
        original.at(1, c) = 0;
    }

    SphericalProjectionConfig cfg;
    cfg.invert = true;
    cfg.brightness.min = 0.5;
    PointCloud points = SphericalProjector(cfg).project(mask, &original);

    ASSERT_EQ(points.size(), static_cast<std::size_t>(W));
    for (const auto& p : points) {
        EXPECT_NEAR(p.y(), cfg.radius, 1e-9);
    }
}

TEST(SphericalProjector, RejectsInvalidInput)
{
    SphericalProjectionConfig cfg;
    EXPECT_THROW(SphericalProjector(cfg).project(DitherMask(1, 5)), DegenerateImageError);

    cfg.brightness.min = 0.3;
    GrayImage wrong_shape(3, 3);
    EXPECT_THROW(SphericalProjector(cfg).project(DitherMask(4, 4), &wrong_shape), ConversionError);

    cfg.radius = 0.0;
    EXPECT_THROW(SphericalProjector{cfg}, ConversionError);

    cfg.radius = -5.0;
    EXPECT_THROW(SphericalProjector{cfg}, ConversionError);
}
