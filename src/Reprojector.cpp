// Reprojector.cpp
#include "Reprojector.hpp"
#include "ErrorHandler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace pano {

Reprojector::Reprojector(const ReprojectorConfig& cfg)
    : cfg_(cfg)
{
    if (cfg_.identity_epsilon < 0.0) {
        throw std::invalid_argument("Reprojector: identity_epsilon must be non-negative");
    }
}

bool Reprojector::isIdentity(const Orientation& o) const
{
    const double eps = cfg_.identity_epsilon;
    return std::abs(o.pitch) < eps &&
           std::abs(o.roll) < eps &&
           std::abs(o.heading) < eps;
}

Eigen::Vector3d Reprojector::sourceDirection(const Eigen::Vector3d& dir,
                                             const Orientation& o)
{
    const double ch = std::cos(-o.heading), sh = std::sin(-o.heading);
    const double cp = std::cos(-o.pitch),   sp = std::sin(-o.pitch);
    const double cr = std::cos(o.roll),     sr = std::sin(o.roll);

    const double x = dir.x();
    const double y = dir.y();
    const double z = dir.z();

    // Heading (about Y): rotates X toward Z
    const double x1 = ch * x + sh * z;
    const double y1 = y;
    const double z1 = -sh * x + ch * z;

    // Pitch (about Z): rotates X toward Y
    const double x2 = cp * x1 - sp * y1;
    const double y2 = sp * x1 + cp * y1;
    const double z2 = z1;

    // Roll (about X): rotates Y toward Z
    const double x3 = x2;
    const double y3 = cr * y2 - sr * z2;
    const double z3 = sr * y2 + cr * z2;

    return Eigen::Vector3d(x3, y3, z3);
}

template <typename T>
Raster<T> Reprojector::level(const Raster<T>& image, const Orientation& orientation) const
{
    requireNonDegenerate(image.height, image.width, "Reprojector: input image");

    if (isIdentity(orientation)) {
        return image;
    }

    const int H = image.height;
    const int W = image.width;
    const int C = image.channels;

    Raster<T> out(H, W, C);

    for (int v = 0; v < H; ++v) {
        const double theta_out = static_cast<double>(v) / (H - 1) * M_PI;
        const double sin_t = std::sin(theta_out);
        const double cos_t = std::cos(theta_out);

        for (int u = 0; u < W; ++u) {
            const double phi_out = static_cast<double>(u) / (W - 1) * 2.0 * M_PI;

            const Eigen::Vector3d dir(sin_t * std::cos(phi_out),
                                      cos_t,
                                      sin_t * std::sin(phi_out));
            const Eigen::Vector3d src = sourceDirection(dir, orientation);

            // Back to spherical, phi normalized into [0, 2*pi)
            const double theta_in = std::acos(std::min(1.0, std::max(-1.0, src.y())));
            double phi_in = std::fmod(std::atan2(src.z(), src.x()), 2.0 * M_PI);
            if (phi_in < 0.0) {
                phi_in += 2.0 * M_PI;
            }

            const double v_in = theta_in / M_PI * (H - 1);
            const double u_in = phi_in / (2.0 * M_PI) * (W - 1);

            // Rows clamp at the poles, columns wrap around
            const int v0 = static_cast<int>(std::floor(v_in));
            const int v1 = std::min(v0 + 1, H - 1);
            const int u0 = static_cast<int>(std::floor(u_in));
            const int u1 = (u0 + 1) % W;

            const double wv = v_in - v0;
            const double wu = u_in - u0;

            for (int ch = 0; ch < C; ++ch) {
                const double value =
                    static_cast<double>(image.at(v0, u0, ch)) * (1.0 - wu) * (1.0 - wv) +
                    static_cast<double>(image.at(v0, u1, ch)) * wu * (1.0 - wv) +
                    static_cast<double>(image.at(v1, u0, ch)) * (1.0 - wu) * wv +
                    static_cast<double>(image.at(v1, u1, ch)) * wu * wv;
                out.at(v, u, ch) = static_cast<T>(value);
            }
        }
    }

    return out;
}

template Raster<std::uint8_t> Reprojector::level(const Raster<std::uint8_t>&, const Orientation&) const;
template Raster<std::uint16_t> Reprojector::level(const Raster<std::uint16_t>&, const Orientation&) const;
template Raster<float> Reprojector::level(const Raster<float>&, const Orientation&) const;
template Raster<double> Reprojector::level(const Raster<double>&, const Orientation&) const;

} // namespace pano
