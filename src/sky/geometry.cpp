#include "ptsrc/sky/geometry.hpp"
#include "ptsrc/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ptsrc::sky {

namespace {

constexpr double D2R = M_PI / 180.0;

} // namespace

VectorXd fftfreq(int n) {
    VectorXd f(n);
    for (int i = 0; i < n; ++i) {
        int k = (i <= (n - 1) / 2) ? i : i - n;
        f[i] = static_cast<double>(k) / n;
    }
    return f;
}

Geometry::Geometry(int ny, int nx, const astrometry::WCS& wcs)
    : ny_(ny), nx_(nx), wcs_(wcs) {
    wcs_.naxis1 = nx;
    wcs_.naxis2 = ny;
}

SkyPos Geometry::pix_to_sky(const PixPos& pix) const {
    double ra_deg = 0.0, dec_deg = 0.0;
    wcs_.pixel_to_sky(pix.x, pix.y, ra_deg, dec_deg);
    return SkyPos{dec_deg * D2R, ra_deg * D2R};
}

PixPos Geometry::sky_to_pix(const SkyPos& pos) const {
    double px = 0.0, py = 0.0;
    if (!wcs_.sky_to_pixel(pos.ra / D2R, pos.dec / D2R, px, py)) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        return PixPos{nan, nan};
    }
    return PixPos{py, px};
}

std::pair<double, double> Geometry::pixel_shape() const {
    const PixPos c{0.5 * (ny_ - 1), 0.5 * (nx_ - 1)};
    const SkyPos p0 = pix_to_sky(c);
    const SkyPos py = pix_to_sky(PixPos{c.y + 1.0, c.x});
    const SkyPos px = pix_to_sky(PixPos{c.y, c.x + 1.0});
    return {core::angular_distance(p0, py), core::angular_distance(p0, px)};
}

double Geometry::pixel_area() const {
    auto [dy, dx] = pixel_shape();
    return dy * dx;
}

std::pair<VectorXd, VectorXd> Geometry::laxes() const {
    auto [dy, dx] = pixel_shape();
    VectorXd ly = fftfreq(ny_) * (2.0 * M_PI / dy);
    VectorXd lx = fftfreq(nx_) * (2.0 * M_PI / dx);
    return {ly, lx};
}

Matrix2Dd Geometry::modlmap() const {
    auto [ly, lx] = laxes();
    Matrix2Dd l(ny_, nx_);
    for (int y = 0; y < ny_; ++y) {
        for (int x = 0; x < nx_; ++x) {
            l(y, x) = std::sqrt(ly[y] * ly[y] + lx[x] * lx[x]);
        }
    }
    return l;
}

Geometry Geometry::subgeometry(const PixBox& box) const {
    return Geometry(box.height(), box.width(),
                    wcs_.shifted(box.x0, box.y0, box.width(), box.height()));
}

PixBox Geometry::sky_box_to_pixbox(const SkyPos& corner1, const SkyPos& corner2) const {
    const PixPos p1 = sky_to_pix(corner1);
    const PixPos p2 = sky_to_pix(corner2);
    PixBox box;
    box.y0 = core::nint(std::min(p1.y, p2.y));
    box.y1 = core::nint(std::max(p1.y, p2.y));
    box.x0 = core::nint(std::min(p1.x, p2.x));
    box.x1 = core::nint(std::max(p1.x, p2.x));
    return box;
}

PixBox Geometry::neighborhood_pixbox(const SkyPos& pos, double radius) const {
    const double dec1 = std::max(pos.dec - radius, -M_PI / 2);
    const double dec2 = std::min(pos.dec + radius, M_PI / 2);
    const double cmin = std::min(std::cos(dec1), std::cos(dec2));
    const double dra = cmin > 0.0 ? std::min(radius / cmin, M_PI) : M_PI;

    double ymin = std::numeric_limits<double>::infinity();
    double ymax = -ymin;
    double xmin = ymin;
    double xmax = -ymin;
    const double decs[3] = {dec1, pos.dec, dec2};
    const double ras[3] = {pos.ra - dra, pos.ra, pos.ra + dra};
    for (double d : decs) {
        for (double r : ras) {
            PixPos p = sky_to_pix(SkyPos{d, r});
            if (!std::isfinite(p.y) || !std::isfinite(p.x)) continue;
            ymin = std::min(ymin, p.y);
            ymax = std::max(ymax, p.y);
            xmin = std::min(xmin, p.x);
            xmax = std::max(xmax, p.x);
        }
    }

    PixBox box;
    if (!std::isfinite(ymin)) return box;
    box.y0 = std::max(0, core::nint(ymin));
    box.y1 = std::min(ny_, core::nint(ymax) + 1);
    if (dra >= M_PI) {
        box.x0 = 0;
        box.x1 = nx_;
    } else {
        box.x0 = std::max(0, core::nint(xmin));
        box.x1 = std::min(nx_, core::nint(xmax) + 1);
    }
    return box;
}

} // namespace ptsrc::sky
