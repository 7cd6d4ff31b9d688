#pragma once

#include "ptsrc/astrometry/wcs.hpp"
#include "ptsrc/core/types.hpp"

#include <utility>

namespace ptsrc::sky {

// Shape and world coordinate system of a 2D sky map.
// Sky positions are (dec, ra) in radians, pixels are (y, x).
class Geometry {
public:
    Geometry() = default;
    Geometry(int ny, int nx, const astrometry::WCS& wcs);

    int ny() const { return ny_; }
    int nx() const { return nx_; }
    long npix() const { return static_cast<long>(ny_) * nx_; }
    const astrometry::WCS& wcs() const { return wcs_; }
    PixBox full_box() const { return PixBox{0, 0, ny_, nx_}; }

    SkyPos pix_to_sky(const PixPos& pix) const;
    // NaN coordinates when the position cannot be projected
    PixPos sky_to_pix(const SkyPos& pos) const;

    // Physical (dy, dx) pixel size in radians at the map center
    std::pair<double, double> pixel_shape() const;
    double pixel_area() const;

    // Harmonic frequency axes (fftfreq ordering) and their modulus
    std::pair<VectorXd, VectorXd> laxes() const;
    Matrix2Dd modlmap() const;

    // Geometry of a sub-image. The box may extend outside the map.
    Geometry subgeometry(const PixBox& box) const;

    // Rounded, sorted pixel box spanned by two sky corners
    PixBox sky_box_to_pixbox(const SkyPos& corner1, const SkyPos& corner2) const;

    // Pixel box covering all pixels within radius of pos, clipped to the map
    PixBox neighborhood_pixbox(const SkyPos& pos, double radius) const;

private:
    int ny_ = 0;
    int nx_ = 0;
    astrometry::WCS wcs_;
};

VectorXd fftfreq(int n);

} // namespace ptsrc::sky
