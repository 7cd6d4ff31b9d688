#pragma once

#include "ptsrc/core/types.hpp"

#include <cmath>
#include <string>

namespace ptsrc::astrometry {

// Linear celestial WCS with a CAR or TAN projection.
// Pixel coordinates are 0-indexed (x along NAXIS1, y along NAXIS2),
// sky coordinates are degrees.
struct WCS {
    // Reference pixel (1-indexed, FITS convention)
    double crpix1 = 0.0;
    double crpix2 = 0.0;

    // Reference sky coordinates (degrees)
    double crval1 = 0.0;  // RA
    double crval2 = 0.0;  // Dec

    // CD matrix (degrees/pixel)
    double cd1_1 = 0.0;
    double cd1_2 = 0.0;
    double cd2_1 = 0.0;
    double cd2_2 = 0.0;

    int naxis1 = 0;
    int naxis2 = 0;

    Projection projection = Projection::CAR;

    void pixel_to_sky(double px, double py, double& ra_deg, double& dec_deg) const;

    // Returns false if the point cannot be projected (behind a TAN plane
    // or singular CD matrix)
    bool sky_to_pixel(double ra_deg, double dec_deg, double& px, double& py) const;

    bool contains(double ra_deg, double dec_deg) const {
        double px, py;
        if (!sky_to_pixel(ra_deg, dec_deg, px, py)) return false;
        return px >= -0.5 && px < naxis1 - 0.5 && py >= -0.5 && py < naxis2 - 0.5;
    }

    bool valid() const {
        return naxis1 > 0 && naxis2 > 0 &&
               std::abs(cd1_1 * cd2_2 - cd1_2 * cd2_1) > 0;
    }

    // WCS of the sub-image starting at pixel (x0, y0)
    WCS shifted(int x0, int y0, int width, int height) const;
};

WCS wcs_from_cdelt_crota(double crval1, double crval2,
                         double crpix1, double crpix2,
                         double cdelt1, double cdelt2,
                         double crota2, int naxis1, int naxis2,
                         Projection projection = Projection::CAR);

// Plate carree grid with square pixels of res_deg, RA increasing to the left,
// centered on (ra0_deg, dec0_deg)
WCS make_car_wcs(int width, int height, double res_deg,
                 double ra0_deg = 0.0, double dec0_deg = 0.0);

Projection projection_from_ctype(const std::string& ctype);

} // namespace ptsrc::astrometry
