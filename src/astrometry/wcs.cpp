#include "ptsrc/astrometry/wcs.hpp"
#include "ptsrc/core/utils.hpp"

#include <cmath>

namespace ptsrc::astrometry {

namespace {

constexpr double D2R = M_PI / 180.0;

double wrap_deg_180(double d) {
    return core::rewind(d * D2R) / D2R;
}

} // namespace

void WCS::pixel_to_sky(double px, double py, double& ra_deg, double& dec_deg) const {
    double dx = (px + 1.0) - crpix1;
    double dy = (py + 1.0) - crpix2;

    // Intermediate world coordinates (degrees)
    double xi  = cd1_1 * dx + cd1_2 * dy;
    double eta = cd2_1 * dx + cd2_2 * dy;

    if (projection == Projection::CAR) {
        ra_deg = crval1 + xi;
        dec_deg = crval2 + eta;
    } else {
        double xi_r  = xi * D2R;
        double eta_r = eta * D2R;
        double ra0_r  = crval1 * D2R;
        double dec0_r = crval2 * D2R;

        double sin_dec0 = std::sin(dec0_r);
        double cos_dec0 = std::cos(dec0_r);
        double denom = cos_dec0 - eta_r * sin_dec0;

        ra_deg  = std::atan2(xi_r, denom) / D2R + crval1;
        dec_deg = std::atan2((sin_dec0 + eta_r * cos_dec0) * std::cos(ra_deg * D2R - ra0_r), denom) / D2R;
    }

    ra_deg = std::fmod(ra_deg, 360.0);
    if (ra_deg < 0.0) ra_deg += 360.0;
}

bool WCS::sky_to_pixel(double ra_deg, double dec_deg, double& px, double& py) const {
    double xi = 0.0;
    double eta = 0.0;

    if (projection == Projection::CAR) {
        xi = wrap_deg_180(ra_deg - crval1);
        eta = dec_deg - crval2;
    } else {
        double ra_r   = ra_deg * D2R;
        double dec_r  = dec_deg * D2R;
        double dec0_r = crval2 * D2R;

        double sin_dec  = std::sin(dec_r);
        double cos_dec  = std::cos(dec_r);
        double sin_dec0 = std::sin(dec0_r);
        double cos_dec0 = std::cos(dec0_r);
        double delta_ra = ra_r - crval1 * D2R;
        double cos_dra  = std::cos(delta_ra);

        double denom = sin_dec * sin_dec0 + cos_dec * cos_dec0 * cos_dra;
        if (denom <= 0.0) return false;

        xi  = (cos_dec * std::sin(delta_ra)) / denom / D2R;
        eta = (sin_dec * cos_dec0 - cos_dec * sin_dec0 * cos_dra) / denom / D2R;
    }

    // Invert CD matrix: [dx, dy] = CD^-1 * [xi, eta]
    double det = cd1_1 * cd2_2 - cd1_2 * cd2_1;
    if (std::abs(det) < 1e-30) return false;

    double dx = ( cd2_2 * xi - cd1_2 * eta) / det;
    double dy = (-cd2_1 * xi + cd1_1 * eta) / det;

    px = dx + crpix1 - 1.0;
    py = dy + crpix2 - 1.0;
    return true;
}

WCS WCS::shifted(int x0, int y0, int width, int height) const {
    WCS w = *this;
    w.crpix1 -= x0;
    w.crpix2 -= y0;
    w.naxis1 = width;
    w.naxis2 = height;
    return w;
}

WCS wcs_from_cdelt_crota(double crval1, double crval2,
                         double crpix1, double crpix2,
                         double cdelt1, double cdelt2,
                         double crota2, int naxis1, int naxis2,
                         Projection projection) {
    WCS w;
    w.crval1 = crval1;
    w.crval2 = crval2;
    w.crpix1 = crpix1;
    w.crpix2 = crpix2;
    w.naxis1 = naxis1;
    w.naxis2 = naxis2;
    w.projection = projection;

    double cos_r = std::cos(crota2 * D2R);
    double sin_r = std::sin(crota2 * D2R);

    w.cd1_1 =  cdelt1 * cos_r;
    w.cd1_2 = -cdelt2 * sin_r;
    w.cd2_1 =  cdelt1 * sin_r;
    w.cd2_2 =  cdelt2 * cos_r;

    return w;
}

WCS make_car_wcs(int width, int height, double res_deg, double ra0_deg, double dec0_deg) {
    return wcs_from_cdelt_crota(ra0_deg, dec0_deg,
                                0.5 * (width + 1), 0.5 * (height + 1),
                                -res_deg, res_deg, 0.0, width, height,
                                Projection::CAR);
}

Projection projection_from_ctype(const std::string& ctype) {
    std::string c = core::trim(ctype);
    if (core::ends_with(c, "-TAN")) return Projection::TAN;
    return Projection::CAR;
}

} // namespace ptsrc::astrometry
