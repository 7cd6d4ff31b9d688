#pragma once

#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <string>
#include <vector>

namespace ptsrc::beam {

// Real-space radial beam profile sampled on r = [0, rmax] (radians),
// normalized to 1 at the center.
struct BeamProfile {
    std::vector<double> r;
    std::vector<double> b;

    double rmax() const { return r.empty() ? 0.0 : r.back(); }
    // Linear interpolation, zero outside [0, rmax]
    double at(double radius) const;
};

// Harmonic-space beam transform b(l) for integer l = 0..lmax
class Beam {
public:
    Beam() = default;
    explicit Beam(std::vector<double> transform);

    // A number is a Gaussian FWHM in arcmin, anything else a text file
    // whose second column holds b(l).
    static Beam from_spec(const std::string& spec);
    static Beam gaussian(double fwhm_arcmin, int nl = 40000);

    const std::vector<double>& transform() const { return bl_; }

    // b(l) linearly interpolated, clamped to the end values
    double at(double l) const;

    Matrix2Dd transform_2d(const sky::Geometry& geom) const;

    // Legendre-sum profile. With rmax == 0 a first pass over [0, pi]
    // places rmax one sample past the last value above tol.
    BeamProfile radial_profile(int nsamp, double rmax = 0.0, double tol = 1e-7) const;

private:
    std::vector<double> bl_;
};

// Solid angle (sr) of a 2D beam transform: b(0) / mean(b) * pixel area
double transform_area(const Matrix2Dd& beam2d, const sky::Geometry& geom);

// Largest radius where the profile exceeds lim
double profile_radius(const BeamProfile& profile, double lim);

// Solid angle (sr) from the radial profile
double profile_area(const BeamProfile& profile);

} // namespace ptsrc::beam
