#include "ptsrc/beam/beam.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/units.hpp"
#include "ptsrc/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace ptsrc::beam {

namespace {

std::vector<double> linspace(double a, double b, int n) {
    std::vector<double> out(n);
    for (int i = 0; i < n; ++i) {
        out[i] = (n > 1) ? a + (b - a) * i / (n - 1) : a;
    }
    return out;
}

// sum_l (2l+1)/(4pi) b_l P_l(cos r), divided by its value at r = 0
std::vector<double> legendre_profile(const std::vector<double>& bl, const std::vector<double>& r) {
    double bmax = 0.0;
    for (double v : bl) bmax = std::max(bmax, std::abs(v));
    int lmax = 0;
    for (int l = static_cast<int>(bl.size()) - 1; l > 0; --l) {
        if (std::abs(bl[l]) > 1e-12 * bmax) {
            lmax = l;
            break;
        }
    }

    std::vector<double> a(lmax + 1);
    double norm = 0.0;
    for (int l = 0; l <= lmax; ++l) {
        a[l] = bl[l] * (2.0 * l + 1.0) / (4.0 * M_PI);
        norm += a[l];
    }

    std::vector<double> out(r.size(), 0.0);
    for (size_t i = 0; i < r.size(); ++i) {
        const double x = std::cos(r[i]);
        double p0 = 1.0;
        double p1 = x;
        double s = a[0];
        if (lmax >= 1) s += a[1] * p1;
        for (int l = 1; l < lmax; ++l) {
            const double p2 = ((2.0 * l + 1.0) * x * p1 - l * p0) / (l + 1.0);
            s += a[l + 1] * p2;
            p0 = p1;
            p1 = p2;
        }
        out[i] = s / norm;
    }
    return out;
}

} // namespace

double BeamProfile::at(double radius) const {
    if (r.size() < 2) return 0.0;
    const double dr = r[1] - r[0];
    const double t = (radius - r[0]) / dr;
    if (t < 0.0 || t > static_cast<double>(r.size() - 1)) return 0.0;
    const size_t i = std::min(static_cast<size_t>(t), r.size() - 2);
    const double f = t - static_cast<double>(i);
    return b[i] * (1.0 - f) + b[i + 1] * f;
}

Beam::Beam(std::vector<double> transform) : bl_(std::move(transform)) {
    if (bl_.empty()) {
        throw ConfigError("Beam transform is empty");
    }
}

Beam Beam::gaussian(double fwhm_arcmin, int nl) {
    const double sigma = fwhm_arcmin * core::kArcmin * core::kFwhmToSigma;
    std::vector<double> bl(nl);
    for (int l = 0; l < nl; ++l) {
        const double ls = l * sigma;
        bl[l] = std::exp(-0.5 * ls * ls);
    }
    return Beam(std::move(bl));
}

Beam Beam::from_spec(const std::string& spec) {
    if (auto fwhm = core::parse_double(spec)) {
        if (!(*fwhm > 0.0)) {
            throw ConfigError("Beam FWHM must be positive: " + spec);
        }
        return gaussian(*fwhm);
    }

    std::ifstream in(spec);
    if (!in) {
        throw ConfigError("Beam is neither a FWHM nor a readable file: " + spec);
    }

    std::vector<double> bl;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const std::string t = core::trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto toks = core::split_whitespace(t);
        std::optional<double> v;
        if (toks.size() >= 2) v = core::parse_double(toks[1]);
        if (!v) {
            throw ConfigError("Malformed beam file " + spec + " at line " + std::to_string(lineno));
        }
        bl.push_back(*v);
    }
    if (bl.empty()) {
        throw ConfigError("Beam file has no entries: " + spec);
    }
    return Beam(std::move(bl));
}

double Beam::at(double l) const {
    if (l <= 0.0) return bl_.front();
    const double last = static_cast<double>(bl_.size() - 1);
    if (l >= last) return bl_.back();
    const size_t i = static_cast<size_t>(l);
    const double f = l - static_cast<double>(i);
    return bl_[i] * (1.0 - f) + bl_[i + 1] * f;
}

Matrix2Dd Beam::transform_2d(const sky::Geometry& geom) const {
    Matrix2Dd l = geom.modlmap();
    for (Eigen::Index i = 0; i < l.size(); ++i) {
        l.data()[i] = at(l.data()[i]);
    }
    return l;
}

BeamProfile Beam::radial_profile(int nsamp, double rmax, double tol) const {
    if (!(rmax > 0.0)) {
        const std::vector<double> r0 = linspace(0.0, M_PI, nsamp);
        const std::vector<double> br0 = legendre_profile(bl_, r0);
        int last = 0;
        for (int i = nsamp - 1; i >= 0; --i) {
            if (br0[i] > tol) {
                last = i;
                break;
            }
        }
        rmax = r0[std::min(nsamp - 1, last + 1)];
    }

    BeamProfile prof;
    prof.r = linspace(0.0, rmax, nsamp);
    prof.b = legendre_profile(bl_, prof.r);
    return prof;
}

double transform_area(const Matrix2Dd& beam2d, const sky::Geometry& geom) {
    return beam2d(0, 0) / beam2d.mean() * geom.pixel_area();
}

double profile_radius(const BeamProfile& profile, double lim) {
    for (size_t i = profile.b.size(); i-- > 0;) {
        if (profile.b[i] > lim) return profile.r[i];
    }
    return profile.rmax();
}

double profile_area(const BeamProfile& profile) {
    const size_t n = profile.r.size();
    if (n < 2) return 0.0;
    const double h = profile.r[1] - profile.r[0];
    auto f = [&](size_t i) { return 2.0 * M_PI * profile.r[i] * profile.b[i]; };

    // Composite Simpson over an even number of intervals, trapezoid for a leftover one
    const size_t nint_even = ((n - 1) / 2) * 2;
    double s = 0.0;
    for (size_t i = 0; i + 2 <= nint_even; i += 2) {
        s += h / 3.0 * (f(i) + 4.0 * f(i + 1) + f(i + 2));
    }
    if (nint_even < n - 1) {
        s += 0.5 * h * (f(n - 2) + f(n - 1));
    }
    return s;
}

} // namespace ptsrc::beam
