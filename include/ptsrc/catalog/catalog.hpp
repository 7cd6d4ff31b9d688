#pragma once

#include "ptsrc/core/types.hpp"

#include <array>
#include <vector>

namespace ptsrc::catalog {

constexpr int kNumComp = 3;  // T, Q, U

// One detected or fitted source. Angles in radians, amplitudes in uK,
// fluxes in Jy.
struct Entry {
    double ra = 0.0;
    double dec = 0.0;
    std::array<double, kNumComp> amp{};
    std::array<double, kNumComp> damp{};
    std::array<double, kNumComp> flux{};
    std::array<double, kNumComp> dflux{};
    double npix = 0.0;
    int status = 0;

    SkyPos pos() const { return SkyPos{dec, ra}; }
};

using Catalog = std::vector<Entry>;

// Gaussian amplitude prior per source
struct Prior {
    VectorXd amp;
    VectorXd ivar;
};

// T signal-to-noise; zero when the uncertainty is not positive
double snr(const Entry& e);
// Flux-based T signal-to-noise
double flux_snr(const Entry& e);

void sort_by_snr(Catalog& cat);
Catalog select(const Catalog& cat, const std::vector<int>& indices);
Catalog concatenate(const std::vector<Catalog>& cats);
std::vector<SkyPos> positions(const Catalog& cat);

// ivar = 1 / (damp^2 + (amp * variability)^2), or min_ivar where damp <= 0
Prior build_prior(const VectorXd& amps, const VectorXd& damps,
                  double variability = 1.0, double min_ivar = 1e-10);

} // namespace ptsrc::catalog
