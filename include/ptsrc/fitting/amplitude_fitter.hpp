#pragma once

#include "ptsrc/beam/beam.hpp"
#include "ptsrc/catalog/catalog.hpp"
#include "ptsrc/config/configuration.hpp"
#include "ptsrc/core/events.hpp"
#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <vector>

namespace ptsrc::fitting {

struct FitResult {
    std::vector<int> fit_inds;  // indices into the input positions
    VectorXd amp;
    VectorXd damp;              // diag(icov)^-1/2
    Eigen::MatrixXd icov;
    VectorXd local_amps;        // model evaluated at each source pixel
};

// Indices of pixels at least margin pixels inside an ny x nx map
std::vector<int> inside_margin(const std::vector<PixPos>& pixels, int ny, int nx, double margin);

// Joint fit of source amplitudes at fixed sky positions. Positions too
// close to the edge are dropped; the survivors are listed in fit_inds.
// prior, when given, is indexed like positions.
FitResult fit_amplitudes(const Matrix2Dd& map, const Matrix2Dd& ivar, const sky::Geometry& geom,
                         const std::vector<SkyPos>& positions, const beam::Beam& beam,
                         const config::FitterConfig& cfg, const config::BeamConfig& beam_cfg,
                         const catalog::Prior* prior = nullptr,
                         const core::EventSink* events = nullptr);

} // namespace ptsrc::fitting
