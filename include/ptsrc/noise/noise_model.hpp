#pragma once

#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <cstdint>
#include <vector>

namespace ptsrc::noise {

// Gaussian smoothing of a 2D power spectrum to resolution lsigma in l
Matrix2Dd smooth_ps_gauss(const Matrix2Dd& ps, const sky::Geometry& geom, double lsigma);

// Smoothed 2D noise power spectrum of a residual map. The outer margin is
// masked, the rest tapered over apod pixels; the window's power bias is
// divided out. Units are per-pixel variance.
Matrix2Dd measure_noise(const Matrix2Dd& noise_map, const sky::Geometry& geom,
                        int margin, int apod, double ps_res);

// Replace all power above lcut by the mean power in (0.9 lcut, lcut)
Matrix2Dd flatten_high_l(const Matrix2Dd& ps, const sky::Geometry& geom, double lcut);

// Matched filter B/P, normalized so the filtered unit-peak beam template
// has unit peak.
Matrix2Dd build_filter(const Matrix2Dd& ps, const Matrix2Dd& beam2d);

// Median of block means (plus one overlapping tail block)
double safe_mean(const std::vector<double>& values, int bsize = 100);

// Per-block robust RMS of the non-zero pixels broadcast over each block
Matrix2Dd snmap_norm(const Matrix2Dd& map, int bsize = 240);

// Deterministic 1/f-shaped noise realization scaled by weight^-1/2
Matrix2Dd sim_initial_noise(const Matrix2Dd& weight, const sky::Geometry& geom,
                            std::uint32_t seed, double lknee = 3000.0, double alpha = -2.0);

} // namespace ptsrc::noise
