#pragma once

#include "ptsrc/core/types.hpp"

namespace ptsrc::sky {

// Cosine taper of the given width (pixels) on every edge of an ny x nx map.
// Edge pixel is 0, pixel width-1 from the edge is 1.
Matrix2Dd apod_edges(int ny, int nx, int width);

// Euclidean distance (pixels) from each pixel to the nearest pixel where
// valid <= 0. Valid pixels far from any invalid one get a large value.
Matrix2Dd distance_to_invalid(const Matrix2Dd& valid);

// Cosine taper rising from 0 at zero-weight pixels to 1 at pixrad pixels away
Matrix2Dd apod_holes(const Matrix2Dd& weight, double pixrad);

} // namespace ptsrc::sky
