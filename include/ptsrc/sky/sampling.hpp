#pragma once

#include "ptsrc/core/types.hpp"

namespace ptsrc::sky {

// A rectangular cut-out of a larger map, located by its pixel box
struct Patch {
    PixBox box;
    Matrix2Dd data;
};

// Evaluate map at a fractional pixel. order 0 is nearest-neighbor, order 1
// bilinear. Samples outside the map read as zero.
double interpolate(const Matrix2Dd& map, const PixPos& pix, int order = 1);

// Copy of the box; pixels outside the map are zero
Matrix2Dd extract(const Matrix2Dd& map, const PixBox& box);

// map[box] += patch. With wrap, indices outside the map wrap periodically,
// otherwise they are dropped.
void insert_add(Matrix2Dd& map, const PixBox& box, const Matrix2Dd& patch, bool wrap);

void add_patch(Matrix2Dd& map, const Patch& patch, double scale = 1.0);

// Sum of a.data * b.data over the overlap of the two boxes
double overlap_dot(const Patch& a, const Patch& b);

// Cyclic shift: out(y, x) = in(y - dy, x - dx)
Matrix2Dd roll(const Matrix2Dd& map, int dy, int dx);

// Cyclically shift the [0,0] pixel to (s/2, s/2) and keep the leading s x s
// block, with s = min(size, rows, cols). Optionally normalize by map(0,0).
Matrix2Dd thumbnail(const Matrix2Dd& map, int size, bool normalize = false);

} // namespace ptsrc::sky
