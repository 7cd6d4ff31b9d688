#pragma once

#include "ptsrc/core/types.hpp"

namespace ptsrc::pipeline {

// Separable tent weight, 1 - 2|i - c|/n along each axis with c = (n-1)/2
Matrix2Dd build_merge_weight(int ny, int nx);

// Weighted reduce of overlapping tiles onto one ny x nx map. Accumulation
// order does not matter; pixels never covered come out as zero.
class MapAccumulator {
public:
    MapAccumulator(int ny, int nx, int crop = 0);

    // Add a tile covering box of the full map. crop pixels are dropped from
    // every tile border first; parts outside the map are ignored.
    void add(const PixBox& box, const Matrix2Dd& tile);

    // Fold in another accumulator over the same map
    void merge(const MapAccumulator& other);

    Matrix2Dd result() const;

    const Matrix2Dd& weight() const { return wsum_; }

private:
    int crop_;
    Matrix2Dd vsum_;
    Matrix2Dd wsum_;
};

} // namespace ptsrc::pipeline
