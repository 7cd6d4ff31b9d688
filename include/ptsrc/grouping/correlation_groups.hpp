#pragma once

#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <opencv2/core.hpp>
#include <opencv2/flann.hpp>

#include <memory>
#include <vector>

namespace ptsrc::grouping {

// Radius queries over sky positions. Candidates come from a kd-tree over
// unit vectors, so right-ascension wraparound needs no special handling;
// membership is decided by the exact great-circle distance.
class SkyIndex {
public:
    explicit SkyIndex(const std::vector<SkyPos>& positions);

    // Indices within angular distance <= radius of center, ascending
    std::vector<int> query_radius(const SkyPos& center, double radius) const;

    size_t size() const { return positions_.size(); }

private:
    std::vector<SkyPos> positions_;
    cv::Mat points_;
    std::unique_ptr<cv::flann::Index> index_;
};

// Angular distance beyond which the real-space correlation function of
// the harmonic kernel tfun stays below tol relative to its peak
double measure_corrlen(const Matrix2Dd& tfun, const sky::Geometry& geom, double tol);

// Per-source bookkeeping, indexed by source
struct SourceGroupInfo {
    int group = -1;               // independent group id
    int slot = -1;                // position inside that group
    std::vector<int> neighbors;   // all sources within corrlen, self included
};

struct IndependentGroups {
    std::vector<std::vector<int>> groups;   // each sorted ascending
    std::vector<SourceGroupInfo> sources;
};

// Partition sources into groups whose members are pairwise further apart
// than corrlen. The neighbor relation is symmetric.
IndependentGroups group_independent(const std::vector<SkyPos>& positions, double corrlen);

} // namespace ptsrc::grouping
