#include "ptsrc/grouping/correlation_groups.hpp"
#include "ptsrc/core/utils.hpp"
#include "ptsrc/sky/fourier.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace ptsrc::grouping {

namespace {

void to_unit_vector(const SkyPos& p, float* out) {
    const double cd = std::cos(p.dec);
    out[0] = static_cast<float>(cd * std::cos(p.ra));
    out[1] = static_cast<float>(cd * std::sin(p.ra));
    out[2] = static_cast<float>(std::sin(p.dec));
}

} // namespace

SkyIndex::SkyIndex(const std::vector<SkyPos>& positions) : positions_(positions) {
    if (positions_.empty()) return;
    points_.create(static_cast<int>(positions_.size()), 3, CV_32F);
    for (int i = 0; i < points_.rows; ++i) {
        to_unit_vector(positions_[i], points_.ptr<float>(i));
    }
    index_ = std::make_unique<cv::flann::Index>(points_, cv::flann::KDTreeIndexParams(1),
                                                cvflann::FLANN_DIST_L2);
}

std::vector<int> SkyIndex::query_radius(const SkyPos& center, double radius) const {
    std::vector<int> out;
    if (!index_ || !std::isfinite(center.dec) || !std::isfinite(center.ra)) return out;

    // Chord length with slack for the single precision tree
    const double chord = 2.0 * std::sin(0.5 * std::min(radius, M_PI));
    const double search = chord * (1.0 + 1e-5) + 1e-5;

    cv::Mat query(1, 3, CV_32F);
    to_unit_vector(center, query.ptr<float>(0));

    const int n = static_cast<int>(positions_.size());
    cv::Mat indices;
    cv::Mat dists;
    // L2 radius search works on squared distances
    const int found = index_->radiusSearch(query, indices, dists, search * search, n,
                                           cv::flann::SearchParams(-1));

    const int* idx = indices.ptr<int>(0);
    for (int k = 0; k < std::min(found, n); ++k) {
        const int j = idx[k];
        if (j < 0 || j >= n) continue;
        if (core::angular_distance(center, positions_[j]) <= radius) {
            out.push_back(j);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

double measure_corrlen(const Matrix2Dd& tfun, const sky::Geometry& geom, double tol) {
    Matrix2Dd corrfun = sky::ifft_real(tfun.cast<std::complex<double>>());
    corrfun /= corrfun(0, 0);

    const int ny = static_cast<int>(corrfun.rows());
    const int nx = static_cast<int>(corrfun.cols());
    const int ry = ny / 2;
    const int rx = nx / 2;
    const SkyPos refpos = geom.pix_to_sky(PixPos{static_cast<double>(ry), static_cast<double>(rx)});

    // Pixel (y, x) of the centered function holds lag (y - ry, x - rx)
    double corrlen = 0.0;
    for (int y = 0; y < ny; ++y) {
        const int sy = ((y - ry) % ny + ny) % ny;
        for (int x = 0; x < nx; ++x) {
            const int sx = ((x - rx) % nx + nx) % nx;
            if (std::abs(corrfun(sy, sx)) <= tol) continue;
            const SkyPos p = geom.pix_to_sky(PixPos{static_cast<double>(y), static_cast<double>(x)});
            corrlen = std::max(corrlen, core::angular_distance(p, refpos));
        }
    }
    return corrlen;
}

IndependentGroups group_independent(const std::vector<SkyPos>& positions, double corrlen) {
    const int n = static_cast<int>(positions.size());
    IndependentGroups result;
    result.sources.resize(n);

    SkyIndex index(positions);
    for (int i = 0; i < n; ++i) {
        result.sources[i].neighbors = index.query_radius(positions[i], corrlen);
    }

    std::set<int> remainder;
    for (int i = 0; i < n; ++i) remainder.insert(i);

    while (!remainder.empty()) {
        std::vector<int> group;
        std::set<int> candidates = remainder;
        while (!candidates.empty()) {
            const int elem = *candidates.begin();
            for (int j : result.sources[elem].neighbors) candidates.erase(j);
            candidates.erase(elem);
            group.push_back(elem);
        }
        const int gid = static_cast<int>(result.groups.size());
        for (size_t k = 0; k < group.size(); ++k) {
            remainder.erase(group[k]);
            result.sources[group[k]].group = gid;
            result.sources[group[k]].slot = static_cast<int>(k);
        }
        result.groups.push_back(std::move(group));
    }
    return result;
}

} // namespace ptsrc::grouping
