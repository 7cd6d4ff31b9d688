#include "ptsrc/pipeline/map_merge.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/sky/sampling.hpp"

#include <cmath>

namespace ptsrc::pipeline {

Matrix2Dd build_merge_weight(int ny, int nx) {
    const double cy = 0.5 * (ny - 1);
    const double cx = 0.5 * (nx - 1);
    Matrix2Dd w(ny, nx);
    for (int y = 0; y < ny; ++y) {
        const double wy = 1.0 - 2.0 * std::abs(y - cy) / ny;
        for (int x = 0; x < nx; ++x) {
            w(y, x) = wy * (1.0 - 2.0 * std::abs(x - cx) / nx);
        }
    }
    return w;
}

MapAccumulator::MapAccumulator(int ny, int nx, int crop)
    : crop_(crop), vsum_(Matrix2Dd::Zero(ny, nx)), wsum_(Matrix2Dd::Zero(ny, nx)) {}

void MapAccumulator::add(const PixBox& box, const Matrix2Dd& tile) {
    if (tile.rows() != box.height() || tile.cols() != box.width()) {
        throw PipelineError("Tile shape does not match its box");
    }
    const int h = box.height() - 2 * crop_;
    const int w = box.width() - 2 * crop_;
    if (h <= 0 || w <= 0) return;

    const PixBox inner{box.y0 + crop_, box.x0 + crop_, box.y0 + crop_ + h, box.x0 + crop_ + w};
    const Matrix2Dd weight = build_merge_weight(h, w);
    const Matrix2Dd part = tile.block(crop_, crop_, h, w);

    sky::insert_add(vsum_, inner, (part.array() * weight.array()).matrix(), false);
    sky::insert_add(wsum_, inner, weight, false);
}

void MapAccumulator::merge(const MapAccumulator& other) {
    if (other.vsum_.rows() != vsum_.rows() || other.vsum_.cols() != vsum_.cols()) {
        throw PipelineError("Cannot merge accumulators of different shapes");
    }
    vsum_ += other.vsum_;
    wsum_ += other.wsum_;
}

Matrix2Dd MapAccumulator::result() const {
    Matrix2Dd out = Matrix2Dd::Zero(vsum_.rows(), vsum_.cols());
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        const double w = wsum_.data()[i];
        if (w > 0.0) {
            const double v = vsum_.data()[i] / w;
            out.data()[i] = std::isfinite(v) ? v : 0.0;
        }
    }
    return out;
}

} // namespace ptsrc::pipeline
