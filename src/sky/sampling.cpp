#include "ptsrc/sky/sampling.hpp"
#include "ptsrc/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace ptsrc::sky {

namespace {

inline int wrap_index(int i, int n) {
    int r = i % n;
    return r < 0 ? r + n : r;
}

inline double value_or_zero(const Matrix2Dd& map, int y, int x) {
    if (y < 0 || x < 0 || y >= map.rows() || x >= map.cols()) return 0.0;
    return map(y, x);
}

} // namespace

double interpolate(const Matrix2Dd& map, const PixPos& pix, int order) {
    if (!std::isfinite(pix.y) || !std::isfinite(pix.x)) return 0.0;
    if (order == 0) {
        return value_or_zero(map, core::nint(pix.y), core::nint(pix.x));
    }

    const int y0 = static_cast<int>(std::floor(pix.y));
    const int x0 = static_cast<int>(std::floor(pix.x));
    const double fy = pix.y - y0;
    const double fx = pix.x - x0;
    return (1.0 - fy) * (1.0 - fx) * value_or_zero(map, y0, x0) +
           (1.0 - fy) * fx * value_or_zero(map, y0, x0 + 1) +
           fy * (1.0 - fx) * value_or_zero(map, y0 + 1, x0) +
           fy * fx * value_or_zero(map, y0 + 1, x0 + 1);
}

Matrix2Dd extract(const Matrix2Dd& map, const PixBox& box) {
    Matrix2Dd out = Matrix2Dd::Zero(std::max(0, box.height()), std::max(0, box.width()));
    const PixBox inside = intersect(box, PixBox{0, 0, static_cast<int>(map.rows()),
                                                static_cast<int>(map.cols())});
    if (inside.empty()) return out;
    out.block(inside.y0 - box.y0, inside.x0 - box.x0, inside.height(), inside.width()) =
        map.block(inside.y0, inside.x0, inside.height(), inside.width());
    return out;
}

void insert_add(Matrix2Dd& map, const PixBox& box, const Matrix2Dd& patch, bool wrap) {
    const int ny = static_cast<int>(map.rows());
    const int nx = static_cast<int>(map.cols());
    for (int py = 0; py < patch.rows(); ++py) {
        int y = box.y0 + py;
        if (wrap) {
            y = wrap_index(y, ny);
        } else if (y < 0 || y >= ny) {
            continue;
        }
        for (int px = 0; px < patch.cols(); ++px) {
            int x = box.x0 + px;
            if (wrap) {
                x = wrap_index(x, nx);
            } else if (x < 0 || x >= nx) {
                continue;
            }
            map(y, x) += patch(py, px);
        }
    }
}

void add_patch(Matrix2Dd& map, const Patch& patch, double scale) {
    const PixBox inside = intersect(patch.box, PixBox{0, 0, static_cast<int>(map.rows()),
                                                      static_cast<int>(map.cols())});
    if (inside.empty()) return;
    map.block(inside.y0, inside.x0, inside.height(), inside.width()) +=
        scale * patch.data.block(inside.y0 - patch.box.y0, inside.x0 - patch.box.x0,
                                 inside.height(), inside.width());
}

double overlap_dot(const Patch& a, const Patch& b) {
    const PixBox o = intersect(a.box, b.box);
    if (o.empty()) return 0.0;
    return (a.data.block(o.y0 - a.box.y0, o.x0 - a.box.x0, o.height(), o.width()).array() *
            b.data.block(o.y0 - b.box.y0, o.x0 - b.box.x0, o.height(), o.width()).array()).sum();
}

Matrix2Dd roll(const Matrix2Dd& map, int dy, int dx) {
    const int ny = static_cast<int>(map.rows());
    const int nx = static_cast<int>(map.cols());
    Matrix2Dd out(ny, nx);
    for (int y = 0; y < ny; ++y) {
        const int sy = wrap_index(y - dy, ny);
        for (int x = 0; x < nx; ++x) {
            out(y, x) = map(sy, wrap_index(x - dx, nx));
        }
    }
    return out;
}

Matrix2Dd thumbnail(const Matrix2Dd& map, int size, bool normalize) {
    const int s = std::min({size, static_cast<int>(map.rows()), static_cast<int>(map.cols())});
    Matrix2Dd shifted = roll(map, s / 2, s / 2);
    Matrix2Dd out = shifted.topLeftCorner(s, s);
    if (normalize) out /= map(0, 0);
    return out;
}

} // namespace ptsrc::sky
