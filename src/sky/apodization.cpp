#include "ptsrc/sky/apodization.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace ptsrc::sky {

static std::vector<double> cosine_ramp(int w) {
    std::vector<double> a(w);
    for (int i = 0; i < w; ++i) {
        const double t = (w > 1) ? M_PI * i / (w - 1) : 0.0;
        a[i] = 0.5 * (1.0 - std::cos(t));
    }
    return a;
}

Matrix2Dd apod_edges(int ny, int nx, int width) {
    Matrix2Dd w = Matrix2Dd::Ones(ny, nx);
    if (width <= 0) return w;

    const int wy = std::min(width, ny);
    const int wx = std::min(width, nx);
    const std::vector<double> ay = cosine_ramp(wy);
    const std::vector<double> ax = cosine_ramp(wx);

    for (int i = 0; i < wy; ++i) {
        w.row(i) *= ay[i];
        w.row(ny - 1 - i) *= ay[i];
    }
    for (int i = 0; i < wx; ++i) {
        w.col(i) *= ax[i];
        w.col(nx - 1 - i) *= ax[i];
    }
    return w;
}

Matrix2Dd distance_to_invalid(const Matrix2Dd& valid) {
    const int h = static_cast<int>(valid.rows());
    const int w = static_cast<int>(valid.cols());

    cv::Mat mask(h, w, CV_8U);
    long ninvalid = 0;
    for (int y = 0; y < h; ++y) {
        auto* row = mask.ptr<uint8_t>(y);
        for (int x = 0; x < w; ++x) {
            const bool ok = valid(y, x) > 0.0;
            row[x] = ok ? 255 : 0;
            if (!ok) ++ninvalid;
        }
    }
    if (ninvalid == 0) {
        return Matrix2Dd::Constant(h, w, std::numeric_limits<double>::infinity());
    }

    cv::Mat dist;
    cv::distanceTransform(mask, dist, cv::DIST_L2, cv::DIST_MASK_PRECISE, CV_32F);

    Matrix2Dd out(h, w);
    for (int y = 0; y < h; ++y) {
        const float* row = dist.ptr<float>(y);
        for (int x = 0; x < w; ++x) {
            out(y, x) = static_cast<double>(row[x]);
        }
    }
    return out;
}

Matrix2Dd apod_holes(const Matrix2Dd& weight, double pixrad) {
    Matrix2Dd dist = distance_to_invalid(weight);
    Matrix2Dd out(dist.rows(), dist.cols());
    for (Eigen::Index i = 0; i < dist.size(); ++i) {
        const double t = std::min(1.0, dist.data()[i] / pixrad);
        out.data()[i] = 0.5 * (1.0 - std::cos(M_PI * t));
    }
    return out;
}

} // namespace ptsrc::sky
