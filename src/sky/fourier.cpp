#include "ptsrc/sky/fourier.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <opencv2/core.hpp>

#include <cmath>
#include <cstring>
#include <vector>

namespace ptsrc::sky {

namespace {

template <typename T>
void copy_from_mat(const cv::Mat& src, T* dst, int rows, int cols) {
    const size_t row_bytes = static_cast<size_t>(cols) * sizeof(T);
    if (src.isContinuous()) {
        std::memcpy(dst, src.ptr<T>(), row_bytes * static_cast<size_t>(rows));
    } else {
        for (int r = 0; r < rows; ++r) {
            std::memcpy(dst + static_cast<size_t>(r) * cols, src.ptr<T>(r), row_bytes);
        }
    }
}

double sinc(double x) {
    if (x == 0.0) return 1.0;
    const double px = M_PI * x;
    return std::sin(px) / px;
}

} // namespace

ComplexMatrix fft(const Matrix2Dd& map) {
    const int h = static_cast<int>(map.rows());
    const int w = static_cast<int>(map.cols());
    ComplexMatrix out(h, w);
    if (h == 0 || w == 0) return out;

    cv::Mat src(h, w, CV_64F, const_cast<double*>(map.data()));
    cv::Mat F;
    cv::dft(src, F, cv::DFT_COMPLEX_OUTPUT);
    copy_from_mat(F, reinterpret_cast<cv::Vec2d*>(out.data()), h, w);
    return out;
}

Matrix2Dd ifft_real(const ComplexMatrix& fmap) {
    const int h = static_cast<int>(fmap.rows());
    const int w = static_cast<int>(fmap.cols());
    Matrix2Dd out(h, w);
    if (h == 0 || w == 0) return out;

    cv::Mat src(h, w, CV_64FC2, const_cast<std::complex<double>*>(fmap.data()));
    cv::Mat inv;
    cv::dft(src, inv, cv::DFT_INVERSE | cv::DFT_SCALE | cv::DFT_COMPLEX_OUTPUT);

    std::vector<cv::Mat> planes(2);
    cv::split(inv, planes);
    copy_from_mat(planes[0], out.data(), h, w);
    return out;
}

Matrix2Dd filter_map(const Matrix2Dd& map, const Matrix2Dd& kernel) {
    ComplexMatrix f = fft(map);
    f.array() *= kernel.array().cast<std::complex<double>>();
    return ifft_real(f);
}

Matrix2Dd fourier_shift(const Matrix2Dd& map, double dy, double dx) {
    const int h = static_cast<int>(map.rows());
    const int w = static_cast<int>(map.cols());
    const VectorXd fy = fftfreq(h);
    const VectorXd fx = fftfreq(w);

    ComplexMatrix f = fft(map);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const double phase = -2.0 * M_PI * (fy[y] * dy + fx[x] * dx);
            f(y, x) *= std::complex<double>(std::cos(phase), std::sin(phase));
        }
    }
    return ifft_real(f);
}

Matrix2Dd apply_pixel_window(const Matrix2Dd& map, int power) {
    const int h = static_cast<int>(map.rows());
    const int w = static_cast<int>(map.cols());
    const VectorXd fy = fftfreq(h);
    const VectorXd fx = fftfreq(w);

    Matrix2Dd kernel(h, w);
    for (int y = 0; y < h; ++y) {
        const double wy = sinc(fy[y]);
        for (int x = 0; x < w; ++x) {
            kernel(y, x) = std::pow(wy * sinc(fx[x]), power);
        }
    }
    return filter_map(map, kernel);
}

} // namespace ptsrc::sky
