#include "ptsrc/noise/noise_model.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/utils.hpp"
#include "ptsrc/sky/apodization.hpp"
#include "ptsrc/sky/fourier.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace ptsrc::noise {

Matrix2Dd smooth_ps_gauss(const Matrix2Dd& ps, const sky::Geometry& geom, double lsigma) {
    auto [ly, lx] = geom.laxes();
    const double sig_y = ly.size() > 1 ? std::abs(lsigma / ly[1]) : 0.0;
    const double sig_x = lx.size() > 1 ? std::abs(lsigma / lx[1]) : 0.0;

    const VectorXd ky = sky::fftfreq(static_cast<int>(ps.rows())) * sig_y;
    const VectorXd kx = sky::fftfreq(static_cast<int>(ps.cols())) * sig_x;

    Matrix2Dd kernel(ps.rows(), ps.cols());
    for (Eigen::Index y = 0; y < ps.rows(); ++y) {
        for (Eigen::Index x = 0; x < ps.cols(); ++x) {
            kernel(y, x) = std::exp(-0.5 * (ky[y] * ky[y] + kx[x] * kx[x]));
        }
    }
    return sky::filter_map(ps, kernel);
}

Matrix2Dd measure_noise(const Matrix2Dd& noise_map, const sky::Geometry& geom,
                        int margin, int apod, double ps_res) {
    const int ny = static_cast<int>(noise_map.rows());
    const int nx = static_cast<int>(noise_map.cols());
    const int iy = ny - 2 * margin;
    const int ix = nx - 2 * margin;
    if (iy <= 2 || ix <= 2) {
        throw PipelineError("Map of " + std::to_string(ny) + "x" + std::to_string(nx) +
                            " pixels is too small for a noise margin of " + std::to_string(margin));
    }

    Matrix2Dd window = Matrix2Dd::Zero(ny, nx);
    window.block(margin, margin, iy, ix) = sky::apod_edges(iy, ix, apod);

    const Matrix2Dd masked = (noise_map.array() * window.array()).matrix();
    const ComplexMatrix f = sky::fft(masked);
    Matrix2Dd ps = f.cwiseAbs2() / static_cast<double>(geom.npix());
    ps /= window.array().square().mean();

    return smooth_ps_gauss(ps, geom, ps_res);
}

Matrix2Dd flatten_high_l(const Matrix2Dd& ps, const sky::Geometry& geom, double lcut) {
    const Matrix2Dd l = geom.modlmap();
    double sum = 0.0;
    long count = 0;
    for (Eigen::Index i = 0; i < ps.size(); ++i) {
        const double li = l.data()[i];
        if (li < lcut && li > 0.9 * lcut) {
            sum += ps.data()[i];
            ++count;
        }
    }
    Matrix2Dd out = ps;
    if (count == 0) return out;

    const double ref = sum / count;
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        if (l.data()[i] > lcut) out.data()[i] = ref;
    }
    return out;
}

Matrix2Dd build_filter(const Matrix2Dd& ps, const Matrix2Dd& beam2d) {
    Matrix2Dd filter = (beam2d.array() / ps.array()).matrix();

    Matrix2Dd m = sky::ifft_real(beam2d.cast<std::complex<double>>());
    m /= m(0, 0);

    const double norm = sky::filter_map(m, filter)(0, 0);
    filter /= norm;
    return filter;
}

double safe_mean(const std::vector<double>& values, int bsize) {
    const size_t n = values.size();
    if (n == 0) return 0.0;
    const size_t nblock = n / static_cast<size_t>(bsize);
    if (nblock <= 1) {
        double s = 0.0;
        for (double v : values) s += v;
        return s / static_cast<double>(n);
    }

    std::vector<double> means;
    means.reserve(nblock + 1);
    for (size_t b = 0; b < nblock; ++b) {
        double s = 0.0;
        for (size_t i = b * bsize; i < (b + 1) * bsize; ++i) s += values[i];
        means.push_back(s / bsize);
    }
    double tail = 0.0;
    const size_t start = (nblock - 1) * bsize;
    for (size_t i = start; i < n; ++i) tail += values[i];
    means.push_back(tail / static_cast<double>(n - start));

    return core::median_of(means);
}

Matrix2Dd snmap_norm(const Matrix2Dd& map, int bsize) {
    const int ny = static_cast<int>(map.rows());
    const int nx = static_cast<int>(map.cols());
    Matrix2Dd norm = Matrix2Dd::Ones(ny, nx);

    // Maps smaller than one block form a single block
    const int nby = std::max(1, ny / bsize);
    const int nbx = std::max(1, nx / bsize);

    std::vector<double> vals;
    for (int by = 0; by < nby; ++by) {
        const int y1 = by * bsize;
        const int y2 = (by < nby - 1) ? (by + 1) * bsize : ny;
        for (int bx = 0; bx < nbx; ++bx) {
            const int x1 = bx * bsize;
            const int x2 = (bx < nbx - 1) ? (bx + 1) * bsize : nx;

            vals.clear();
            for (int y = y1; y < y2; ++y) {
                for (int x = x1; x < x2; ++x) {
                    const double v = map(y, x);
                    if (v != 0.0) vals.push_back(v * v);
                }
            }
            if (vals.empty()) continue;
            norm.block(y1, x1, y2 - y1, x2 - x1).setConstant(std::sqrt(safe_mean(vals)));
        }
    }
    return norm;
}

Matrix2Dd sim_initial_noise(const Matrix2Dd& weight, const sky::Geometry& geom,
                            std::uint32_t seed, double lknee, double alpha) {
    std::mt19937 gen(seed);
    std::normal_distribution<double> normal(0.0, 1.0);

    Matrix2Dd white(weight.rows(), weight.cols());
    for (Eigen::Index i = 0; i < white.size(); ++i) {
        white.data()[i] = normal(gen);
    }

    Matrix2Dd profile = geom.modlmap();
    for (Eigen::Index i = 0; i < profile.size(); ++i) {
        profile.data()[i] = 1.0 + std::pow((profile.data()[i] + 0.5) / lknee, alpha);
    }
    profile(0, 0) = 0.0;

    Matrix2Dd noise = sky::filter_map(white, profile);
    for (Eigen::Index i = 0; i < noise.size(); ++i) {
        const double w = weight.data()[i];
        if (w > 0.0) noise.data()[i] /= std::sqrt(w);
    }
    return noise;
}

} // namespace ptsrc::noise
