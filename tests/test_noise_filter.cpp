#include "ptsrc/beam/beam.hpp"
#include "ptsrc/noise/noise_model.hpp"
#include "ptsrc/sky/fourier.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;

namespace {

double filtered_template_peak(const Matrix2Dd& ps, const Matrix2Dd& beam2d) {
    const Matrix2Dd filter = noise::build_filter(ps, beam2d);
    Matrix2Dd m = sky::ifft_real(beam2d.cast<std::complex<double>>());
    m /= m(0, 0);
    return sky::filter_map(m, filter)(0, 0);
}

} // namespace

TEST_CASE("matched_filter_has_unit_peak_response") {
    const auto geom = test::car_geometry(64, 64, 0.5);
    const Matrix2Dd beam2d = beam::Beam::gaussian(1.4).transform_2d(geom);

    const Matrix2Dd flat = Matrix2Dd::Constant(64, 64, 3.0);
    REQUIRE(filtered_template_peak(flat, beam2d) == Catch::Approx(1.0).epsilon(1e-10));

    // Red spectrum
    Matrix2Dd red = geom.modlmap();
    red = (1.0 + (1000.0 / (red.array() + 50.0)).square()).matrix();
    REQUIRE(filtered_template_peak(red, beam2d) == Catch::Approx(1.0).epsilon(1e-10));
}

TEST_CASE("spectrum_smoothing_preserves_mean") {
    const auto geom = test::car_geometry(32, 48, 0.5);
    const Matrix2Dd flat = noise::smooth_ps_gauss(Matrix2Dd::Constant(32, 48, 2.5), geom, 2000.0);
    REQUIRE((flat.array() - 2.5).abs().maxCoeff() < 1e-10);

    Matrix2Dd spike = Matrix2Dd::Zero(32, 48);
    spike(0, 0) = 1.0;
    const Matrix2Dd smooth = noise::smooth_ps_gauss(spike, geom, 2000.0);
    REQUIRE(smooth.sum() == Catch::Approx(1.0));
    REQUIRE(smooth(0, 0) < 1.0);
}

TEST_CASE("measure_noise_recovers_white_noise_level") {
    const auto geom = test::car_geometry(128, 128, 0.5);
    const Matrix2Dd noise = test::white_noise(128, 128, 2.0, 11);
    const Matrix2Dd ps = noise::measure_noise(noise, geom, 10, 10, 2000.0);
    REQUIRE(ps.mean() == Catch::Approx(4.0).epsilon(0.1));
}

TEST_CASE("measure_noise_rejects_too_small_maps") {
    const auto geom = test::car_geometry(20, 20, 0.5);
    REQUIRE_THROWS(noise::measure_noise(Matrix2Dd::Ones(20, 20), geom, 10, 10, 2000.0));
}

TEST_CASE("flatten_high_l_replaces_power_above_cut") {
    const auto geom = test::car_geometry(64, 64, 0.5);
    const Matrix2Dd l = geom.modlmap();
    const Matrix2Dd ps = (1.0 + l.array() / 1000.0).matrix();
    const double lcut = 10000.0;
    const Matrix2Dd flat = noise::flatten_high_l(ps, geom, lcut);

    double ref = -1.0;
    for (Eigen::Index i = 0; i < ps.size(); ++i) {
        const double li = l.data()[i];
        if (li > lcut) {
            if (ref < 0.0) ref = flat.data()[i];
            REQUIRE(flat.data()[i] == ref);
        } else {
            REQUIRE(flat.data()[i] == ps.data()[i]);
        }
    }
    REQUIRE(ref > 1.0 + 0.9 * lcut / 1000.0);
    REQUIRE(ref < 1.0 + lcut / 1000.0);
}

TEST_CASE("safe_mean_is_median_of_block_means") {
    std::vector<double> v(1000);
    for (int i = 0; i < 1000; ++i) v[i] = i;
    REQUIRE(noise::safe_mean(v, 100) == Catch::Approx(549.5));

    v[3] = 1e9;
    REQUIRE(noise::safe_mean(v, 100) == Catch::Approx(649.5));

    std::vector<double> few{1.0, 2.0, 6.0};
    REQUIRE(noise::safe_mean(few, 100) == Catch::Approx(3.0));
}

TEST_CASE("snmap_norm_broadcasts_block_rms") {
    Matrix2Dd m = Matrix2Dd::Zero(20, 20);
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 10; ++x) m(y, x) = ((x + y) % 2) ? 2.0 : -2.0;
    }
    m.bottomRows(10).setConstant(3.0);

    const Matrix2Dd norm = noise::snmap_norm(m, 10);
    REQUIRE(norm(0, 0) == Catch::Approx(2.0));
    REQUIRE(norm(9, 9) == Catch::Approx(2.0));
    REQUIRE(norm(5, 15) == 1.0);
    REQUIRE(norm(15, 3) == Catch::Approx(3.0));
    REQUIRE(norm(19, 19) == Catch::Approx(3.0));

    // Smaller than one block
    const Matrix2Dd small = noise::snmap_norm(Matrix2Dd::Constant(5, 7, -0.5), 240);
    REQUIRE((small.array() - 0.5).abs().maxCoeff() < 1e-12);
}

TEST_CASE("initial_noise_is_deterministic_and_weight_scaled") {
    const auto geom = test::car_geometry(32, 32, 0.5);
    const Matrix2Dd w1 = Matrix2Dd::Ones(32, 32);
    const Matrix2Dd w4 = Matrix2Dd::Constant(32, 32, 4.0);

    const Matrix2Dd a = noise::sim_initial_noise(w1, geom, 5);
    const Matrix2Dd b = noise::sim_initial_noise(w1, geom, 5);
    const Matrix2Dd c = noise::sim_initial_noise(w1, geom, 6);
    const Matrix2Dd d = noise::sim_initial_noise(w4, geom, 5);

    REQUIRE((a - b).cwiseAbs().maxCoeff() == 0.0);
    REQUIRE((a - c).cwiseAbs().maxCoeff() > 0.0);
    REQUIRE((d - 0.5 * a).cwiseAbs().maxCoeff() < 1e-12);
    REQUIRE(std::abs(a.mean()) < 1e-10);
}
