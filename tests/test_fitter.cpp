#include "ptsrc/beam/beam.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/fitting/amplitude_fitter.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;

namespace {

config::FitterConfig test_config() {
    config::FitterConfig cfg;
    cfg.pixwin = false;
    return cfg;
}

config::BeamConfig test_beam_config() {
    config::BeamConfig cfg;
    cfg.profile_samples = 1001;
    return cfg;
}

} // namespace

TEST_CASE("inside_margin_selects_interior_pixels") {
    const std::vector<PixPos> pix = {{5.0, 5.0}, {4.9, 50.0}, {50.0, 94.9}, {95.0, 50.0}, {50.0, 50.0}};
    const auto inner = fitting::inside_margin(pix, 100, 100, 5.0);
    REQUIRE(inner == std::vector<int>{0, 2, 4});

    std::vector<PixPos> kept;
    for (int i : inner) kept.push_back(pix[i]);
    REQUIRE(fitting::inside_margin(kept, 100, 100, 5.0) == std::vector<int>{0, 1, 2});
    REQUIRE(fitting::inside_margin({}, 100, 100, 5.0).empty());
}

TEST_CASE("fitter_recovers_amplitude_at_known_position") {
    const int n = 128;
    const double amp = 40.0;
    const auto geom = test::car_geometry(n, n, 0.5);
    const auto beam = beam::Beam::from_spec("1.4");
    const SkyPos truth = geom.pix_to_sky(PixPos{64.0, 64.0});

    Matrix2Dd map = test::white_noise(n, n, 1.0, 21);
    test::add_gaussian_source(map, geom, truth, amp, 1.4);

    std::ostringstream log;
    const core::EventSink sink{"test", &log};
    const auto res = fitting::fit_amplitudes(map, Matrix2Dd::Ones(n, n), geom, {truth}, beam,
                                             test_config(), test_beam_config(), nullptr, &sink);

    REQUIRE(res.fit_inds == std::vector<int>{0});
    REQUIRE(res.damp[0] > 0.0);
    REQUIRE(res.damp[0] < 1.0);
    REQUIRE(std::abs(res.amp[0] - amp) < 3.0 * res.damp[0]);
    REQUIRE(res.icov(0, 0) == Catch::Approx(1.0 / (res.damp[0] * res.damp[0])));
    REQUIRE(res.local_amps[0] == Catch::Approx(res.amp[0]).epsilon(0.02));
    REQUIRE(log.str().find("\"fitter_pass\"") != std::string::npos);
}

TEST_CASE("fitter_separates_blended_neighbors") {
    const int n = 128;
    const auto geom = test::car_geometry(n, n, 0.5);
    const auto beam = beam::Beam::from_spec("1.4");
    const SkyPos a = geom.pix_to_sky(PixPos{64.0, 61.0});
    const SkyPos b = geom.pix_to_sky(PixPos{64.0, 65.0});

    Matrix2Dd map = test::white_noise(n, n, 1.0, 22);
    test::add_gaussian_source(map, geom, a, 30.0, 1.4);
    test::add_gaussian_source(map, geom, b, -15.0, 1.4);

    const auto res = fitting::fit_amplitudes(map, Matrix2Dd::Ones(n, n), geom, {a, b}, beam,
                                             test_config(), test_beam_config());
    REQUIRE(res.fit_inds.size() == 2);
    REQUIRE(std::abs(res.amp[0] - 30.0) < 3.0 * res.damp[0]);
    REQUIRE(std::abs(res.amp[1] + 15.0) < 3.0 * res.damp[1]);

    // Overlapping templates are correlated
    REQUIRE(res.icov(0, 1) > 0.0);
    REQUIRE(res.icov(0, 1) == Catch::Approx(res.icov(1, 0)));
}

TEST_CASE("fitter_reports_singular_system_for_coincident_sources") {
    const int n = 128;
    const auto geom = test::car_geometry(n, n, 0.5);
    const auto beam = beam::Beam::from_spec("1.4");
    const SkyPos pos = geom.pix_to_sky(PixPos{64.0, 64.0});

    Matrix2Dd map = test::white_noise(n, n, 1.0, 23);
    test::add_gaussian_source(map, geom, pos, 40.0, 1.4);

    // Identical templates make the inverse covariance rank one
    REQUIRE_THROWS_AS(fitting::fit_amplitudes(map, Matrix2Dd::Ones(n, n), geom, {pos, pos}, beam,
                                              test_config(), test_beam_config()),
                      SolverError);
}

TEST_CASE("fitter_drops_positions_near_edges") {
    const int n = 128;
    const auto geom = test::car_geometry(n, n, 0.5);
    const auto beam = beam::Beam::from_spec("1.4");
    const Matrix2Dd map = test::white_noise(n, n, 1.0, 23);

    // apod + apod_margin = 25 for the first cut, 35 for the final one
    const std::vector<SkyPos> pos = {geom.pix_to_sky(PixPos{20.0, 64.0}),
                                     geom.pix_to_sky(PixPos{64.0, 30.0}),
                                     geom.pix_to_sky(PixPos{64.0, 64.0})};
    const auto res = fitting::fit_amplitudes(map, Matrix2Dd::Ones(n, n), geom, pos, beam,
                                             test_config(), test_beam_config());
    REQUIRE(res.fit_inds == std::vector<int>{2});
    REQUIRE(res.amp.size() == 1);
    REQUIRE(res.icov.rows() == 1);
}

TEST_CASE("fitter_prior_pulls_amplitude") {
    const int n = 128;
    const auto geom = test::car_geometry(n, n, 0.5);
    const auto beam = beam::Beam::from_spec("1.4");
    const SkyPos truth = geom.pix_to_sky(PixPos{64.0, 64.0});

    Matrix2Dd map = test::white_noise(n, n, 1.0, 24);
    test::add_gaussian_source(map, geom, truth, 40.0, 1.4);

    catalog::Prior prior{VectorXd::Zero(1), VectorXd::Constant(1, 1e6)};
    const auto res = fitting::fit_amplitudes(map, Matrix2Dd::Ones(n, n), geom, {truth}, beam,
                                             test_config(), test_beam_config(), &prior);
    REQUIRE(std::abs(res.amp[0]) < 0.1);
    REQUIRE(res.damp[0] < 1e-2);

    catalog::Prior wrong{VectorXd::Zero(2), VectorXd::Ones(2)};
    REQUIRE_THROWS_AS(fitting::fit_amplitudes(map, Matrix2Dd::Ones(n, n), geom, {truth}, beam,
                                              test_config(), test_beam_config(), &wrong),
                      PipelineError);
}

TEST_CASE("fitter_without_weight_returns_zero_amplitudes") {
    const int n = 96;
    const auto geom = test::car_geometry(n, n, 0.5);
    const auto beam = beam::Beam::from_spec("1.4");
    const SkyPos center = geom.pix_to_sky(PixPos{48.0, 48.0});

    const auto res = fitting::fit_amplitudes(test::white_noise(n, n, 1.0, 25), Matrix2Dd::Zero(n, n),
                                             geom, {center}, beam, test_config(), test_beam_config());
    REQUIRE(res.fit_inds == std::vector<int>{0});
    REQUIRE(res.amp[0] == 0.0);
    REQUIRE(res.damp[0] == 0.0);
}
