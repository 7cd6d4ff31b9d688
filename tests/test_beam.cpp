#include "ptsrc/beam/beam.hpp"
#include "ptsrc/core/errors.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;

TEST_CASE("gaussian_beam_from_fwhm_spec") {
    const auto beam = beam::Beam::from_spec("1.4");
    const double sigma = 1.4 * core::kArcmin * core::kFwhmToSigma;
    REQUIRE(beam.transform().size() == 40000);
    REQUIRE(beam.at(0.0) == Catch::Approx(1.0));
    REQUIRE(beam.at(5000.0) == Catch::Approx(std::exp(-0.5 * std::pow(5000.0 * sigma, 2))));
    REQUIRE(beam.at(1e9) == Catch::Approx(beam.transform().back()));
}

TEST_CASE("beam_file_reads_second_column") {
    const fs::path dir = test::temp_dir("beam");
    {
        std::ofstream out(dir / "beam.txt");
        out << "# l b\n0 1.0\n1 0.5\n2 0.25\n";
    }
    const auto beam = beam::Beam::from_spec((dir / "beam.txt").string());
    REQUIRE(beam.transform().size() == 3);
    REQUIRE(beam.at(0.5) == Catch::Approx(0.75));
    REQUIRE(beam.at(10.0) == Catch::Approx(0.25));

    {
        std::ofstream out(dir / "bad.txt");
        out << "0 x\n";
    }
    REQUIRE_THROWS_AS(beam::Beam::from_spec((dir / "bad.txt").string()), ConfigError);
    REQUIRE_THROWS_AS(beam::Beam::from_spec((dir / "missing.txt").string()), ConfigError);
    REQUIRE_THROWS_AS(beam::Beam::from_spec("-1"), ConfigError);
    fs::remove_all(dir);
}

TEST_CASE("radial_profile_matches_real_space_gaussian") {
    const double fwhm = 2.0;
    const double sigma = fwhm * core::kArcmin * core::kFwhmToSigma;
    const auto beam = beam::Beam::gaussian(fwhm);
    const auto prof = beam.radial_profile(1001, 0.0, 1e-7);

    REQUIRE(prof.b.front() == Catch::Approx(1.0));
    REQUIRE(prof.rmax() > 3.0 * sigma);
    REQUIRE(prof.at(sigma) == Catch::Approx(std::exp(-0.5)).epsilon(2e-3));
    REQUIRE(prof.at(2.0 * prof.rmax()) == 0.0);

    // Solid angle of a Gaussian is 2 pi sigma^2
    REQUIRE(beam::profile_area(prof) == Catch::Approx(2.0 * M_PI * sigma * sigma).epsilon(5e-3));

    const double rad = beam::profile_radius(prof, std::exp(-2.0));
    REQUIRE(rad == Catch::Approx(2.0 * sigma).epsilon(1e-2));
}

TEST_CASE("transform_area_of_gaussian_beam") {
    const double fwhm = 2.0;
    const double sigma = fwhm * core::kArcmin * core::kFwhmToSigma;
    const auto geom = test::car_geometry(128, 128, 0.5);
    const auto beam = beam::Beam::gaussian(fwhm);
    const Matrix2Dd b2d = beam.transform_2d(geom);
    REQUIRE(b2d(0, 0) == Catch::Approx(1.0));
    REQUIRE(beam::transform_area(b2d, geom) ==
            Catch::Approx(2.0 * M_PI * sigma * sigma).epsilon(1e-2));
}
