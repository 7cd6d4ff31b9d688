#include "ptsrc/config/configuration.hpp"
#include "ptsrc/core/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;

TEST_CASE("config_defaults_validate") {
    config::Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.finder.snmin == Catch::Approx(3.5));
    REQUIRE(cfg.finder.npass == 2);
    REQUIRE(cfg.finder.block_ratio == Catch::Approx(2.0));
    REQUIRE(cfg.finder.highl_cut == 0.0);
    REQUIRE(cfg.regions.spec == "full");
}

TEST_CASE("config_parses_sections_and_keeps_missing_defaults") {
    YAML::Node node = YAML::Load(R"(
beam:
  spec: "2.2"
finder:
  snmin: 5.0
  nblock: 4
  pixwin: false
fitter:
  npass: 3
  prior_variability: 0.5
artifacts:
  enabled: false
  jumprad_arcmin: 5
merge:
  rlim_arcmin: 0.5
regions:
  spec: tile:240
  pad: 40
output:
  catalog_format: fits
)");

    auto cfg = config::Config::from_yaml(node);
    REQUIRE(cfg.beam.spec == "2.2");
    REQUIRE(cfg.finder.snmin == Catch::Approx(5.0));
    REQUIRE(cfg.finder.nblock == 4);
    REQUIRE_FALSE(cfg.finder.pixwin);
    REQUIRE(cfg.finder.apod == 15);
    REQUIRE(cfg.fitter.npass == 3);
    REQUIRE(cfg.fitter.prior_variability == Catch::Approx(0.5));
    REQUIRE_FALSE(cfg.artifacts.enabled);
    REQUIRE(cfg.artifacts.jumprad_arcmin == Catch::Approx(5.0));
    REQUIRE(cfg.artifacts.vlim == Catch::Approx(0.005));
    REQUIRE(cfg.merge.rlim_arcmin == Catch::Approx(0.5));
    REQUIRE(cfg.regions.spec == "tile:240");
    REQUIRE(cfg.regions.pad == 40);
    REQUIRE(cfg.output.catalog_format == "fits");
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_rejects_out_of_range_values") {
    auto cfg = config::Config::from_yaml(YAML::Load("finder:\n  block_ratio: 1.0\n"));
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config::from_yaml(YAML::Load("output:\n  catalog_format: csv\n"));
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config::from_yaml(YAML::Load("fitter:\n  indep_tol: 2\n"));
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_bad_type_is_config_error") {
    REQUIRE_THROWS_AS(config::Config::from_yaml(YAML::Load("finder:\n  npass: many\n")),
                      ConfigError);
}

TEST_CASE("config_save_and_load_round_trip") {
    const fs::path dir = test::temp_dir("config");
    config::Config cfg;
    cfg.finder.snmin = 4.25;
    cfg.fitter.noise_seed = 7;
    cfg.regions.spec = "box:-1:1:1:-1";
    cfg.save(dir / "config.yaml");

    const auto loaded = config::Config::load(dir / "config.yaml");
    REQUIRE(loaded.finder.snmin == Catch::Approx(4.25));
    REQUIRE(loaded.fitter.noise_seed == 7);
    REQUIRE(loaded.regions.spec == "box:-1:1:1:-1");
    REQUIRE_THROWS_AS(config::Config::load(dir / "missing.yaml"), ConfigError);
    fs::remove_all(dir);
}
