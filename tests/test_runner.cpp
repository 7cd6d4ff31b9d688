#include "runner_pipeline.hpp"

#include "ptsrc/catalog/catalog_io.hpp"
#include "ptsrc/core/events.hpp"
#include "ptsrc/io/fits_io.hpp"

#include "test_helpers.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;
using core::json;

namespace {

// Redirects std::cout for the lifetime of the object
class CaptureStdout {
public:
    CaptureStdout() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStdout() { std::cout.rdbuf(old_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

std::vector<json> parse_events(const std::string& text) {
    std::vector<json> events;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line[0] == '{') events.push_back(json::parse(line));
    }
    return events;
}

int count_type(const std::vector<json>& events, const std::string& type) {
    int n = 0;
    for (const auto& e : events) {
        if (e.at("type").get<std::string>() == type) ++n;
    }
    return n;
}

catalog::Entry entry_at(const SkyPos& pos, double amp) {
    catalog::Entry e;
    e.ra = pos.ra;
    e.dec = pos.dec;
    e.amp[0] = amp;
    e.damp[0] = 1.0;
    e.flux[0] = amp * 1e-3;
    e.dflux[0] = 1e-3;
    e.npix = 5.0;
    return e;
}

} // namespace

TEST_CASE("merge_catalogs_combines_duplicates") {
    const fs::path dir = test::temp_dir("runner_merge");
    const auto geom = test::car_geometry(64, 64, 0.5);
    const SkyPos a = geom.pix_to_sky(PixPos{20.0, 20.0});
    const SkyPos b = geom.pix_to_sky(PixPos{40.0, 40.0});

    catalog::write_catalog(dir / "a.txt", {entry_at(a, 100.0), entry_at(b, 50.0)});
    catalog::write_catalog(dir / "b.txt", {entry_at(a, 101.0)});

    runner::CommandOptions opts;
    opts.inputs = {(dir / "a.txt").string(), (dir / "b.txt").string()};
    opts.out_dir = (dir / "merged.txt").string();
    opts.run_id = "merge";

    int rc = 0;
    std::string text;
    {
        CaptureStdout capture;
        rc = runner::run_merge_catalogs_command(opts);
        text = capture.str();
    }
    REQUIRE(rc == 0);
    REQUIRE(catalog::read_catalog(dir / "merged.txt").size() == 2);

    const auto events = parse_events(text);
    REQUIRE(!events.empty());
    REQUIRE(events.back().at("type").get<std::string>() == "run_end");
    REQUIRE(events.back().at("success").get<bool>());
}

TEST_CASE("merge_catalogs_ends_run_on_unreadable_input") {
    const fs::path dir = test::temp_dir("runner_merge_missing");

    runner::CommandOptions opts;
    opts.inputs = {(dir / "missing.txt").string()};
    opts.out_dir = (dir / "merged.txt").string();
    opts.run_id = "merge";

    int rc = 0;
    std::string text;
    {
        CaptureStdout capture;
        rc = runner::run_merge_catalogs_command(opts);
        text = capture.str();
    }
    REQUIRE(rc == 1);
    REQUIRE_FALSE(fs::exists(dir / "merged.txt"));

    const auto events = parse_events(text);
    REQUIRE(count_type(events, "run_start") == 1);
    REQUIRE(count_type(events, "error") == 1);
    REQUIRE(events.back().at("type").get<std::string>() == "run_end");
    REQUIRE_FALSE(events.back().at("success").get<bool>());
    REQUIRE(events.back().at("status").get<std::string>() == "error");
}

TEST_CASE("fit_skips_region_with_singular_system") {
    const fs::path dir = test::temp_dir("runner_fit_singular");
    const int n = 128;
    const auto geom = test::car_geometry(n, n, 0.5);
    const SkyPos pos = geom.pix_to_sky(PixPos{64.0, 64.0});

    Matrix2Dd map = test::white_noise(n, n, 1.0, 31);
    test::add_gaussian_source(map, geom, pos, 40.0, 1.4);
    io::write_fits_map(dir / "map.fits", map, geom);
    io::write_fits_map(dir / "ivar.fits", Matrix2Dd::Ones(n, n), geom);

    // The same source listed twice
    catalog::write_catalog(dir / "input.txt", {entry_at(pos, 40.0), entry_at(pos, 40.0)});

    runner::CommandOptions opts;
    opts.map_path = (dir / "map.fits").string();
    opts.ivar_path = (dir / "ivar.fits").string();
    opts.catalog_path = (dir / "input.txt").string();
    opts.out_dir = (dir / "out").string();
    opts.beam_spec = "1.4";
    opts.run_id = "fit";

    int rc = 0;
    std::string text;
    {
        CaptureStdout capture;
        rc = runner::run_fit_command(opts);
        text = capture.str();
    }
    REQUIRE(rc == 0);

    const auto events = parse_events(text);
    REQUIRE(count_type(events, "warning") == 1);
    REQUIRE(count_type(events, "error") == 0);
    REQUIRE(events.back().at("type").get<std::string>() == "run_end");
    REQUIRE(events.back().at("success").get<bool>());
    REQUIRE(events.back().at("status").get<std::string>() == "partial");

    REQUIRE(fs::exists(dir / "out" / "logs" / "run_events.jsonl"));
    REQUIRE(catalog::read_catalog(dir / "out" / "cat_fit.txt").empty());
}
