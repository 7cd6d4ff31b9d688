#include "ptsrc/catalog/artifacts.hpp"
#include "ptsrc/catalog/catalog.hpp"
#include "ptsrc/core/utils.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;

namespace {

catalog::Entry make_entry(double dec_arcmin, double ra_arcmin, double amp, double damp) {
    catalog::Entry e;
    e.dec = dec_arcmin * core::kArcmin;
    e.ra = core::rewind(ra_arcmin * core::kArcmin, M_PI);
    e.amp[0] = amp;
    e.damp[0] = damp;
    e.flux[0] = amp * 1e-3;
    e.dflux[0] = damp * 1e-3;
    e.npix = 10.0;
    return e;
}

} // namespace

TEST_CASE("bright_source_owns_core_and_chain_artifacts") {
    catalog::Catalog cat = {
        make_entry(0.0, 0.0, 1000.0, 1.0),   // owner
        make_entry(5.0, 0.0, 3.0, 1.0),      // chain
        make_entry(10.0, 0.0, 3.0, 1.0),
        make_entry(15.0, 0.0, 3.0, 1.0),
        make_entry(0.0, 1.0, 20.0, 1.0),     // core
        make_entry(0.0, 120.0, 3.0, 1.0),    // beyond the search radius
        make_entry(0.0, -30.0, 3.0, 1.0),    // no chain reaches it
    };

    const auto found = catalog::find_source_artifacts(cat);
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].owner == 0);
    REQUIRE(found[0].artifacts == std::vector<int>{1, 2, 3, 4});
}

TEST_CASE("artifact_search_without_strong_sources") {
    catalog::Catalog cat = {make_entry(0.0, 0.0, 20.0, 1.0), make_entry(1.0, 0.0, 1.0, 1.0)};
    REQUIRE(catalog::find_source_artifacts(cat).empty());
    REQUIRE(catalog::find_source_artifacts({}).empty());
}

TEST_CASE("weaker_owner_inside_tagged_set_is_skipped") {
    catalog::Catalog cat = {
        make_entry(0.0, 0.0, 100000.0, 1.0),
        make_entry(0.0, 1.0, 30.0, 1.0),  // strong, but a core artifact of entry 0
        make_entry(0.0, 1.5, 1.0, 1.0),
    };
    const auto found = catalog::find_source_artifacts(cat);
    REQUIRE(found.size() == 1);
    REQUIRE(found[0].artifacts == std::vector<int>{1, 2});
}

TEST_CASE("merge_duplicates_averages_close_pairs") {
    catalog::Catalog cat = {
        make_entry(0.0, 0.0, 10.0, 1.0),
        make_entry(0.3, 0.0, 9.0, 2.0),
        make_entry(30.0, 0.0, 5.0, 1.0),
    };
    const auto merged = catalog::merge_duplicates(cat, core::kArcmin, 0.25);
    REQUIRE(merged.size() == 2);

    // Inverse variance weights 1 and 1/4
    REQUIRE(merged[0].amp[0] == Catch::Approx(9.8));
    REQUIRE(merged[0].damp[0] == Catch::Approx(1.0));
    REQUIRE(merged[0].dec == Catch::Approx(0.06 * core::kArcmin));

    REQUIRE(merged[1].amp[0] == cat[2].amp[0]);
    REQUIRE(merged[1].dec == cat[2].dec);

    // Already separated catalogs are unchanged
    const auto again = catalog::merge_duplicates(merged, core::kArcmin, 0.25);
    REQUIRE(again.size() == merged.size());
    REQUIRE(again[0].amp[0] == merged[0].amp[0]);
}

TEST_CASE("merge_duplicates_keeps_strongest_of_disagreeing_pair") {
    catalog::Catalog cat = {make_entry(0.0, 0.0, 2.0, 1.0), make_entry(0.0, 0.5, 10.0, 1.0)};
    const auto merged = catalog::merge_duplicates(cat, core::kArcmin, 0.25);
    REQUIRE(merged.size() == 1);
    REQUIRE(merged[0].amp[0] == Catch::Approx(10.0));
    REQUIRE(merged[0].ra == Catch::Approx(0.5 * core::kArcmin));
}

TEST_CASE("merge_duplicates_across_ra_wrap") {
    catalog::Catalog cat = {make_entry(0.0, 0.1, 10.0, 1.0), make_entry(0.0, -0.1, 10.0, 1.0)};
    const auto merged = catalog::merge_duplicates(cat, core::kArcmin, 0.25);
    REQUIRE(merged.size() == 1);
    REQUIRE(core::angular_distance(merged[0].pos(), SkyPos{0.0, 0.0}) < 1e-12);
}

TEST_CASE("prune_near_bright_keeps_best_neighbor") {
    catalog::Catalog cat = {
        make_entry(0.0, 0.0, 200.0, 1.0),
        make_entry(0.0, 1.0, 10.0, 1.0),
        make_entry(0.0, 5.0, 10.0, 1.0),
    };
    const auto pruned = catalog::prune_near_bright(cat, 100.0, 2.0 * core::kArcmin);
    REQUIRE(pruned.size() == 2);
    REQUIRE(pruned[0].amp[0] == 200.0);
    REQUIRE(pruned[1].ra == cat[2].ra);

    // Nothing is bright enough
    REQUIRE(catalog::prune_near_bright(cat, 1000.0, 2.0 * core::kArcmin).size() == 3);
}

TEST_CASE("prune_near_bright_skips_entries_without_position") {
    catalog::Catalog cat = {
        make_entry(0.0, 0.0, 200.0, 1.0),
        make_entry(0.0, 1.0, 10.0, 1.0),
        make_entry(0.0, 0.0, 300.0, 1.0),
    };
    cat[2].dec = std::nan("");

    const auto pruned = catalog::prune_near_bright(cat, 100.0, 2.0 * core::kArcmin);
    REQUIRE(pruned.size() == 2);
    REQUIRE(pruned[0].amp[0] == 200.0);
    REQUIRE(std::isnan(pruned[1].dec));
}

TEST_CASE("catalog_helpers") {
    catalog::Catalog cat = {make_entry(0.0, 0.0, 5.0, 1.0), make_entry(1.0, 0.0, 50.0, 1.0),
                            make_entry(2.0, 0.0, 10.0, 0.0)};
    REQUIRE(catalog::snr(cat[2]) == 0.0);

    catalog::sort_by_snr(cat);
    REQUIRE(cat[0].amp[0] == 50.0);
    REQUIRE(cat[1].amp[0] == 5.0);

    const auto sub = catalog::select(cat, {2, 0});
    REQUIRE(sub.size() == 2);
    REQUIRE(sub[1].amp[0] == 50.0);
    REQUIRE(catalog::concatenate({cat, sub}).size() == 5);

    VectorXd amps(2), damps(2);
    amps << 10.0, -5.0;
    damps << 1.0, 0.0;
    const auto prior = catalog::build_prior(amps, damps, 0.5, 1e-10);
    REQUIRE(prior.amp[1] == -5.0);
    REQUIRE(prior.ivar[0] == Catch::Approx(1.0 / 26.0));
    REQUIRE(prior.ivar[1] == 1e-10);
}
