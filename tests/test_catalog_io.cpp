#include "ptsrc/catalog/catalog_io.hpp"
#include "ptsrc/core/errors.hpp"

#include "test_helpers.hpp"

#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;

namespace {

catalog::Catalog sample_catalog() {
    catalog::Catalog cat(2);
    cat[0].ra = 350.25 * core::kDegree;
    cat[0].dec = -12.5 * core::kDegree;
    cat[0].amp = {1234.5, 10.0, -20.0};
    cat[0].damp = {12.0, 3.0, 3.0};
    cat[0].flux = {0.0123, 0.0001, -0.0002};
    cat[0].dflux = {0.00012, 0.00003, 0.00003};
    cat[0].npix = 17.0;
    cat[0].status = 1;

    cat[1].ra = 0.5 * core::kDegree;
    cat[1].dec = 45.0 * core::kDegree;
    cat[1].amp = {-80.0, 0.0, 0.0};
    cat[1].damp = {10.0, 0.0, 0.0};
    cat[1].flux = {-0.0008, 0.0, 0.0};
    cat[1].dflux = {0.0001, 0.0, 0.0};
    cat[1].npix = 4.0;
    return cat;
}

} // namespace

TEST_CASE("text_catalog_round_trip_to_printed_precision") {
    const fs::path dir = test::temp_dir("catalog_txt");
    const auto cat = sample_catalog();
    catalog::write_catalog(dir / "cat.txt", cat);

    std::ifstream in(dir / "cat.txt");
    std::string header;
    std::getline(in, header);
    REQUIRE(header.rfind("# ra dec SNR", 0) == 0);

    const auto back = catalog::read_catalog(dir / "cat.txt");
    REQUIRE(back.size() == cat.size());
    for (size_t i = 0; i < cat.size(); ++i) {
        REQUIRE(back[i].ra / core::kDegree == Catch::Approx(cat[i].ra / core::kDegree).margin(1e-4));
        REQUIRE(back[i].dec / core::kDegree == Catch::Approx(cat[i].dec / core::kDegree).margin(1e-4));
        for (int c = 0; c < catalog::kNumComp; ++c) {
            // 1e-4 mK and 1e-4 mJy
            REQUIRE(back[i].amp[c] == Catch::Approx(cat[i].amp[c]).margin(0.1));
            REQUIRE(back[i].damp[c] == Catch::Approx(cat[i].damp[c]).margin(0.1));
            REQUIRE(back[i].flux[c] == Catch::Approx(cat[i].flux[c]).margin(1e-7));
            REQUIRE(back[i].dflux[c] == Catch::Approx(cat[i].dflux[c]).margin(1e-7));
        }
        REQUIRE(back[i].npix == cat[i].npix);
        REQUIRE(back[i].status == cat[i].status);
    }
    fs::remove_all(dir);
}

TEST_CASE("fits_catalog_round_trip_is_exact") {
    const fs::path dir = test::temp_dir("catalog_fits");
    const auto cat = sample_catalog();
    catalog::write_catalog(dir / "cat.fits", cat);
    const auto back = catalog::read_catalog(dir / "cat.fits");
    REQUIRE(back.size() == cat.size());
    for (size_t i = 0; i < cat.size(); ++i) {
        REQUIRE(back[i].ra == cat[i].ra);
        REQUIRE(back[i].dec == cat[i].dec);
        REQUIRE(back[i].amp == cat[i].amp);
        REQUIRE(back[i].damp == cat[i].damp);
        REQUIRE(back[i].flux == cat[i].flux);
        REQUIRE(back[i].dflux == cat[i].dflux);
        REQUIRE(back[i].npix == cat[i].npix);
        REQUIRE(back[i].status == cat[i].status);
    }

    catalog::write_catalog(dir / "empty.fits", {});
    REQUIRE(catalog::read_catalog(dir / "empty.fits").empty());
    fs::remove_all(dir);
}

TEST_CASE("malformed_text_catalogs_are_rejected") {
    const fs::path dir = test::temp_dir("catalog_bad");
    {
        std::ofstream out(dir / "short.txt");
        out << "# header\n10.0 20.0 5.0 1.0 0.2\n";
    }
    REQUIRE_THROWS_AS(catalog::read_catalog(dir / "short.txt"), IOError);

    {
        std::ofstream out(dir / "nan.txt");
        out << "10 20 5 1 0.2 0 0 0 0 1 0.2 0 0 0 0 abc 0\n";
    }
    REQUIRE_THROWS_AS(catalog::read_catalog(dir / "nan.txt"), IOError);
    REQUIRE_THROWS_AS(catalog::read_catalog(dir / "missing.txt"), IOError);

    {
        std::ofstream out(dir / "comments.txt");
        out << "# only comments\n\n# more\n";
    }
    REQUIRE(catalog::read_catalog(dir / "comments.txt").empty());
    fs::remove_all(dir);
}

TEST_CASE("text_catalog_writes_extreme_values") {
    const fs::path dir = test::temp_dir("catalog_txt_extreme");
    catalog::Catalog cat(1);
    cat[0].ra = 10.0 * core::kDegree;
    cat[0].dec = -5.0 * core::kDegree;
    cat[0].amp = {500.0, 1.0, 2.0};
    cat[0].damp = {1e-300, 1.0, 1.0};
    cat[0].flux = {1e200, 0.0, 0.0};
    cat[0].dflux = {1e-3, 0.0, 0.0};
    cat[0].npix = 3.0;

    // S/N of 5e302 and a 1e203 mJy flux both print far wider than a usual row
    catalog::write_catalog(dir / "cat.txt", cat);

    const auto back = catalog::read_catalog(dir / "cat.txt");
    REQUIRE(back.size() == 1);
    REQUIRE(back[0].ra / core::kDegree == Catch::Approx(10.0).margin(1e-4));
    REQUIRE(back[0].amp[0] == Catch::Approx(500.0).margin(0.1));
    REQUIRE(back[0].damp[0] == Catch::Approx(0.0).margin(0.1));
    REQUIRE(back[0].flux[0] == Catch::Approx(1e200).epsilon(1e-10));
    REQUIRE(back[0].dflux[0] == Catch::Approx(1e-3).margin(1e-7));
    REQUIRE(back[0].npix == 3.0);
}
