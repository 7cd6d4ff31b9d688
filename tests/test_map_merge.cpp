#include "ptsrc/core/errors.hpp"
#include "ptsrc/pipeline/map_merge.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ptsrc;

TEST_CASE("merge_weight_is_separable_tent") {
    const Matrix2Dd w = pipeline::build_merge_weight(4, 3);
    REQUIRE(w(0, 0) == Catch::Approx(0.25 / 3.0));
    REQUIRE(w(1, 1) == Catch::Approx(0.75));
    REQUIRE(w(2, 1) == Catch::Approx(0.75));
    REQUIRE(w(3, 2) == Catch::Approx(0.25 / 3.0));
    REQUIRE(w.minCoeff() > 0.0);
}

TEST_CASE("overlapping_tiles_blend_by_weight") {
    pipeline::MapAccumulator acc(10, 10);
    acc.add(PixBox{0, 0, 6, 10}, Matrix2Dd::Constant(6, 10, 1.0));
    acc.add(PixBox{4, 0, 10, 10}, Matrix2Dd::Constant(6, 10, 3.0));
    const Matrix2Dd m = acc.result();

    REQUIRE(m(0, 3) == Catch::Approx(1.0));
    REQUIRE(m(9, 7) == Catch::Approx(3.0));
    // Row weights 1/2 vs 1/6 and 1/6 vs 1/2
    REQUIRE(m(4, 5) == Catch::Approx(1.5));
    REQUIRE(m(5, 5) == Catch::Approx(2.5));
}

TEST_CASE("uncovered_pixels_are_zero_and_crop_is_applied") {
    pipeline::MapAccumulator acc(10, 10, 1);
    acc.add(PixBox{0, 0, 10, 10}, Matrix2Dd::Constant(10, 10, 2.0));
    acc.add(PixBox{-3, -3, 3, 3}, Matrix2Dd::Constant(6, 6, 2.0));
    const Matrix2Dd m = acc.result();

    REQUIRE(m(9, 9) == 0.0);
    REQUIRE(m(0, 9) == 0.0);
    REQUIRE(m(0, 0) == Catch::Approx(2.0));
    REQUIRE(m(5, 5) == Catch::Approx(2.0));
    REQUIRE(acc.weight()(9, 9) == 0.0);

    // Tiles smaller than the crop contribute nothing
    pipeline::MapAccumulator small(10, 10, 2);
    small.add(PixBox{0, 0, 4, 4}, Matrix2Dd::Ones(4, 4));
    REQUIRE(small.result().cwiseAbs().maxCoeff() == 0.0);

    REQUIRE_THROWS_AS(acc.add(PixBox{0, 0, 4, 4}, Matrix2Dd::Ones(3, 4)), PipelineError);
}

TEST_CASE("merge_is_independent_of_order") {
    const Matrix2Dd a = Matrix2Dd::Random(8, 8);
    const Matrix2Dd b = Matrix2Dd::Random(8, 8);
    const Matrix2Dd c = Matrix2Dd::Random(8, 8);
    const PixBox ba{0, 0, 8, 8};
    const PixBox bb{4, 2, 12, 10};
    const PixBox bc{3, 6, 11, 14};

    pipeline::MapAccumulator serial(14, 14);
    serial.add(ba, a);
    serial.add(bb, b);
    serial.add(bc, c);

    pipeline::MapAccumulator left(14, 14);
    pipeline::MapAccumulator right(14, 14);
    right.add(bc, c);
    right.add(ba, a);
    left.add(bb, b);
    left.merge(right);

    REQUIRE((serial.result() - left.result()).cwiseAbs().maxCoeff() < 1e-12);
    REQUIRE_THROWS_AS(serial.merge(pipeline::MapAccumulator(4, 4)), PipelineError);
}
