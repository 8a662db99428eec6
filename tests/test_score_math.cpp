#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "taxotree/tree/score_math.hpp"

using namespace taxotree;
using Catch::Approx;

TEST_CASE("ScoreAccumulator weighted average", "[score_math]") {
    ScoreAccumulator acc;

    SECTION("Empty accumulator has no score") {
        REQUIRE_FALSE(acc.result().has_value());
        REQUIRE(acc.total_weight() == 0);
    }

    SECTION("Single score") {
        acc.add(0.7, 3);
        REQUIRE(acc.result().value() == Approx(0.7));
    }

    SECTION("Weights are respected") {
        acc.add(1.0, 3);
        acc.add(0.0, 1);
        REQUIRE(acc.result().value() == Approx(0.75));
        REQUIRE(acc.total_weight() == 4);
    }

    SECTION("Missing scores are ignored") {
        acc.add(kNoScore, 100);
        acc.add(0.5, 2);
        REQUIRE(acc.result().value() == Approx(0.5));
        REQUIRE(acc.total_weight() == 2);
    }

    SECTION("Zero weights are ignored") {
        acc.add(0.9, 0);
        REQUIRE_FALSE(acc.result().has_value());
    }
}
