/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/core/math/running_stats.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("rly::RunningStats") {
    SECTION("Initialization") {
        const rly::RunningStats stats;
        REQUIRE_THAT(stats.average(), Catch::Matchers::WithinAbs(0.0, 0.0));
        REQUIRE_THAT(stats.min(), Catch::Matchers::WithinAbs(0.0, 0.0));
        REQUIRE_THAT(stats.max(), Catch::Matchers::WithinAbs(0.0, 0.0));
        REQUIRE(stats.count() == 0);
    }

    SECTION("Average and extremes") {
        rly::RunningStats stats;
        stats.add(55.0);
        stats.add(-5.0);
        stats.add(40.0);
        REQUIRE_THAT(stats.average(), Catch::Matchers::WithinAbs(30.0, 1e-9));
        REQUIRE_THAT(stats.min(), Catch::Matchers::WithinAbs(-5.0, 0.0));
        REQUIRE_THAT(stats.max(), Catch::Matchers::WithinAbs(55.0, 0.0));
        REQUIRE(stats.count() == 3);

        stats.reset();
        REQUIRE(stats.count() == 0);
        REQUIRE_THAT(stats.average(), Catch::Matchers::WithinAbs(0.0, 0.0));
    }

    SECTION("A single value is average, min and max") {
        rly::RunningStats stats;
        stats.add(12.5);
        REQUIRE_THAT(stats.average(), Catch::Matchers::WithinAbs(12.5, 0.0));
        REQUIRE_THAT(stats.min(), Catch::Matchers::WithinAbs(12.5, 0.0));
        REQUIRE_THAT(stats.max(), Catch::Matchers::WithinAbs(12.5, 0.0));
    }
}
