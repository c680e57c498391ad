/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/relay/latency_estimator.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("rly::estimate_latency") {
    SECTION("Clocks offset, symmetric path") {
        const auto estimate = rly::estimate_latency(100.000, 100.050, 100.060, 100.120);
        REQUIRE_THAT(estimate.offset, Catch::Matchers::WithinAbs(-0.005, 1e-9));
        REQUIRE_THAT(estimate.corrected_t2, Catch::Matchers::WithinAbs(100.055, 1e-9));
        REQUIRE_THAT(estimate.one_way_delay, Catch::Matchers::WithinAbs(0.055, 1e-9));
        REQUIRE_THAT(estimate.delay_ms(), Catch::Matchers::WithinAbs(55.0, 1e-6));
        REQUIRE(estimate.is_plausible(1.0));
    }

    SECTION("Synchronised clocks") {
        const auto estimate = rly::estimate_latency(10.0, 10.010, 10.012, 10.022);
        REQUIRE_THAT(estimate.offset, Catch::Matchers::WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(estimate.one_way_delay, Catch::Matchers::WithinAbs(0.010, 1e-9));
    }

    SECTION("Offset cancels out") {
        const auto reference = rly::estimate_latency(10.0, 10.010, 10.012, 10.022);
        const auto shifted = rly::estimate_latency(10.0, 13.010, 13.012, 10.022);
        REQUIRE_THAT(shifted.offset, Catch::Matchers::WithinAbs(3.0, 1e-9));
        REQUIRE_THAT(shifted.one_way_delay, Catch::Matchers::WithinAbs(reference.one_way_delay, 1e-9));
    }

    SECTION("Measurement clock ahead of the relay clock yields a negative delay, which is not clamped") {
        const auto estimate = rly::estimate_latency(10.0, 9.01, 9.02, 9.03);
        REQUIRE_THAT(estimate.one_way_delay, Catch::Matchers::WithinAbs(-0.49, 1e-9));
        REQUIRE_FALSE(estimate.is_plausible(1.0));
    }

    SECTION("Delay above the bound is implausible") {
        const auto estimate = rly::estimate_latency(0.0, 2.0, 2.0, 4.0);
        REQUIRE_THAT(estimate.one_way_delay, Catch::Matchers::WithinAbs(2.0, 1e-9));
        REQUIRE_FALSE(estimate.is_plausible(1.0));
        REQUIRE(estimate.is_plausible(2.0));
    }
}
