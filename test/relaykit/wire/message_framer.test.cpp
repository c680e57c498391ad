/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/wire/message_framer.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("rly::wire::MessageFramer") {
    rly::wire::MessageFramer framer(64);

    SECTION("Message split over multiple reads") {
        framer.feed(R"({"type":"sensor)");
        REQUIRE_FALSE(framer.next());
        framer.feed("_data\"}\n");
        const auto message = framer.next();
        REQUIRE(message);
        REQUIRE(*message == R"({"type":"sensor_data"})");
        REQUIRE_FALSE(framer.next());
        REQUIRE(framer.buffered_size() == 0);
    }

    SECTION("Multiple messages in one read") {
        framer.feed("{\"a\":1}\n{\"b\":2}\n{\"c\"");
        REQUIRE(framer.next() == std::optional<std::string>("{\"a\":1}"));
        REQUIRE(framer.next() == std::optional<std::string>("{\"b\":2}"));
        REQUIRE_FALSE(framer.next());
        framer.feed(":3}\n");
        REQUIRE(framer.next() == std::optional<std::string>("{\"c\":3}"));
    }

    SECTION("Carriage returns and empty lines are dropped") {
        framer.feed("\n\r\n{\"a\":1}\r\n\n");
        REQUIRE(framer.next() == std::optional<std::string>("{\"a\":1}"));
        REQUIRE_FALSE(framer.next());
    }

    SECTION("Too much data without delimiter overflows") {
        framer.feed(std::string(64, 'x'));
        REQUIRE_FALSE(framer.overflowed());
        framer.feed("x");
        REQUIRE(framer.overflowed());
        REQUIRE_FALSE(framer.next());

        framer.reset();
        REQUIRE_FALSE(framer.overflowed());
        REQUIRE(framer.buffered_size() == 0);
    }

    SECTION("Many small messages don't overflow") {
        for (int i = 0; i < 100; ++i) {
            framer.feed("{\"n\":1}\n");
            REQUIRE(framer.next() == std::optional<std::string>("{\"n\":1}"));
        }
        REQUIRE_FALSE(framer.overflowed());
    }
}
