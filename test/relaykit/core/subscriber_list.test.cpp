/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/core/util/subscriber_list.hpp"

#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

namespace {

class Recorder {
  public:
    void on_message(const std::string& message, const int count) {
        for (int i = 0; i < count; ++i) {
            messages.push_back(message);
        }
    }

    void on_reset() {
        messages.clear();
    }

    std::vector<std::string> messages;
};

}  // namespace

TEST_CASE("rly::SubscriberList") {
    rly::SubscriberList<Recorder> list;

    SECTION("Notify reaches every subscriber") {
        Recorder first;
        Recorder second;
        REQUIRE(list.add(&first));
        REQUIRE(list.add(&second));

        list.notify(&Recorder::on_message, std::string("ping"), 2);
        REQUIRE(first.messages == std::vector<std::string> {"ping", "ping"});
        REQUIRE(second.messages == first.messages);

        REQUIRE(list.remove(&first));
        list.notify(&Recorder::on_reset);
        REQUIRE(first.messages.size() == 2);
        REQUIRE(second.messages.empty());

        REQUIRE(list.remove(&second));
        REQUIRE(list.empty());
    }

    SECTION("Subscribing twice is refused") {
        Recorder recorder;
        REQUIRE(list.add(&recorder));
        REQUIRE_FALSE(list.add(&recorder));
        REQUIRE(list.size() == 1);
        REQUIRE(list.contains(&recorder));
        REQUIRE(list.remove(&recorder));
        REQUIRE_FALSE(list.remove(&recorder));
        REQUIRE_FALSE(list.contains(&recorder));
    }

    SECTION("Null is refused") {
        REQUIRE_FALSE(list.add(nullptr));
        REQUIRE(list.empty());
    }
}
