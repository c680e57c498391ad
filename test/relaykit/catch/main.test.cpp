/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "relaykit/core/log.hpp"

#include <catch2/catch_section_info.hpp>
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_case_info.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>

/**
 * Logs the name of every test case, so log output from the code under test can be attributed.
 */
class TestCaseLogger final: public Catch::EventListenerBase {
  public:
    using EventListenerBase::EventListenerBase;

    void testCaseStarting(const Catch::TestCaseInfo& info) override {
        RLY_INFO("Test case: {}", info.name);
    }

    void sectionStarting(const Catch::SectionInfo& info) override {
        RLY_DEBUG("Section: {}", info.name);
    }
};

CATCH_REGISTER_LISTENER(TestCaseLogger)

int main(const int argc, char* argv[]) {
    rly::set_log_level_from_env();
    return Catch::Session().run(argc, argv);
}
