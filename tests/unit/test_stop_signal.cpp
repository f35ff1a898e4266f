/**
 * @file test_stop_signal.cpp
 * @brief Unit tests for StopSignal
 */

#include <catch2/catch_test_macros.hpp>
#include <michadame/stop_signal.h>

using namespace michadame;

TEST_CASE("StopSignal is one-way", "[core][stop]") {
    StopSignal stop;
    REQUIRE_FALSE(stop.stopRequested());

    stop.requestStop();
    REQUIRE(stop.stopRequested());

    stop.requestStop();
    REQUIRE(stop.stopRequested());
}

TEST_CASE("Linked StopSignal", "[core][stop]") {
    StopSignal parent;
    StopSignal child(&parent);

    SECTION("parent stop propagates to child") {
        parent.requestStop();
        REQUIRE(child.stopRequested());
    }

    SECTION("child stop does not touch the parent") {
        child.requestStop();
        REQUIRE(child.stopRequested());
        REQUIRE_FALSE(parent.stopRequested());
    }
}
