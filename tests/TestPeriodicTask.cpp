#include <catch2/catch_test_macros.hpp>

#include "game/PeriodicTask.hpp"

TEST_CASE("PeriodicTask does nothing until started", "[periodic]")
{
    PeriodicTask task;
    REQUIRE_FALSE(task.active());
    REQUIRE(task.advance(10.f) == 0);
}

TEST_CASE("PeriodicTask fires once per elapsed interval", "[periodic]")
{
    PeriodicTask task;
    task.start(0.5f);
    REQUIRE(task.active());
    REQUIRE(task.interval() == 0.5f);

    REQUIRE(task.advance(0.25f) == 0);
    REQUIRE(task.advance(0.25f) == 1);
    REQUIRE(task.advance(1.25f) == 2);
    // the 0.25 remainder carries over
    REQUIRE(task.advance(0.25f) == 1);
}

TEST_CASE("PeriodicTask stop discards the accumulated time", "[periodic]")
{
    PeriodicTask task;
    task.start(0.5f);
    REQUIRE(task.advance(0.25f) == 0);

    task.stop();
    REQUIRE_FALSE(task.active());
    REQUIRE(task.advance(1.f) == 0);

    task.start(0.5f);
    REQUIRE(task.advance(0.25f) == 0);
}
