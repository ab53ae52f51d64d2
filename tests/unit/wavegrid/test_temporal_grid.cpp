#include "master/Errors.hpp"
#include "mesh/TemporalGrid.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace wavegrid::mesh;
using Catch::Approx;
using wavegrid::ConfigurationError;

TEST_CASE("Any three of start/step/num/stop define the axis", "[mesh][time]")
{
    SECTION("stop from start, step, num")
    {
        TemporalGrid t({.start = 0.0, .step = 0.1, .num = 11});
        CHECK(t.stop() == Approx(1.0));
    }
    SECTION("num from start, step, stop")
    {
        TemporalGrid t({.start = 0.0, .step = 0.1, .stop = 1.0});
        CHECK(t.num() == 11);
        CHECK(t.stop() == Approx(1.0));
    }
    SECTION("num rounds up and stop snaps onto the axis")
    {
        TemporalGrid t({.start = 0.0, .step = 0.3, .stop = 1.0});
        CHECK(t.num() == 5);
        CHECK(t.stop() == Approx(1.2));
    }
    SECTION("start from step, num, stop")
    {
        TemporalGrid t({.step = 0.5, .num = 5, .stop = 3.0});
        CHECK(t.start() == Approx(1.0));
    }
    SECTION("step from start, num, stop")
    {
        TemporalGrid t({.start = 0.0, .num = 5, .stop = 1.0});
        CHECK(t.step() == Approx(0.25));
    }
    SECTION("four consistent values are accepted")
    {
        TemporalGrid t({.start = 0.0, .step = 0.25, .num = 5, .stop = 1.0});
        CHECK(t.num() == 5);
    }
}

TEST_CASE("Unextended axis equals the inner axis", "[mesh][time]")
{
    TemporalGrid t({.start = 0.0, .step = 0.1, .num = 11});
    CHECK_FALSE(t.extended());
    CHECK(t.extended_num() == 11);
    CHECK(t.extended_start() == t.start());
    CHECK(t.extended_stop() == t.stop());
    CHECK(t.inner() == Range{0, 11});

    const auto& g = t.grid();
    REQUIRE(g.size() == 11);
    CHECK(g.front() == 0.f);
    CHECK(g.back() == static_cast<float>(t.stop()));
}

TEST_CASE("Padding moves the edges by (k-1) steps", "[mesh][time]")
{
    TemporalGrid t({.start = 0.0, .step = 0.1, .num = 11});
    t.extend({2, 3});

    CHECK(t.extended());
    CHECK(t.extra() == std::array<int, 2>{2, 3});
    CHECK(t.extended_num() == 16);
    CHECK(t.extended_start() == Approx(-0.1));
    CHECK(t.extended_stop() == Approx(1.2));
    CHECK(t.inner() == Range{2, 13});

    const auto& g = t.extended_grid();
    REQUIRE(g.size() == 16);
    CHECK(g.front() == static_cast<float>(t.extended_start()));
    CHECK(g.back() == static_cast<float>(t.extended_stop()));

    // inner axis is unchanged
    CHECK(t.num() == 11);
    CHECK(t.start() == 0.0);
}

TEST_CASE("TemporalGrid rejects bad definitions", "[mesh][time][errors]")
{
    CHECK_THROWS_AS(TemporalGrid({.start = 0.0, .step = 0.1}), ConfigurationError);
    CHECK_THROWS_AS(TemporalGrid(TimeSpec{}), ConfigurationError);
    CHECK_THROWS_AS(TemporalGrid({.start = 0.0, .step = 0.1, .num = 0}), ConfigurationError);
    CHECK_THROWS_AS(TemporalGrid({.start = 0.0, .step = -0.1, .num = 4}), ConfigurationError);
    CHECK_THROWS_AS(TemporalGrid({.start = 0.0, .step = 0.1, .num = 11, .stop = 2.0}),
                    ConfigurationError);
    CHECK_THROWS_AS(TemporalGrid({.start = 1.0, .num = 5, .stop = 0.0}), ConfigurationError);

    TemporalGrid t({.start = 0.0, .step = 0.1, .num = 11});
    CHECK_THROWS_AS(t.extend({-1, 2}), ConfigurationError);
    t.extend({1, 1});
    CHECK_THROWS_AS(t.extend({1, 1}), ConfigurationError);
}

TEST_CASE("TemporalGrid cannot be resampled", "[mesh][time][errors]")
{
    TemporalGrid t({.start = 0.0, .step = 0.1, .num = 11});
    CHECK_THROWS_AS(t.resample(), wavegrid::UnsupportedOperationError);
}
