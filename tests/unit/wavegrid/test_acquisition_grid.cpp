#include "master/Errors.hpp"
#include "mesh/AcquisitionGrid.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace wavegrid::mesh;
using Catch::Approx;
using wavegrid::ConfigurationError;

TEST_CASE("One acquisition per frame when no sub-step is given", "[mesh][acquisition]")
{
    AcquisitionGrid slow({.frame_rate = 10.0, .num_frame = 5});

    CHECK(slow.frame_step() == Approx(0.1));
    CHECK(slow.num_acq() == 1);
    CHECK(slow.acq_rate() == -1.0);
    CHECK_FALSE(slow.subsampled());
    CHECK(slow.num() == slow.num_frame());
    CHECK(slow.extended_num() == 5);
    CHECK(slow.inner() == Range{0, 5});
    CHECK(slow.start() == 0.0);
    CHECK(slow.stop() == Approx(0.4));

    const auto& g = slow.grid();
    REQUIRE(g.size() == 5);
    CHECK(g[1] == Approx(0.1f));
    CHECK(g.back() == static_cast<float>(slow.stop()));
}

TEST_CASE("Sub-sampled frames concatenate their acquisitions", "[mesh][acquisition]")
{
    AcquisitionGrid slow({.frame_rate = 10.0, .acq_step = 1e-3, .num_frame = 5, .num_acq = 4});

    CHECK(slow.subsampled());
    CHECK(slow.acq_rate() == Approx(1000.0));
    CHECK(slow.num() == 20);

    const auto& g = slow.grid();
    REQUIRE(g.size() == 20);
    CHECK(g[0] == 0.f);
    CHECK(g[1] == Approx(1e-3));
    CHECK(g[3] == Approx(3e-3));
    CHECK(g[4] == Approx(0.1)); // second frame
    CHECK(g[19] == Approx(0.403));
}

TEST_CASE("Step and rate are reciprocal", "[mesh][acquisition]")
{
    AcquisitionGrid slow({.acq_rate = 500.0, .frame_step = 0.05, .num_frame = 2, .num_acq = 10});
    CHECK(slow.frame_rate() == Approx(20.0));
    CHECK(slow.acq_step() == Approx(2e-3));
    CHECK(slow.num() == 20);
}

TEST_CASE("AcquisitionGrid rejects inconsistent schedules", "[mesh][acquisition][errors]")
{
    // acquisitions do not fit inside one frame
    CHECK_THROWS_AS(
        AcquisitionGrid({.frame_step = 0.01, .acq_step = 0.005, .num_frame = 2, .num_acq = 3}),
        ConfigurationError);
    // no frame timing
    CHECK_THROWS_AS(AcquisitionGrid({.num_frame = 2}), ConfigurationError);
    // no frame count
    CHECK_THROWS_AS(AcquisitionGrid({.frame_rate = 10.0}), ConfigurationError);
    CHECK_THROWS_AS(AcquisitionGrid({.frame_rate = 10.0, .num_frame = 0}), ConfigurationError);
    // sub-step without a count
    CHECK_THROWS_AS(AcquisitionGrid({.frame_rate = 10.0, .acq_step = 1e-3, .num_frame = 2}),
                    ConfigurationError);
}

TEST_CASE("AcquisitionGrid cannot be resampled", "[mesh][acquisition][errors]")
{
    AcquisitionGrid slow({.frame_rate = 10.0, .num_frame = 5});
    CHECK_THROWS_AS(slow.resample(), wavegrid::UnsupportedOperationError);
}
