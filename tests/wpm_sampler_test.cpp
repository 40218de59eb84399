#include <catch2/catch.hpp>

#include "typing_trainer/wpm_sampler.hpp"

using tt::trainer::WpmSampler;

TEST_CASE("no sample during the warm-up", "[wpm]") {
    WpmSampler sampler;
    CHECK_FALSE(sampler.maybeSample(0.5, 5));
    CHECK_FALSE(sampler.maybeSample(1.99, 10));
    CHECK(sampler.samples().empty());
    CHECK(sampler.current() == 0.0);
    CHECK(sampler.average() == 0.0);
    CHECK(sampler.peak() == 0.0);
}

TEST_CASE("samples are at least one second apart", "[wpm]") {
    WpmSampler sampler;
    CHECK(sampler.maybeSample(2.0, 10));
    CHECK_FALSE(sampler.maybeSample(2.5, 12));
    CHECK(sampler.maybeSample(3.0, 20));

    REQUIRE(sampler.samples().size() == 2);
    CHECK(sampler.samples()[0].elapsed_seconds == 2.0);
    CHECK(sampler.samples()[0].wpm == Approx(60.0));
    CHECK(sampler.samples()[1].wpm == Approx(80.0));
    CHECK(sampler.current() == Approx(80.0));
    CHECK(sampler.average() == Approx(70.0));
    CHECK(sampler.peak() == Approx(80.0));
}

TEST_CASE("wpm is capped", "[wpm]") {
    WpmSampler sampler;
    REQUIRE(sampler.maybeSample(2.0, 100000));
    CHECK(sampler.current() == Approx(tt::trainer::kMaxWpmCap));
}

TEST_CASE("clear restarts the warm-up and interval", "[wpm]") {
    WpmSampler sampler;
    REQUIRE(sampler.maybeSample(5.0, 10));
    sampler.clear();
    CHECK(sampler.samples().empty());
    CHECK(sampler.maybeSample(2.0, 10));
}
