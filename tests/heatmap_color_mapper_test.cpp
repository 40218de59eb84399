#include <catch2/catch.hpp>

#include "typing_trainer/heatmap_color_mapper.hpp"

using namespace tt::trainer;
using namespace std::chrono_literals;

TEST_CASE("speed thresholds are upper bounds", "[heatmap]") {
    CHECK(classifySpeed(0.0) == SpeedBand::Fastest);
    CHECK(classifySpeed(0.159) == SpeedBand::Fastest);
    CHECK(classifySpeed(0.16) == SpeedBand::Fast);
    CHECK(classifySpeed(0.33) == SpeedBand::Medium);
    CHECK(classifySpeed(0.5) == SpeedBand::Medium);
    CHECK(classifySpeed(0.67) == SpeedBand::Slow);
    CHECK(classifySpeed(0.829) == SpeedBand::Slow);
    CHECK(classifySpeed(0.83) == SpeedBand::Slowest);
    CHECK(classifySpeed(1.0) == SpeedBand::Slowest);
}

TEST_CASE("accuracy thresholds are lower bounds", "[heatmap]") {
    CHECK(classifyAccuracy(1.0) == AccuracyBand::Highest);
    CHECK(classifyAccuracy(0.95) == AccuracyBand::Highest);
    CHECK(classifyAccuracy(0.94) == AccuracyBand::High);
    CHECK(classifyAccuracy(0.85) == AccuracyBand::High);
    CHECK(classifyAccuracy(0.70) == AccuracyBand::Medium);
    CHECK(classifyAccuracy(0.50) == AccuracyBand::Low);
    CHECK(classifyAccuracy(0.49) == AccuracyBand::Lowest);
    CHECK(classifyAccuracy(0.0) == AccuracyBand::Lowest);
}

TEST_CASE("band palette", "[heatmap]") {
    CHECK(bandColor(SpeedBand::Fastest) == RgbColor{0, 205, 0});
    CHECK(bandColor(SpeedBand::Slowest) == RgbColor{205, 0, 0});
    CHECK(bandColor(AccuracyBand::Medium) == RgbColor{205, 205, 0});
    CHECK(bandColor(AccuracyBand::NoData) == RgbColor{128, 128, 128});
    CHECK(bandName(SpeedBand::NoData) == "no-data");
    CHECK(bandName(AccuracyBand::Highest) == "highest");
}

TEST_CASE("untracked keys are unused", "[heatmap]") {
    KeyMetricsTracker tracker;
    HeatmapColorMapper mapper(tracker);
    CHECK(mapper.speedBand('q') == SpeedBand::Unused);
    CHECK(mapper.accuracyBand('q') == AccuracyBand::Unused);
}

TEST_CASE("speed needs two keys with a mean", "[heatmap]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 100ms);
    tracker.recordError('b');
    HeatmapColorMapper mapper(tracker);

    CHECK(mapper.speedBand('a') == SpeedBand::NoData);
    CHECK(mapper.speedBand('b') == SpeedBand::NoData);
    CHECK(mapper.accuracyBand('b') == AccuracyBand::NoData);
    CHECK(mapper.accuracyBand('a') == AccuracyBand::Highest);
}

TEST_CASE("speed bands are relative to the observed range", "[heatmap]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 100ms);
    tracker.recordAttempt('b', 300ms);
    tracker.recordAttempt('c', 200ms);
    HeatmapColorMapper mapper(tracker);

    CHECK(mapper.speedBand('a') == SpeedBand::Fastest);
    CHECK(mapper.speedBand('c') == SpeedBand::Medium);
    CHECK(mapper.speedBand('b') == SpeedBand::Slowest);
}

TEST_CASE("a zero latency range has no ranking", "[heatmap]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 100ms);
    tracker.recordAttempt('b', 100ms);
    CHECK(HeatmapColorMapper(tracker).speedBand('a') == SpeedBand::NoData);
}

TEST_CASE("latencies are compared in whole milliseconds", "[heatmap]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 100ms);
    tracker.recordAttempt('b', 100ms + 400us);
    CHECK(HeatmapColorMapper(tracker).speedBand('b') == SpeedBand::NoData);
}

TEST_CASE("accuracy bands follow the key's own ratio", "[heatmap]") {
    KeyMetricsTracker tracker;
    for (int i = 0; i < 10; ++i) tracker.recordAttempt('a', 10ms);
    tracker.recordError('a');
    tracker.recordError('a');
    tracker.recordAttempt('b', 10ms);
    tracker.recordAttempt('b', 10ms);
    tracker.recordError('b');
    HeatmapColorMapper mapper(tracker);

    CHECK(mapper.accuracyBand('a') == AccuracyBand::Medium);
    CHECK(mapper.accuracyBand('b') == AccuracyBand::Low);
}
