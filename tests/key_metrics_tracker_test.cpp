#include <catch2/catch.hpp>

#include "typing_trainer/key_metrics_tracker.hpp"

using namespace tt::trainer;
using namespace std::chrono_literals;

namespace {

std::string keysOf(const std::vector<KeyLatency>& entries) {
    std::string out;
    for (const auto& entry : entries) out.push_back(entry.key);
    return out;
}

}  // namespace

TEST_CASE("mean latency averages every attempt", "[metrics]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 100ms);
    tracker.recordAttempt('a', 300ms);

    const auto* metric = tracker.find('a');
    REQUIRE(metric != nullptr);
    REQUIRE(metric->meanLatency().has_value());
    CHECK(*metric->meanLatency() == Duration(200ms));
    CHECK(tracker.find('b') == nullptr);
}

TEST_CASE("negative latencies are clamped to zero", "[metrics]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', -5ms);
    CHECK(tracker.find('a')->latencies.front() == Duration{0});
}

TEST_CASE("latency rankings break ties by character", "[metrics]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('b', 100ms);
    tracker.recordAttempt('a', 100ms);
    tracker.recordAttempt('c', 50ms);
    tracker.recordAttempt('d', 400ms);

    CHECK(keysOf(tracker.fastest(3)) == "cab");
    CHECK(keysOf(tracker.slowest(3)) == "dab");
    CHECK(keysOf(tracker.fastest(10)) == "cabd");
    CHECK(tracker.fastest(0).empty());
}

TEST_CASE("error ranking skips keys without errors", "[metrics]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 10ms);
    tracker.recordAttempt('b', 10ms);
    tracker.recordError('b');
    tracker.recordAttempt('c', 10ms);
    tracker.recordAttempt('c', 10ms);
    tracker.recordError('c');
    tracker.recordError('c');

    const auto ranked = tracker.mostErrorProne(3);
    REQUIRE(ranked.size() == 2);
    CHECK(ranked[0].key == 'c');
    CHECK(ranked[0].errors == 2);
    CHECK(ranked[1].key == 'b');
    CHECK(ranked[1].errors == 1);
}

TEST_CASE("accuracy ranking reports percentages", "[metrics]") {
    KeyMetricsTracker tracker;
    for (int i = 0; i < 4; ++i) tracker.recordAttempt('a', 10ms);
    tracker.recordError('a');
    tracker.recordAttempt('b', 10ms);
    tracker.recordAttempt('b', 10ms);
    tracker.recordError('z');

    const auto ranked = tracker.mostAccurate(3);
    REQUIRE(ranked.size() == 2);
    CHECK(ranked[0].key == 'b');
    CHECK(ranked[0].percent == Approx(100.0));
    CHECK(ranked[1].key == 'a');
    CHECK(ranked[1].percent == Approx(75.0));
    CHECK_FALSE(tracker.find('z')->accuracy().has_value());
}

TEST_CASE("clear forgets every key", "[metrics]") {
    KeyMetricsTracker tracker;
    tracker.recordAttempt('a', 10ms);
    tracker.recordError('b');
    REQUIRE(tracker.size() == 2);
    tracker.clear();
    CHECK(tracker.empty());
    CHECK(tracker.meanLatencies().empty());
}
