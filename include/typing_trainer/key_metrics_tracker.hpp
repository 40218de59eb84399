#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "typing_trainer/types.hpp"

namespace tt::trainer {

struct KeyMetric {
    std::vector<Duration> latencies;
    std::size_t errors{0};

    [[nodiscard]] std::optional<Duration> meanLatency() const;
    // (samples - errors) / samples, or nothing when there are no samples.
    [[nodiscard]] std::optional<double> accuracy() const;
};

struct KeyLatency {
    char key{'\0'};
    Duration mean{};
};

struct KeyErrorCount {
    char key{'\0'};
    std::size_t errors{0};
};

struct KeyAccuracy {
    char key{'\0'};
    double percent{0.0};
};

// Per-expected-character analytics. Rankings break ties by ascending
// character code.
class KeyMetricsTracker {
public:
    void recordAttempt(char expected, Duration latency);
    void recordError(char expected);
    void clear();

    [[nodiscard]] const KeyMetric* find(char key) const;
    [[nodiscard]] std::size_t size() const noexcept { return metrics_.size(); }
    [[nodiscard]] bool empty() const noexcept { return metrics_.empty(); }
    [[nodiscard]] const std::map<char, KeyMetric>& metrics() const noexcept { return metrics_; }

    // Every key with at least one latency sample, in key order.
    [[nodiscard]] std::vector<KeyLatency> meanLatencies() const;

    [[nodiscard]] std::vector<KeyLatency> fastest(std::size_t count) const;
    [[nodiscard]] std::vector<KeyLatency> slowest(std::size_t count) const;
    [[nodiscard]] std::vector<KeyErrorCount> mostErrorProne(std::size_t count) const;
    [[nodiscard]] std::vector<KeyAccuracy> mostAccurate(std::size_t count) const;

private:
    std::map<char, KeyMetric> metrics_;
};

}  // namespace tt::trainer
