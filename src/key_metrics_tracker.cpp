#include "typing_trainer/key_metrics_tracker.hpp"

#include <algorithm>

namespace tt::trainer {

namespace {

template <typename T>
std::vector<T> takeFirst(std::vector<T> items, std::size_t count) {
    if (items.size() > count) {
        items.resize(count);
    }
    return items;
}

}  // namespace

std::optional<Duration> KeyMetric::meanLatency() const {
    if (latencies.empty()) {
        return std::nullopt;
    }
    Duration total{0};
    for (const auto& sample : latencies) {
        total += sample;
    }
    return total / static_cast<Duration::rep>(latencies.size());
}

std::optional<double> KeyMetric::accuracy() const {
    if (latencies.empty()) {
        return std::nullopt;
    }
    const auto samples = latencies.size();
    const auto correct = samples > errors ? samples - errors : 0u;
    return static_cast<double>(correct) / static_cast<double>(samples);
}

void KeyMetricsTracker::recordAttempt(char expected, Duration latency) {
    metrics_[expected].latencies.push_back(std::max(latency, Duration{0}));
}

void KeyMetricsTracker::recordError(char expected) {
    ++metrics_[expected].errors;
}

void KeyMetricsTracker::clear() {
    metrics_.clear();
}

const KeyMetric* KeyMetricsTracker::find(char key) const {
    auto it = metrics_.find(key);
    if (it == metrics_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<KeyLatency> KeyMetricsTracker::meanLatencies() const {
    std::vector<KeyLatency> out;
    out.reserve(metrics_.size());
    for (const auto& [key, metric] : metrics_) {
        if (auto mean = metric.meanLatency()) {
            out.push_back(KeyLatency{key, *mean});
        }
    }
    return out;
}

std::vector<KeyLatency> KeyMetricsTracker::fastest(std::size_t count) const {
    auto ranked = meanLatencies();
    std::stable_sort(ranked.begin(), ranked.end(), [](const KeyLatency& a, const KeyLatency& b) {
        return a.mean < b.mean;
    });
    return takeFirst(std::move(ranked), count);
}

std::vector<KeyLatency> KeyMetricsTracker::slowest(std::size_t count) const {
    auto ranked = meanLatencies();
    std::stable_sort(ranked.begin(), ranked.end(), [](const KeyLatency& a, const KeyLatency& b) {
        return a.mean > b.mean;
    });
    return takeFirst(std::move(ranked), count);
}

std::vector<KeyErrorCount> KeyMetricsTracker::mostErrorProne(std::size_t count) const {
    std::vector<KeyErrorCount> ranked;
    for (const auto& [key, metric] : metrics_) {
        if (metric.errors > 0) {
            ranked.push_back(KeyErrorCount{key, metric.errors});
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const KeyErrorCount& a, const KeyErrorCount& b) {
        return a.errors > b.errors;
    });
    return takeFirst(std::move(ranked), count);
}

std::vector<KeyAccuracy> KeyMetricsTracker::mostAccurate(std::size_t count) const {
    std::vector<KeyAccuracy> ranked;
    for (const auto& [key, metric] : metrics_) {
        if (auto ratio = metric.accuracy()) {
            ranked.push_back(KeyAccuracy{key, *ratio * 100.0});
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const KeyAccuracy& a, const KeyAccuracy& b) {
        return a.percent > b.percent;
    });
    return takeFirst(std::move(ranked), count);
}

}  // namespace tt::trainer
