#include "typing_trainer/heatmap_color_mapper.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <limits>
#include <utility>

namespace tt::trainer {

namespace {

// Evaluated top-down: first entry whose bound the position is below wins.
constexpr std::array<std::pair<double, SpeedBand>, 5> kSpeedThresholds{{
    {0.16, SpeedBand::Fastest},
    {0.33, SpeedBand::Fast},
    {0.67, SpeedBand::Medium},
    {0.83, SpeedBand::Slow},
    {std::numeric_limits<double>::infinity(), SpeedBand::Slowest},
}};

// Evaluated top-down: first entry whose bound the ratio reaches wins.
constexpr std::array<std::pair<double, AccuracyBand>, 5> kAccuracyThresholds{{
    {0.95, AccuracyBand::Highest},
    {0.85, AccuracyBand::High},
    {0.70, AccuracyBand::Medium},
    {0.50, AccuracyBand::Low},
    {-std::numeric_limits<double>::infinity(), AccuracyBand::Lowest},
}};

constexpr RgbColor kGreen{0, 205, 0};
constexpr RgbColor kLightGreen{144, 238, 144};
constexpr RgbColor kYellow{205, 205, 0};
constexpr RgbColor kLightRed{255, 99, 71};
constexpr RgbColor kRed{205, 0, 0};
constexpr RgbColor kGray{128, 128, 128};
constexpr RgbColor kDarkGray{64, 64, 64};

std::chrono::milliseconds::rep wholeMillis(Duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

}  // namespace

SpeedBand classifySpeed(double relative_position) {
    for (const auto& [upper_bound, band] : kSpeedThresholds) {
        if (relative_position < upper_bound) {
            return band;
        }
    }
    return SpeedBand::Slowest;
}

AccuracyBand classifyAccuracy(double ratio) {
    for (const auto& [lower_bound, band] : kAccuracyThresholds) {
        if (ratio >= lower_bound) {
            return band;
        }
    }
    return AccuracyBand::Lowest;
}

RgbColor bandColor(SpeedBand band) {
    switch (band) {
        case SpeedBand::Fastest: return kGreen;
        case SpeedBand::Fast: return kLightGreen;
        case SpeedBand::Medium: return kYellow;
        case SpeedBand::Slow: return kLightRed;
        case SpeedBand::Slowest: return kRed;
        case SpeedBand::NoData: return kGray;
        case SpeedBand::Unused: return kDarkGray;
    }
    return kDarkGray;
}

RgbColor bandColor(AccuracyBand band) {
    switch (band) {
        case AccuracyBand::Highest: return kGreen;
        case AccuracyBand::High: return kLightGreen;
        case AccuracyBand::Medium: return kYellow;
        case AccuracyBand::Low: return kLightRed;
        case AccuracyBand::Lowest: return kRed;
        case AccuracyBand::NoData: return kGray;
        case AccuracyBand::Unused: return kDarkGray;
    }
    return kDarkGray;
}

std::string_view bandName(SpeedBand band) {
    switch (band) {
        case SpeedBand::Fastest: return "fastest";
        case SpeedBand::Fast: return "fast";
        case SpeedBand::Medium: return "medium";
        case SpeedBand::Slow: return "slow";
        case SpeedBand::Slowest: return "slowest";
        case SpeedBand::NoData: return "no-data";
        case SpeedBand::Unused: return "unused";
    }
    return "unused";
}

std::string_view bandName(AccuracyBand band) {
    switch (band) {
        case AccuracyBand::Highest: return "highest";
        case AccuracyBand::High: return "high";
        case AccuracyBand::Medium: return "medium";
        case AccuracyBand::Low: return "low";
        case AccuracyBand::Lowest: return "lowest";
        case AccuracyBand::NoData: return "no-data";
        case AccuracyBand::Unused: return "unused";
    }
    return "unused";
}

HeatmapColorMapper::HeatmapColorMapper(const KeyMetricsTracker& tracker)
    : tracker_(tracker) {}

SpeedBand HeatmapColorMapper::speedBand(char key) const {
    const KeyMetric* metric = tracker_.find(key);
    if (metric == nullptr) {
        return SpeedBand::Unused;
    }
    const auto mean = metric->meanLatency();
    if (!mean) {
        return SpeedBand::NoData;
    }

    const auto all = tracker_.meanLatencies();
    if (all.size() < 2) {
        return SpeedBand::NoData;
    }

    // Compared at millisecond resolution; sub-millisecond spreads count as equal.
    auto [min_it, max_it] = std::minmax_element(all.begin(), all.end(),
        [](const KeyLatency& a, const KeyLatency& b) { return a.mean < b.mean; });
    const auto min_ms = wholeMillis(min_it->mean);
    const auto range_ms = wholeMillis(max_it->mean) - min_ms;
    if (range_ms == 0) {
        return SpeedBand::NoData;
    }

    const double relative = static_cast<double>(wholeMillis(*mean) - min_ms) /
                            static_cast<double>(range_ms);
    return classifySpeed(relative);
}

AccuracyBand HeatmapColorMapper::accuracyBand(char key) const {
    const KeyMetric* metric = tracker_.find(key);
    if (metric == nullptr) {
        return AccuracyBand::Unused;
    }
    const auto ratio = metric->accuracy();
    if (!ratio) {
        return AccuracyBand::NoData;
    }
    return classifyAccuracy(*ratio);
}

}  // namespace tt::trainer
