#pragma once

#include <string_view>

#include "typing_trainer/key_metrics_tracker.hpp"
#include "typing_trainer/types.hpp"

namespace tt::trainer {

enum class SpeedBand {
    Fastest,
    Fast,
    Medium,
    Slow,
    Slowest,
    NoData,
    Unused,
};

enum class AccuracyBand {
    Highest,
    High,
    Medium,
    Low,
    Lowest,
    NoData,
    Unused,
};

// relative_position: 0.0 = fastest observed key, 1.0 = slowest.
[[nodiscard]] SpeedBand classifySpeed(double relative_position);
// ratio: correct attempts / attempts, in [0, 1].
[[nodiscard]] AccuracyBand classifyAccuracy(double ratio);

[[nodiscard]] RgbColor bandColor(SpeedBand band);
[[nodiscard]] RgbColor bandColor(AccuracyBand band);
[[nodiscard]] std::string_view bandName(SpeedBand band);
[[nodiscard]] std::string_view bandName(AccuracyBand band);

class HeatmapColorMapper {
public:
    explicit HeatmapColorMapper(const KeyMetricsTracker& tracker);

    [[nodiscard]] SpeedBand speedBand(char key) const;
    [[nodiscard]] AccuracyBand accuracyBand(char key) const;

private:
    const KeyMetricsTracker& tracker_;
};

}  // namespace tt::trainer
