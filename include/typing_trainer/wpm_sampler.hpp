#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace tt::trainer {

inline constexpr double kInitialWpmDelaySeconds = 2.0;
inline constexpr double kWpmUpdateIntervalSeconds = 1.0;
inline constexpr double kCharsPerWord = 5.0;
inline constexpr double kMaxWpmCap = 500.0;

struct WpmSample {
    double elapsed_seconds{0.0};
    double wpm{0.0};
};

class WpmSampler {
public:
    // Returns true when a new sample was appended.
    bool maybeSample(double elapsed_seconds, std::size_t cursor);
    void clear();

    [[nodiscard]] double current() const noexcept;
    [[nodiscard]] double average() const noexcept;
    [[nodiscard]] double peak() const noexcept;

    [[nodiscard]] const std::vector<WpmSample>& samples() const noexcept { return samples_; }

private:
    std::vector<WpmSample> samples_;
    std::optional<double> last_sample_seconds_;
};

}  // namespace tt::trainer
