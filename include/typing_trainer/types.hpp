#pragma once

#include <chrono>
#include <cstdint>

namespace tt::trainer {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::nanoseconds;

struct RgbColor {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
};

inline bool operator==(const RgbColor& lhs, const RgbColor& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}

inline bool operator!=(const RgbColor& lhs, const RgbColor& rhs) {
    return !(lhs == rhs);
}

inline double toSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

}  // namespace tt::trainer
