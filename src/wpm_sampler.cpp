#include "typing_trainer/wpm_sampler.hpp"

#include <algorithm>

namespace tt::trainer {

bool WpmSampler::maybeSample(double elapsed_seconds, std::size_t cursor) {
    if (elapsed_seconds < kInitialWpmDelaySeconds) {
        return false;
    }
    if (last_sample_seconds_ &&
        elapsed_seconds - *last_sample_seconds_ < kWpmUpdateIntervalSeconds) {
        return false;
    }

    const double words = static_cast<double>(cursor) / kCharsPerWord;
    const double wpm = std::clamp(words / (elapsed_seconds / 60.0), 0.0, kMaxWpmCap);

    samples_.push_back(WpmSample{elapsed_seconds, wpm});
    last_sample_seconds_ = elapsed_seconds;
    return true;
}

void WpmSampler::clear() {
    samples_.clear();
    last_sample_seconds_.reset();
}

double WpmSampler::current() const noexcept {
    return samples_.empty() ? 0.0 : samples_.back().wpm;
}

double WpmSampler::average() const noexcept {
    if (samples_.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& sample : samples_) {
        total += sample.wpm;
    }
    return total / static_cast<double>(samples_.size());
}

double WpmSampler::peak() const noexcept {
    double best = 0.0;
    for (const auto& sample : samples_) {
        best = std::max(best, sample.wpm);
    }
    return best;
}

}  // namespace tt::trainer
