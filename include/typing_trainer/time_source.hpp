#pragma once

#include <memory>

#include "typing_trainer/types.hpp"

namespace tt::trainer {

class TimeSource {
public:
    virtual ~TimeSource() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SteadyTimeSource : public TimeSource {
public:
    [[nodiscard]] TimePoint now() const override { return Clock::now(); }
};

// Only moves when told to. Used for scripted sessions and tests.
class ManualTimeSource : public TimeSource {
public:
    explicit ManualTimeSource(TimePoint start = TimePoint{}) : now_(start) {}

    [[nodiscard]] TimePoint now() const override { return now_; }

    void advance(Duration delta) { now_ += delta; }
    void set(TimePoint t) { now_ = t; }

private:
    TimePoint now_;
};

using TimeSourcePtr = std::shared_ptr<const TimeSource>;

}  // namespace tt::trainer
