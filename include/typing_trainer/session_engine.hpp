#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "typing_trainer/key_metrics_tracker.hpp"
#include "typing_trainer/time_source.hpp"
#include "typing_trainer/types.hpp"
#include "typing_trainer/wpm_sampler.hpp"

namespace tt::trainer {

struct Keystroke {
    enum class Kind { Character, Backspace };

    Kind kind{Kind::Character};
    char ch{'\0'};

    static Keystroke character(char c) { return Keystroke{Kind::Character, c}; }
    static Keystroke backspace() { return Keystroke{Kind::Backspace, '\0'}; }
};

struct SessionSettings {
    std::chrono::seconds duration{30};
    bool correction_mode{false};
};

struct SessionState {
    std::string target_text;
    std::size_t cursor{0};
    std::string typed_echo;
    std::vector<bool> correction_marks;
    std::size_t total_keystrokes{0};
    std::size_t total_errors{0};
    std::optional<TimePoint> started_at;
    bool finished{false};
    bool correction_mode{false};
};

// How the renderer should draw one target position.
enum class PositionStatus {
    Pending,
    Cursor,
    Correct,
    Corrected,  // typed correctly after at least one miss
    Mistyped,
};

struct SessionSummary {
    double average_wpm{0.0};
    double peak_wpm{0.0};
    double accuracy{100.0};
    std::size_t characters_typed{0};
    std::size_t errors{0};
    std::chrono::seconds duration{0};
    bool correction_mode{false};
};

class SessionEngine {
public:
    SessionEngine(std::string target_text, SessionSettings settings, TimeSourcePtr clock);

    void applyKeystroke(const Keystroke& input);
    void tickTimeout(TimePoint now);

    // Fresh text, fresh state; analytics are discarded, never carried over.
    void restart(std::string target_text);

    [[nodiscard]] const SessionState& state() const noexcept { return state_; }
    [[nodiscard]] const SessionSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] const KeyMetricsTracker& keyMetrics() const noexcept { return key_metrics_; }
    [[nodiscard]] const WpmSampler& wpm() const noexcept { return wpm_; }
    [[nodiscard]] bool finished() const noexcept { return state_.finished; }

    [[nodiscard]] double currentAccuracy() const noexcept;
    [[nodiscard]] Duration elapsed() const;
    [[nodiscard]] Duration remaining() const;
    [[nodiscard]] double currentWpm() const noexcept { return wpm_.current(); }
    [[nodiscard]] double averageWpm() const noexcept { return wpm_.average(); }
    [[nodiscard]] double peakWpm() const noexcept { return wpm_.peak(); }

    [[nodiscard]] PositionStatus positionStatus(std::size_t index) const;
    [[nodiscard]] SessionSummary summary() const;

private:
    void resetState(std::string target_text);
    void startKeyTimer(TimePoint now);
    void applyCharacter(char typed, TimePoint now);
    void applyBackspace(TimePoint now);
    void advanceCursor(TimePoint now);
    void markMiss(char expected);

    SessionSettings settings_;
    TimeSourcePtr clock_;
    SessionState state_;
    KeyMetricsTracker key_metrics_;
    WpmSampler wpm_;
    std::optional<TimePoint> key_timer_start_;
};

}  // namespace tt::trainer
