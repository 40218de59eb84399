#include "typing_trainer/session_engine.hpp"

#include <stdexcept>
#include <utility>

namespace tt::trainer {

SessionEngine::SessionEngine(std::string target_text, SessionSettings settings, TimeSourcePtr clock)
    : settings_(settings), clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("SessionEngine requires a time source");
    }
    resetState(std::move(target_text));
}

void SessionEngine::restart(std::string target_text) {
    resetState(std::move(target_text));
}

void SessionEngine::resetState(std::string target_text) {
    state_ = SessionState{};
    state_.correction_marks.assign(target_text.size(), false);
    state_.target_text = std::move(target_text);
    state_.correction_mode = settings_.correction_mode;
    key_metrics_.clear();
    wpm_.clear();
    key_timer_start_.reset();
}

void SessionEngine::applyKeystroke(const Keystroke& input) {
    if (state_.finished) {
        return;
    }

    const TimePoint now = clock_->now();
    if (!state_.started_at) {
        state_.started_at = now;
        startKeyTimer(now);
    }

    switch (input.kind) {
        case Keystroke::Kind::Character:
            applyCharacter(input.ch, now);
            break;
        case Keystroke::Kind::Backspace:
            applyBackspace(now);
            break;
    }
}

void SessionEngine::tickTimeout(TimePoint now) {
    if (state_.finished || !state_.started_at) {
        return;
    }
    if (now - *state_.started_at >= settings_.duration) {
        state_.finished = true;
    }
}

void SessionEngine::startKeyTimer(TimePoint now) {
    if (state_.cursor < state_.target_text.size()) {
        key_timer_start_ = now;
    } else {
        key_timer_start_.reset();
    }
}

void SessionEngine::applyCharacter(char typed, TimePoint now) {
    if (state_.cursor >= state_.target_text.size()) {
        return;
    }

    const char expected = state_.target_text[state_.cursor];
    if (key_timer_start_) {
        key_metrics_.recordAttempt(expected, now - *key_timer_start_);
    }

    const bool match = typed == expected;
    ++state_.total_keystrokes;

    if (state_.correction_mode) {
        // The cursor stays put until the expected character arrives.
        if (match) {
            state_.typed_echo.push_back(typed);
            advanceCursor(now);
            wpm_.maybeSample(toSeconds(now - *state_.started_at), state_.cursor);
        } else {
            markMiss(expected);
        }
    } else {
        state_.typed_echo.push_back(typed);
        if (match) {
            advanceCursor(now);
            wpm_.maybeSample(toSeconds(now - *state_.started_at), state_.cursor);
        } else {
            markMiss(expected);
            advanceCursor(now);
        }
    }

    if (state_.cursor == state_.target_text.size()) {
        state_.finished = true;
    }
}

void SessionEngine::applyBackspace(TimePoint now) {
    if (state_.typed_echo.empty()) {
        return;
    }
    state_.typed_echo.pop_back();
    ++state_.total_keystrokes;
    if (state_.cursor > 0) {
        --state_.cursor;
        startKeyTimer(now);
    }
}

void SessionEngine::advanceCursor(TimePoint now) {
    ++state_.cursor;
    startKeyTimer(now);
}

void SessionEngine::markMiss(char expected) {
    ++state_.total_errors;
    key_metrics_.recordError(expected);
    state_.correction_marks[state_.cursor] = true;
}

double SessionEngine::currentAccuracy() const noexcept {
    if (state_.total_keystrokes == 0) {
        return 100.0;
    }
    const auto correct = state_.total_keystrokes - state_.total_errors;
    return static_cast<double>(correct) / static_cast<double>(state_.total_keystrokes) * 100.0;
}

Duration SessionEngine::elapsed() const {
    if (!state_.started_at) {
        return Duration{0};
    }
    return clock_->now() - *state_.started_at;
}

Duration SessionEngine::remaining() const {
    const Duration left = std::chrono::duration_cast<Duration>(settings_.duration) - elapsed();
    return left > Duration{0} ? left : Duration{0};
}

PositionStatus SessionEngine::positionStatus(std::size_t index) const {
    if (index >= state_.target_text.size()) {
        throw std::out_of_range("SessionEngine::positionStatus index out of range");
    }
    if (index < state_.typed_echo.size()) {
        if (state_.typed_echo[index] != state_.target_text[index]) {
            return PositionStatus::Mistyped;
        }
        return state_.correction_marks[index] ? PositionStatus::Corrected : PositionStatus::Correct;
    }
    if (index == state_.cursor) {
        return PositionStatus::Cursor;
    }
    return PositionStatus::Pending;
}

SessionSummary SessionEngine::summary() const {
    SessionSummary out;
    out.average_wpm = wpm_.average();
    out.peak_wpm = wpm_.peak();
    out.accuracy = currentAccuracy();
    out.characters_typed = state_.cursor;
    out.errors = state_.total_errors;
    out.duration = settings_.duration;
    out.correction_mode = state_.correction_mode;
    return out;
}

}  // namespace tt::trainer
