#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "typing_trainer/session_engine.hpp"

namespace tt::trainer {

struct InputEvent {
    enum class Kind { Character, Backspace, Enter, Escape };

    Kind kind{Kind::Character};
    char ch{'\0'};
};

// Results-screen extras that live outside the engine.
struct ResultsContext {
    std::string text_source;
    std::string notice;  // e.g. a history write failure
};

// Read-only window onto a running session plus its input source.
class SessionView {
public:
    virtual ~SessionView() = default;

    // Waits at most `timeout`; nothing when no key arrived.
    virtual std::optional<InputEvent> pollInput(std::chrono::milliseconds timeout) = 0;
    virtual void drawTyping(const SessionEngine& engine) = 0;
    virtual void drawResults(const SessionEngine& engine, const ResultsContext& context) = 0;
};

}  // namespace tt::trainer
