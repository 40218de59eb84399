#include "typing_trainer/trainer_app.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace tt::trainer {

namespace {

SessionSettings settingsFrom(const TrainerConfig& config) {
    SessionSettings settings;
    settings.duration = config.duration;
    settings.correction_mode = config.require_correction;
    return settings;
}

}  // namespace

TrainerApp::TrainerApp(TrainerConfig config,
                       TextProvider text_provider,
                       SessionView& view,
                       TimeSourcePtr clock,
                       std::unique_ptr<KeyboardHeatmap> keyboard)
    : config_(std::move(config)),
      text_provider_(std::move(text_provider)),
      view_(view),
      clock_(std::move(clock)),
      keyboard_(std::move(keyboard)),
      engine_(nextText(), settingsFrom(config_), clock_) {
    if (config_.history_enabled) {
        history_.emplace(config_.history_path);
    }
    if (keyboard_ && keyboard_->connect()) {
        keyboard_->blank();
    }
}

std::string TrainerApp::nextText() {
    auto generated = text_provider_.generate(config_.text_source, config_.max_word_length);
    active_source_ = generated.source;
    return std::move(generated.text);
}

void TrainerApp::run() {
    Phase phase = Phase::Typing;
    while (phase != Phase::Quit) {
        phase = phase == Phase::Typing ? runTyping() : runResults();
    }
}

TrainerApp::Phase TrainerApp::runTyping() {
    while (true) {
        view_.drawTyping(engine_);

        if (auto event = view_.pollInput(kTypingPollInterval)) {
            switch (event->kind) {
                case InputEvent::Kind::Escape:
                    return Phase::Quit;
                case InputEvent::Kind::Character:
                    engine_.applyKeystroke(Keystroke::character(event->ch));
                    break;
                case InputEvent::Kind::Backspace:
                    engine_.applyKeystroke(Keystroke::backspace());
                    break;
                case InputEvent::Kind::Enter:
                    break;
            }
        }

        // Runs even without input so an idle typist still hits the deadline.
        engine_.tickTimeout(clock_->now());

        if (engine_.finished()) {
            finishSession();
            return Phase::Results;
        }
    }
}

TrainerApp::Phase TrainerApp::runResults() {
    while (true) {
        view_.drawResults(engine_, results_);

        auto event = view_.pollInput(kResultsPollInterval);
        if (!event) continue;
        if (event->kind == InputEvent::Kind::Escape) {
            return Phase::Quit;
        }
        if (event->kind == InputEvent::Kind::Enter) {
            engine_.restart(nextText());
            results_ = ResultsContext{};
            if (keyboard_) {
                keyboard_->blank();
            }
            return Phase::Typing;
        }
    }
}

void TrainerApp::finishSession() {
    ++sessions_completed_;
    results_.text_source = std::string(textSourceName(active_source_));
    results_.notice.clear();
    recordHistory();
    if (keyboard_) {
        keyboard_->show(HeatmapColorMapper(engine_.keyMetrics()));
    }
}

void TrainerApp::recordHistory() {
    if (!history_) {
        return;
    }
    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    // The configured source is logged, even when text fell back to the excerpts.
    auto record = makeHistoryRecord(engine_.summary(),
                                    static_cast<std::int64_t>(timestamp),
                                    std::string(textSourceName(config_.text_source)),
                                    config_.max_word_length);
    try {
        history_->append(record);
    } catch (const std::runtime_error& err) {
        std::cerr << "[TrainerApp] Warning: Failed to save test history: " << err.what() << '\n';
        results_.notice = "History not saved: " + std::string(err.what());
    }
}

}  // namespace tt::trainer
