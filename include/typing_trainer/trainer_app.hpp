#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

#include "typing_trainer/config_loader.hpp"
#include "typing_trainer/history_recorder.hpp"
#include "typing_trainer/keyboard_heatmap.hpp"
#include "typing_trainer/session_engine.hpp"
#include "typing_trainer/session_view.hpp"
#include "typing_trainer/text_provider.hpp"
#include "typing_trainer/time_source.hpp"

namespace tt::trainer {

inline constexpr std::chrono::milliseconds kTypingPollInterval{50};
inline constexpr std::chrono::milliseconds kResultsPollInterval{100};

// Cooperative single-threaded loop: poll, apply, check the deadline, draw.
class TrainerApp {
public:
    TrainerApp(TrainerConfig config,
               TextProvider text_provider,
               SessionView& view,
               TimeSourcePtr clock,
               std::unique_ptr<KeyboardHeatmap> keyboard = nullptr);

    // Returns when the user quits.
    void run();

    [[nodiscard]] const SessionEngine& engine() const noexcept { return engine_; }
    [[nodiscard]] std::size_t sessionsCompleted() const noexcept { return sessions_completed_; }

private:
    enum class Phase { Typing, Results, Quit };

    Phase runTyping();
    Phase runResults();
    void finishSession();
    void recordHistory();
    [[nodiscard]] std::string nextText();

    TrainerConfig config_;
    TextProvider text_provider_;
    SessionView& view_;
    TimeSourcePtr clock_;
    std::unique_ptr<KeyboardHeatmap> keyboard_;
    std::optional<HistoryRecorder> history_;
    TextSource active_source_{TextSource::Builtin};
    SessionEngine engine_;
    ResultsContext results_;
    std::size_t sessions_completed_{0};
};

}  // namespace tt::trainer
