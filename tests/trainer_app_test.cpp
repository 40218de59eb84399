#include <catch2/catch.hpp>

#include <deque>
#include <sstream>

#include "test_support.hpp"
#include "typing_trainer/logging_transport.hpp"
#include "typing_trainer/trainer_app.hpp"

using namespace tt::trainer;
using namespace std::chrono_literals;

namespace {

// One scripted poll: the clock moves by `advance`, then `event` is delivered.
struct Step {
    std::optional<InputEvent> event;
    Duration advance{0};
};

Step key(char ch) { return Step{InputEvent{InputEvent::Kind::Character, ch}, Duration{0}}; }
Step idle(Duration advance) { return Step{std::nullopt, advance}; }
Step enter() { return Step{InputEvent{InputEvent::Kind::Enter, '\0'}, Duration{0}}; }
Step escape() { return Step{InputEvent{InputEvent::Kind::Escape, '\0'}, Duration{0}}; }

class ScriptedView : public SessionView {
public:
    ScriptedView(std::shared_ptr<ManualTimeSource> clock, std::deque<Step> script)
        : clock_(std::move(clock)), script_(std::move(script)) {}

    std::optional<InputEvent> pollInput(std::chrono::milliseconds) override {
        if (script_.empty()) {
            return InputEvent{InputEvent::Kind::Escape, '\0'};
        }
        Step step = script_.front();
        script_.pop_front();
        clock_->advance(step.advance);
        return step.event;
    }

    void drawTyping(const SessionEngine& engine) override {
        ++typing_draws;
        last_cursor = engine.state().cursor;
    }

    void drawResults(const SessionEngine& engine, const ResultsContext& context) override {
        ++results_draws;
        last_results = context;
        last_summary = engine.summary();
    }

    int typing_draws{0};
    int results_draws{0};
    std::size_t last_cursor{0};
    ResultsContext last_results;
    SessionSummary last_summary;

private:
    std::shared_ptr<ManualTimeSource> clock_;
    std::deque<Step> script_;
};

TextCorpusPtr repeatingCorpus() {
    auto corpus = std::make_shared<TextCorpus>();
    corpus->excerpts = {"abc"};
    return corpus;
}

TrainerConfig shortSession(const std::filesystem::path& history) {
    TrainerConfig config;
    config.duration = 2s;
    config.text_source = TextSource::Builtin;
    config.history_path = history;
    return config;
}

}  // namespace

TEST_CASE("the deadline ends the session and records it once", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    ScriptedView view(clock, {key('a'), key('b'), idle(1s), idle(1s), idle(0s), escape()});
    TrainerApp app(shortSession(dir.path / "history.csv"), TextProvider(repeatingCorpus(), 1), view, clock);

    app.run();

    CHECK(app.sessionsCompleted() == 1);
    CHECK(app.engine().finished());
    CHECK(view.results_draws == 2);
    CHECK(view.last_results.text_source == "builtin");
    CHECK(view.last_results.notice.empty());
    CHECK(view.last_summary.characters_typed == 2);

    const auto lines = test::readLines(dir.path / "history.csv");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == HistoryRecorder::kHeader);
    CHECK(lines[1].find(",2,0.00,0.00,100.00,2,0,false,builtin,7") != std::string::npos);
}

TEST_CASE("enter on the results screen starts a fresh session", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    ScriptedView view(clock, {key('a'), idle(2s), enter(), key('a'), key('b'), escape()});
    TrainerApp app(shortSession(dir.path / "history.csv"), TextProvider(repeatingCorpus(), 1), view, clock);

    app.run();

    CHECK(app.sessionsCompleted() == 1);
    CHECK_FALSE(app.engine().finished());
    CHECK(app.engine().state().cursor == 2);
    CHECK(app.engine().state().total_keystrokes == 2);
    CHECK(test::readLines(dir.path / "history.csv").size() == 2);
}

TEST_CASE("enter while typing is ignored", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    ScriptedView view(clock, {key('a'), enter(), key('b'), escape()});
    TrainerApp app(shortSession(dir.path / "history.csv"), TextProvider(repeatingCorpus(), 1), view, clock);

    app.run();

    CHECK(app.engine().state().cursor == 2);
    CHECK(view.results_draws == 0);
}

TEST_CASE("escape while typing quits without recording", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    ScriptedView view(clock, {key('a'), key('x'), escape()});
    TrainerApp app(shortSession(dir.path / "history.csv"), TextProvider(repeatingCorpus(), 1), view, clock);

    app.run();

    CHECK(app.sessionsCompleted() == 0);
    CHECK(view.results_draws == 0);
    CHECK(view.typing_draws == 3);
    CHECK(view.last_cursor == 2);
    CHECK_FALSE(std::filesystem::exists(dir.path / "history.csv"));
}

TEST_CASE("backspace events reach the engine", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    ScriptedView view(clock, {key('a'), Step{InputEvent{InputEvent::Kind::Backspace, '\0'}, Duration{0}},
                              escape()});
    TrainerApp app(shortSession(dir.path / "history.csv"), TextProvider(repeatingCorpus(), 1), view, clock);

    app.run();

    CHECK(app.engine().state().cursor == 0);
    CHECK(app.engine().state().total_keystrokes == 2);
}

TEST_CASE("a failed history write still shows the results", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    ScriptedView view(clock, {key('a'), idle(2s), escape()});
    TrainerApp app(shortSession(dir.path / "missing" / "history.csv"),
                   TextProvider(repeatingCorpus(), 1), view, clock);

    app.run();

    CHECK(app.sessionsCompleted() == 1);
    CHECK(view.results_draws == 1);
    CHECK(view.last_results.notice.rfind("History not saved", 0) == 0);
}

TEST_CASE("disabled history writes nothing", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    auto config = shortSession(dir.path / "history.csv");
    config.history_enabled = false;
    ScriptedView view(clock, {key('a'), idle(2s), escape()});
    TrainerApp app(std::move(config), TextProvider(repeatingCorpus(), 1), view, clock);

    app.run();

    CHECK(app.sessionsCompleted() == 1);
    CHECK_FALSE(std::filesystem::exists(dir.path / "history.csv"));
}

TEST_CASE("history keeps the configured source after a fallback", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    auto corpus = std::make_shared<TextCorpus>();
    corpus->excerpts = {"abc"};
    corpus->dictionary_path = dir.path / "no-words";
    auto config = shortSession(dir.path / "history.csv");
    config.text_source = TextSource::System;

    TextProvider provider(corpus, 1);
    provider.setWarningSink([](const std::string&) {});
    ScriptedView view(clock, {key('a'), idle(2s), escape()});
    TrainerApp app(std::move(config), std::move(provider), view, clock);

    app.run();

    CHECK(view.last_results.text_source == "builtin");
    const auto lines = test::readLines(dir.path / "history.csv");
    REQUIRE(lines.size() == 2);
    CHECK(lines[1].find(",system,7") != std::string::npos);
}

TEST_CASE("the keyboard is blanked at start and painted at the end", "[app]") {
    test::TempDir dir;
    auto clock = std::make_shared<ManualTimeSource>();
    std::ostringstream log;
    auto keyboard = std::make_unique<KeyboardHeatmap>(
        KeyboardModel("Tiny", 1, 2, {0x06}, 16, KeyboardModel::Layout{{"A", "B", "C"}}),
        std::make_unique<LoggingTransport>(log),
        HeatmapKind::Speed);
    ScriptedView view(clock, {key('a'), idle(2s), escape()});
    TrainerApp app(shortSession(dir.path / "history.csv"), TextProvider(repeatingCorpus(), 1), view, clock,
                   std::move(keyboard));

    app.run();

    const auto out = log.str();
    const auto first = out.find("for Tiny (");
    REQUIRE(first != std::string::npos);
    CHECK(out.find("for Tiny (", first + 1) != std::string::npos);
}
