#pragma once

#include <iosfwd>
#include <sstream>
#include <streambuf>

#include "typing_trainer/heatmap_color_mapper.hpp"
#include "typing_trainer/session_view.hpp"

namespace tt::trainer {

// Holds back everything written to a stream and replays it on destruction,
// so log lines land after the full-screen UI is gone.
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(std::ostream& stream);
    ~ScopedLogCapture();

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

// ncurses front end. Only one may exist at a time.
class TerminalUi : public SessionView {
public:
    TerminalUi();
    ~TerminalUi() override;

    TerminalUi(const TerminalUi&) = delete;
    TerminalUi& operator=(const TerminalUi&) = delete;

    std::optional<InputEvent> pollInput(std::chrono::milliseconds timeout) override;
    void drawTyping(const SessionEngine& engine) override;
    void drawResults(const SessionEngine& engine, const ResultsContext& context) override;

private:
    void initColors();
    void drawCentered(int row, const std::string& text, int pair);
    int drawStatsTable(int row, const SessionEngine& engine);
    int drawSpeedColumn(int row, int col, const KeyMetricsTracker& tracker, const HeatmapColorMapper& mapper);
    int drawAccuracyColumn(int row, int col, const KeyMetricsTracker& tracker, const HeatmapColorMapper& mapper);
    template <typename BandFn>
    int drawKeyboard(int row, int col, BandFn band_pair);
    void drawWpmChart(int row, int height, const SessionEngine& engine);

    ScopedLogCapture log_capture_;
    bool colors_{false};
};

}  // namespace tt::trainer
