#include "typing_trainer/terminal_ui.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>

#include <ncurses.h>

namespace tt::trainer {

namespace {

constexpr std::size_t kVisibleCharLimit = 300;
constexpr std::size_t kRankedKeys = 3;
constexpr int kEscape = 27;

enum Pair : short {
    kPairTimer = 1,
    kPairCorrect,
    kPairCorrected,
    kPairMistyped,
    kPairCursor,
    kPairPending,
    kPairStats,
    kPairTitle,
    kPairHint,
    kPairSpeedBase = 20,
    kPairAccuracyBase = 30,
};

constexpr std::array<SpeedBand, 7> kSpeedBands{
    SpeedBand::Fastest, SpeedBand::Fast, SpeedBand::Medium, SpeedBand::Slow,
    SpeedBand::Slowest, SpeedBand::NoData, SpeedBand::Unused};

constexpr std::array<AccuracyBand, 7> kAccuracyBands{
    AccuracyBand::Highest, AccuracyBand::High, AccuracyBand::Medium, AccuracyBand::Low,
    AccuracyBand::Lowest, AccuracyBand::NoData, AccuracyBand::Unused};

struct KeyboardRow {
    const char* keys;
    const char* indent;
};

constexpr std::array<KeyboardRow, 3> kQwertyRows{{
    {"qwertyuiop", "  "},
    {"asdfghjkl", "   "},
    {"zxcvbnm", "     "},
}};

// Nearest xterm-256 cube entry, or one of the eight base colors.
short terminalColor(RgbColor color) {
    if (COLORS >= 256) {
        auto level = [](std::uint8_t v) { return static_cast<int>(std::lround(v / 255.0 * 5.0)); };
        return static_cast<short>(16 + 36 * level(color.r) + 6 * level(color.g) + level(color.b));
    }
    static constexpr std::array<RgbColor, 8> kBase{{
        {0, 0, 0}, {205, 0, 0}, {0, 205, 0}, {205, 205, 0},
        {0, 0, 238}, {205, 0, 205}, {0, 205, 205}, {229, 229, 229},
    }};
    short best = COLOR_BLACK;
    long best_distance = -1;
    for (std::size_t i = 0; i < kBase.size(); ++i) {
        const long dr = static_cast<long>(color.r) - kBase[i].r;
        const long dg = static_cast<long>(color.g) - kBase[i].g;
        const long db = static_cast<long>(color.b) - kBase[i].b;
        const long distance = dr * dr + dg * dg + db * db;
        if (best_distance < 0 || distance < best_distance) {
            best_distance = distance;
            best = static_cast<short>(i);
        }
    }
    return best;
}

std::string keyLabel(char key) {
    return std::string("'") + key + "'";
}

std::string formatFixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

}  // namespace

ScopedLogCapture::ScopedLogCapture(std::ostream& stream)
    : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}

ScopedLogCapture::~ScopedLogCapture() {
    stream_.rdbuf(previous_);
    const auto captured = buffer_.str();
    if (!captured.empty()) {
        stream_ << captured << std::flush;
    }
}

TerminalUi::TerminalUi() : log_capture_(std::cerr) {
    initscr();
    noecho();
    cbreak();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);
    if (has_colors()) {
        start_color();
        use_default_colors();
        initColors();
        colors_ = true;
    }
}

TerminalUi::~TerminalUi() {
    endwin();
}

void TerminalUi::initColors() {
    init_pair(kPairTimer, COLOR_YELLOW, -1);
    init_pair(kPairCorrect, COLOR_GREEN, -1);
    init_pair(kPairCorrected, terminalColor(RgbColor{255, 165, 0}), -1);
    init_pair(kPairMistyped, COLOR_RED, -1);
    init_pair(kPairCursor, COLOR_BLACK, COLOR_WHITE);
    init_pair(kPairPending, terminalColor(RgbColor{110, 110, 110}), -1);
    init_pair(kPairStats, COLOR_CYAN, -1);
    init_pair(kPairTitle, COLOR_GREEN, -1);
    init_pair(kPairHint, COLOR_YELLOW, -1);
    for (std::size_t i = 0; i < kSpeedBands.size(); ++i) {
        init_pair(static_cast<short>(kPairSpeedBase + i), COLOR_BLACK, terminalColor(bandColor(kSpeedBands[i])));
    }
    for (std::size_t i = 0; i < kAccuracyBands.size(); ++i) {
        init_pair(static_cast<short>(kPairAccuracyBase + i), COLOR_BLACK, terminalColor(bandColor(kAccuracyBands[i])));
    }
}

std::optional<InputEvent> TerminalUi::pollInput(std::chrono::milliseconds wait) {
    wtimeout(stdscr, static_cast<int>(wait.count()));
    const int ch = wgetch(stdscr);
    if (ch == ERR) {
        return std::nullopt;
    }
    switch (ch) {
        case kEscape:
            return InputEvent{InputEvent::Kind::Escape, '\0'};
        case KEY_BACKSPACE:
        case 127:
        case 8:
            return InputEvent{InputEvent::Kind::Backspace, '\0'};
        case '\n':
        case '\r':
        case KEY_ENTER:
            return InputEvent{InputEvent::Kind::Enter, '\0'};
        default:
            break;
    }
    if (ch >= 32 && ch < 127) {
        return InputEvent{InputEvent::Kind::Character, static_cast<char>(ch)};
    }
    return std::nullopt;
}

void TerminalUi::drawCentered(int row, const std::string& text, int pair) {
    const int col = std::max(0, (COLS - static_cast<int>(text.size())) / 2);
    if (colors_) attron(COLOR_PAIR(pair));
    mvaddnstr(row, col, text.c_str(), COLS - col);
    if (colors_) attroff(COLOR_PAIR(pair));
}

void TerminalUi::drawTyping(const SessionEngine& engine) {
    werase(stdscr);

    const auto seconds_left = std::lround(toSeconds(engine.remaining()));
    drawCentered(0, std::to_string(seconds_left) + "s", kPairTimer);

    const auto& text = engine.state().target_text;
    const std::size_t visible = std::min(kVisibleCharLimit, text.size());
    const int width = std::max(1, COLS);
    const int last_text_row = std::max(2, LINES - 3);
    int row = 2;
    int col = 0;
    for (std::size_t i = 0; i < visible && row <= last_text_row; ++i) {
        const bool word_start = text[i] != ' ' && (i == 0 || text[i - 1] == ' ');
        if (word_start && col > 0) {
            const auto word_end = text.find(' ', i);
            const auto word_len = static_cast<int>((word_end == std::string::npos ? text.size() : word_end) - i);
            if (col + word_len > width) {
                ++row;
                col = 0;
            }
        }
        if (col >= width) {
            ++row;
            col = 0;
        }
        if (row > last_text_row) break;

        int attr = A_NORMAL;
        switch (engine.positionStatus(i)) {
            case PositionStatus::Correct: attr = colors_ ? COLOR_PAIR(kPairCorrect) : A_BOLD; break;
            case PositionStatus::Corrected: attr = colors_ ? COLOR_PAIR(kPairCorrected) : A_UNDERLINE; break;
            case PositionStatus::Mistyped: attr = colors_ ? COLOR_PAIR(kPairMistyped) : A_UNDERLINE; break;
            case PositionStatus::Cursor: attr = colors_ ? COLOR_PAIR(kPairCursor) : A_REVERSE; break;
            case PositionStatus::Pending: attr = colors_ ? COLOR_PAIR(kPairPending) : A_DIM; break;
        }
        attron(attr);
        mvaddch(row, col, static_cast<chtype>(static_cast<unsigned char>(text[i])));
        attroff(attr);
        ++col;
    }

    const std::string stats = "WPM: " + formatFixed(engine.currentWpm(), 0) +
                              " | Accuracy: " + formatFixed(engine.currentAccuracy(), 0) + "%";
    drawCentered(std::min(row + 2, LINES - 1), stats, kPairStats);
    wrefresh(stdscr);
}

int TerminalUi::drawStatsTable(int row, const SessionEngine& engine) {
    const auto summary = engine.summary();
    const std::array<std::pair<std::string, std::string>, 6> rows{{
        {"Average WPM", formatFixed(summary.average_wpm, 1)},
        {"Peak WPM", formatFixed(summary.peak_wpm, 1)},
        {"Accuracy", formatFixed(summary.accuracy, 1) + "%"},
        {"Characters Typed", std::to_string(summary.characters_typed)},
        {"Errors", std::to_string(summary.errors)},
        {"Test Duration", std::to_string(summary.duration.count()) + "s"},
    }};
    mvaddstr(row++, 2, "Results");
    for (const auto& [label, value] : rows) {
        mvprintw(row++, 4, "%-20s %s", label.c_str(), value.c_str());
    }
    return row;
}

template <typename BandFn>
int TerminalUi::drawKeyboard(int row, int col, BandFn band_pair) {
    for (const auto& kb_row : kQwertyRows) {
        move(row, col);
        addstr(kb_row.indent);
        for (const char* key = kb_row.keys; *key != '\0'; ++key) {
            const int attr = colors_ ? COLOR_PAIR(band_pair(*key)) : A_REVERSE;
            attron(attr);
            printw(" %c ", *key);
            attroff(attr);
            addch(' ');
        }
        ++row;
    }
    return row;
}

int TerminalUi::drawSpeedColumn(int row, int col, const KeyMetricsTracker& tracker,
                                const HeatmapColorMapper& mapper) {
    auto section = [&](const char* title, const std::vector<KeyLatency>& keys) {
        mvprintw(row++, col, "%-16s %s", title, "Time (ms)");
        if (keys.empty()) {
            mvprintw(row++, col, "%-16s %s", "No data", "-");
        }
        for (const auto& entry : keys) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(entry.mean).count();
            mvprintw(row++, col, "%-16s %lld", keyLabel(entry.key).c_str(), static_cast<long long>(ms));
        }
        ++row;
    };
    section("Fastest Keys", tracker.fastest(kRankedKeys));
    section("Slowest Keys", tracker.slowest(kRankedKeys));

    mvaddstr(row++, col, "Speed Heatmap:");
    return drawKeyboard(row, col, [&](char key) {
        const auto band = mapper.speedBand(key);
        const auto it = std::find(kSpeedBands.begin(), kSpeedBands.end(), band);
        return static_cast<int>(kPairSpeedBase + (it - kSpeedBands.begin()));
    });
}

int TerminalUi::drawAccuracyColumn(int row, int col, const KeyMetricsTracker& tracker,
                                   const HeatmapColorMapper& mapper) {
    mvprintw(row++, col, "%-16s %s", "Problem Keys", "Errors");
    for (const auto& entry : tracker.mostErrorProne(kRankedKeys)) {
        mvprintw(row++, col, "%-16s %zu", keyLabel(entry.key).c_str(), entry.errors);
    }
    ++row;
    mvprintw(row++, col, "%-16s %s", "Best Keys", "Accuracy");
    for (const auto& entry : tracker.mostAccurate(kRankedKeys)) {
        mvprintw(row++, col, "%-16s %s%%", keyLabel(entry.key).c_str(), formatFixed(entry.percent, 0).c_str());
    }
    ++row;

    mvaddstr(row++, col, "Accuracy Heatmap:");
    return drawKeyboard(row, col, [&](char key) {
        const auto band = mapper.accuracyBand(key);
        const auto it = std::find(kAccuracyBands.begin(), kAccuracyBands.end(), band);
        return static_cast<int>(kPairAccuracyBase + (it - kAccuracyBands.begin()));
    });
}

void TerminalUi::drawWpmChart(int row, int height, const SessionEngine& engine) {
    const auto& samples = engine.wpm().samples();
    if (samples.empty() || height < 3) {
        return;
    }

    const int plot_rows = height - 2;
    const int axis_col = 6;
    const int plot_cols = std::max(10, COLS - axis_col - 4);
    const double max_wpm = std::max(60.0, engine.peakWpm());
    const double duration = std::max(1.0, static_cast<double>(engine.settings().duration.count()));

    mvaddstr(row, 2, "WPM Performance");
    const int top = row + 1;
    mvprintw(top, 0, "%5.0f", max_wpm);
    mvprintw(top + plot_rows - 1, 0, "%5d", 0);
    for (int r = 0; r < plot_rows; ++r) {
        mvaddch(top + r, axis_col - 1, '|');
    }

    if (colors_) attron(COLOR_PAIR(kPairStats));
    for (const auto& sample : samples) {
        const double x_ratio = std::clamp(sample.elapsed_seconds / duration, 0.0, 1.0);
        const double y_ratio = std::clamp(sample.wpm / max_wpm, 0.0, 1.0);
        const int x = static_cast<int>(std::lround(x_ratio * (plot_cols - 1)));
        const int y = static_cast<int>(std::lround(y_ratio * (plot_rows - 1)));
        mvaddch(top + (plot_rows - 1 - y), axis_col + x, '*');
    }
    if (colors_) attroff(COLOR_PAIR(kPairStats));

    mvprintw(top + plot_rows, axis_col, "0s");
    const std::string end_label = formatFixed(duration, 0) + "s";
    mvaddstr(top + plot_rows, axis_col + plot_cols - static_cast<int>(end_label.size()), end_label.c_str());
}

void TerminalUi::drawResults(const SessionEngine& engine, const ResultsContext& context) {
    werase(stdscr);

    if (colors_) attron(A_BOLD);
    drawCentered(0, "Test Complete!", kPairTitle);
    if (colors_) attroff(A_BOLD);

    int row = drawStatsTable(2, engine);
    if (!context.text_source.empty()) {
        mvprintw(row++, 4, "%-20s %s", "Text Source", context.text_source.c_str());
    }
    ++row;

    const HeatmapColorMapper mapper(engine.keyMetrics());
    const int left_end = drawSpeedColumn(row, 2, engine.keyMetrics(), mapper);
    const int right_end = drawAccuracyColumn(row, std::max(40, COLS / 2), engine.keyMetrics(), mapper);
    row = std::max(left_end, right_end) + 1;

    const int footer_rows = context.notice.empty() ? 2 : 3;
    drawWpmChart(row, LINES - row - footer_rows, engine);

    if (!context.notice.empty()) {
        drawCentered(LINES - 2, context.notice, kPairMistyped);
    }
    drawCentered(LINES - 1, "Press ESC to exit or ENTER to restart", kPairHint);
    wrefresh(stdscr);
}

}  // namespace tt::trainer
