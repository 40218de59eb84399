#include "typing_trainer/history_recorder.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tt::trainer {

namespace {
constexpr const char* kHistoryFilename = ".typing_trainer_history.csv";
}  // namespace

HistoryRecord makeHistoryRecord(const SessionSummary& summary,
                                std::int64_t unix_timestamp,
                                std::string text_source,
                                std::size_t max_word_length) {
    HistoryRecord record;
    record.timestamp = unix_timestamp;
    record.duration_seconds = static_cast<std::int64_t>(summary.duration.count());
    record.avg_wpm = summary.average_wpm;
    record.peak_wpm = summary.peak_wpm;
    record.accuracy = summary.accuracy;
    record.characters_typed = summary.characters_typed;
    record.errors = summary.errors;
    record.correction_mode = summary.correction_mode;
    record.text_source = std::move(text_source);
    record.max_word_length = max_word_length;
    return record;
}

std::filesystem::path defaultHistoryPath() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / kHistoryFilename;
    }
    return std::filesystem::current_path() / kHistoryFilename;
}

HistoryRecorder::HistoryRecorder(std::filesystem::path path) : path_(std::move(path)) {}

std::string HistoryRecorder::formatLine(const HistoryRecord& record) {
    std::ostringstream oss;
    oss << record.timestamp << ',' << record.duration_seconds << ','
        << std::fixed << std::setprecision(2)
        << record.avg_wpm << ',' << record.peak_wpm << ',' << record.accuracy << ','
        << record.characters_typed << ',' << record.errors << ','
        << (record.correction_mode ? "true" : "false") << ','
        << record.text_source << ',' << record.max_word_length;
    return oss.str();
}

void HistoryRecorder::append(const HistoryRecord& record) const {
    std::error_code ec;
    const bool file_exists = std::filesystem::exists(path_, ec);

    std::ofstream out(path_, std::ios::out | std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open history file: " + path_.string());
    }
    if (!file_exists) {
        out << kHeader << '\n';
    }
    out << formatLine(record) << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write history file: " + path_.string());
    }
}

}  // namespace tt::trainer
