#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "typing_trainer/session_engine.hpp"

namespace tt::trainer {

struct HistoryRecord {
    std::int64_t timestamp{0};
    std::int64_t duration_seconds{0};
    double avg_wpm{0.0};
    double peak_wpm{0.0};
    double accuracy{0.0};
    std::size_t characters_typed{0};
    std::size_t errors{0};
    bool correction_mode{false};
    std::string text_source;
    std::size_t max_word_length{0};
};

[[nodiscard]] HistoryRecord makeHistoryRecord(const SessionSummary& summary,
                                              std::int64_t unix_timestamp,
                                              std::string text_source,
                                              std::size_t max_word_length);

// $HOME/.typing_trainer_history.csv, or the working directory without HOME.
[[nodiscard]] std::filesystem::path defaultHistoryPath();

class HistoryRecorder {
public:
    static constexpr const char* kHeader =
        "timestamp,duration_seconds,avg_wpm,peak_wpm,accuracy,"
        "characters_typed,errors,correction_mode,text_source,max_word_length";

    explicit HistoryRecorder(std::filesystem::path path);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Appends one line, writing the header first for a new file.
    // Throws std::runtime_error when the file cannot be written.
    void append(const HistoryRecord& record) const;

    [[nodiscard]] static std::string formatLine(const HistoryRecord& record);

private:
    std::filesystem::path path_;
};

}  // namespace tt::trainer
