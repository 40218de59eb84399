#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "typing_trainer/config_loader.hpp"
#include "typing_trainer/text_provider.hpp"

namespace tt::trainer {

class CommandLineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Only what was given on the command line; everything else comes from the
// config file or the defaults.
struct CommandLine {
    std::optional<std::chrono::seconds> duration;
    bool require_correction{false};
    std::optional<TextSource> text_source;
    std::optional<std::size_t> max_word_length;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> history_path;
    bool no_history{false};
    bool show_help{false};
    bool show_version{false};
};

// Throws CommandLineError for unknown options and invalid values.
[[nodiscard]] CommandLine parseCommandLine(int argc, const char* const* argv);

void applyCommandLine(const CommandLine& cli, TrainerConfig& config);

[[nodiscard]] std::string usageText(const std::string& program);

}  // namespace tt::trainer
