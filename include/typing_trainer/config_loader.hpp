#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "typing_trainer/keyboard_heatmap.hpp"
#include "typing_trainer/text_provider.hpp"

namespace tt::trainer {

struct KeyboardConfig {
    std::string name{"Keyboard"};
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};
    std::vector<std::uint8_t> packet_header;
    std::size_t packet_length{0};
    std::optional<std::uint16_t> usage_page;
    std::optional<std::uint16_t> usage;
    std::string transport{"hidapi"};
    std::filesystem::path layout;
    HeatmapKind heatmap{HeatmapKind::Speed};
};

struct TrainerConfig {
    std::chrono::seconds duration{30};
    bool require_correction{false};
    TextSource text_source{TextSource::Google};
    std::size_t max_word_length{7};
    std::filesystem::path dictionary_path{"/usr/share/dict/words"};
    bool history_enabled{true};
    std::filesystem::path history_path;
    std::optional<KeyboardConfig> keyboard;
};

// Both throw std::invalid_argument with a user-facing message.
std::chrono::seconds validateDuration(std::int64_t seconds);
std::size_t validateMaxWordLength(std::int64_t length);

// $XDG_CONFIG_HOME/typing-trainer/config.toml, else ~/.config/typing-trainer/config.toml.
[[nodiscard]] std::optional<std::filesystem::path> defaultConfigPath();

[[nodiscard]] KeyboardModel buildKeyboardModel(const KeyboardConfig& config);

class ConfigLoader {
public:
    // Relative paths in the file resolve against the file's directory.
    [[nodiscard]] TrainerConfig loadFromFile(const std::filesystem::path& path) const;
    [[nodiscard]] TrainerConfig loadFromString(const std::string& text,
                                               const std::filesystem::path& base_dir) const;
};

}  // namespace tt::trainer
