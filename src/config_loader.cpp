#include "typing_trainer/config_loader.hpp"

#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "typing_trainer/history_recorder.hpp"

namespace tt::trainer {

namespace {

template <typename T>
T checkedRange(std::int64_t value, const char* what) {
    if (value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::string("Config value out of range: ") + what);
    }
    return static_cast<T>(value);
}

std::filesystem::path resolvePath(const std::filesystem::path& base_dir, const std::string& value) {
    std::filesystem::path p(value);
    if (p.is_relative() && !base_dir.empty()) {
        return base_dir / p;
    }
    return p;
}

void loadSession(const toml::table& tbl, TrainerConfig& config) {
    auto session = tbl["session"];
    if (auto duration = session["duration"].value<std::int64_t>()) {
        config.duration = validateDuration(*duration);
    }
    if (auto correction = session["require_correction"].value<bool>()) {
        config.require_correction = *correction;
    }
}

void loadText(const toml::table& tbl, const std::filesystem::path& base_dir, TrainerConfig& config) {
    auto text = tbl["text"];
    if (auto source = text["source"].value<std::string>()) {
        auto parsed = parseTextSource(*source);
        if (!parsed) {
            throw std::runtime_error("Invalid text source '" + *source +
                                     "'. Valid options: google, system, builtin");
        }
        config.text_source = *parsed;
    }
    if (auto length = text["max_word_length"].value<std::int64_t>()) {
        config.max_word_length = validateMaxWordLength(*length);
    }
    if (auto dict = text["dictionary"].value<std::string>()) {
        config.dictionary_path = resolvePath(base_dir, *dict);
    }
}

void loadHistory(const toml::table& tbl, const std::filesystem::path& base_dir, TrainerConfig& config) {
    auto history = tbl["history"];
    if (auto enabled = history["enabled"].value<bool>()) {
        config.history_enabled = *enabled;
    }
    if (auto path = history["path"].value<std::string>()) {
        config.history_path = resolvePath(base_dir, *path);
    }
}

KeyboardConfig loadKeyboard(const toml::table& keyboard, const std::filesystem::path& base_dir) {
    KeyboardConfig kb;
    kb.name = keyboard["name"].value_or(std::string("Keyboard"));
    kb.vendor_id = checkedRange<std::uint16_t>(keyboard["vendor_id"].value_or(std::int64_t{0}), "keyboard.vendor_id");
    kb.product_id = checkedRange<std::uint16_t>(keyboard["product_id"].value_or(std::int64_t{0}), "keyboard.product_id");
    kb.packet_length = checkedRange<std::size_t>(keyboard["packet_length"].value_or(std::int64_t{0}), "keyboard.packet_length");

    if (auto arr = keyboard["packet_header"].as_array()) {
        for (const auto& byte : *arr) {
            auto value = byte.value<std::int64_t>();
            if (!value) {
                throw std::runtime_error("keyboard.packet_header must contain integers");
            }
            kb.packet_header.push_back(checkedRange<std::uint8_t>(*value, "keyboard.packet_header"));
        }
    }
    if (auto page = keyboard["usage_page"].value<std::int64_t>()) {
        kb.usage_page = checkedRange<std::uint16_t>(*page, "keyboard.usage_page");
    }
    if (auto usage = keyboard["usage"].value<std::int64_t>()) {
        kb.usage = checkedRange<std::uint16_t>(*usage, "keyboard.usage");
    }

    kb.transport = keyboard["transport"].value_or(std::string("hidapi"));

    auto layout = keyboard["layout"].value<std::string>();
    if (!layout || layout->empty()) {
        throw std::runtime_error("Missing keyboard.layout");
    }
    kb.layout = resolvePath(base_dir, *layout);

    const std::string heatmap = keyboard["heatmap"].value_or(std::string("speed"));
    auto kind = parseHeatmapKind(heatmap);
    if (!kind) {
        throw std::runtime_error("Invalid keyboard.heatmap '" + heatmap + "'. Valid options: speed, accuracy");
    }
    kb.heatmap = *kind;
    return kb;
}

TrainerConfig fromTable(const toml::table& tbl, const std::filesystem::path& base_dir) {
    TrainerConfig config;
    config.history_path = defaultHistoryPath();
    loadSession(tbl, config);
    loadText(tbl, base_dir, config);
    loadHistory(tbl, base_dir, config);
    if (auto keyboard = tbl["keyboard"].as_table()) {
        config.keyboard = loadKeyboard(*keyboard, base_dir);
    }
    return config;
}

}  // namespace

std::chrono::seconds validateDuration(std::int64_t seconds) {
    if (seconds <= 0) {
        throw std::invalid_argument("Duration must be a positive number of seconds");
    }
    return std::chrono::seconds(seconds);
}

std::size_t validateMaxWordLength(std::int64_t length) {
    if (length < static_cast<std::int64_t>(kMinWordLength)) {
        throw std::invalid_argument("Word length must be at least " + std::to_string(kMinWordLength));
    }
    if (length > static_cast<std::int64_t>(kMaxWordLengthLimit)) {
        throw std::invalid_argument("Word length must be " + std::to_string(kMaxWordLengthLimit) + " or less");
    }
    return static_cast<std::size_t>(length);
}

std::optional<std::filesystem::path> defaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "typing-trainer" / "config.toml";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".config" / "typing-trainer" / "config.toml";
    }
    return std::nullopt;
}

KeyboardModel buildKeyboardModel(const KeyboardConfig& config) {
    return KeyboardModel(config.name,
                         config.vendor_id,
                         config.product_id,
                         config.packet_header,
                         config.packet_length,
                         readLayoutFile(config.layout),
                         config.usage_page,
                         config.usage);
}

TrainerConfig ConfigLoader::loadFromFile(const std::filesystem::path& path) const {
    toml::table tbl;
    try {
        tbl = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "TOML Parse Error in " << path.string() << ": " << err.description()
            << " (" << err.source().begin << ")";
        throw std::runtime_error(oss.str());
    }
    try {
        return fromTable(tbl, std::filesystem::absolute(path).parent_path());
    } catch (const std::invalid_argument& err) {
        throw std::runtime_error(path.string() + ": " + err.what());
    }
}

TrainerConfig ConfigLoader::loadFromString(const std::string& text,
                                           const std::filesystem::path& base_dir) const {
    toml::table tbl;
    try {
        tbl = toml::parse(text);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error: " + std::string(err.description()));
    }
    try {
        return fromTable(tbl, base_dir);
    } catch (const std::invalid_argument& err) {
        throw std::runtime_error(err.what());
    }
}

}  // namespace tt::trainer
