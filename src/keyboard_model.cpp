#include "typing_trainer/keyboard_model.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "typing_trainer/string_util.hpp"

namespace tt::trainer {

namespace {

constexpr const char* kNoKey = "NAN";

}  // namespace

KeyboardModel::KeyboardModel(std::string name,
                             std::uint16_t vendor_id,
                             std::uint16_t product_id,
                             std::vector<std::uint8_t> packet_header,
                             std::size_t packet_length,
                             Layout layout,
                             std::optional<std::uint16_t> interface_usage_page,
                             std::optional<std::uint16_t> interface_usage)
    : name_(std::move(name)),
      vendor_id_(vendor_id),
      product_id_(product_id),
      packet_header_(std::move(packet_header)),
      packet_length_(packet_length),
      interface_usage_page_(interface_usage_page),
      interface_usage_(interface_usage) {
    for (const auto& row : layout) {
        for (const auto& key : row) {
            if (key != kNoKey) {
                key_to_index_.emplace(key, key_labels_.size());
            }
            key_labels_.push_back(key);
        }
    }
    if (packet_header_.size() + key_labels_.size() * 3 > packet_length_) {
        throw std::invalid_argument("Keyboard '" + name_ + "': layout does not fit packet length " +
                                    std::to_string(packet_length_));
    }
}

std::optional<std::size_t> KeyboardModel::indexForKey(const std::string& label) const {
    auto it = key_to_index_.find(label);
    if (it == key_to_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<char> KeyboardModel::characterAt(std::size_t index) const {
    if (index >= key_labels_.size()) {
        throw std::out_of_range("KeyboardModel::characterAt index out of range");
    }
    const auto& label = key_labels_[index];
    if (label.size() == 1 && std::isalpha(static_cast<unsigned char>(label[0])) != 0) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(label[0])));
    }
    if (label == "Space") {
        return ' ';
    }
    return std::nullopt;
}

std::vector<std::uint8_t> KeyboardModel::encodeFrame(const std::vector<RgbColor>& colors) const {
    if (colors.size() != key_labels_.size()) {
        throw std::runtime_error("Frame size does not match keyboard layout");
    }

    std::vector<std::uint8_t> payload;
    payload.reserve(packet_length_);
    payload.insert(payload.end(), packet_header_.begin(), packet_header_.end());

    for (std::size_t idx = 0; idx < key_labels_.size(); ++idx) {
        const RgbColor color = key_labels_[idx] == kNoKey ? RgbColor{} : colors[idx];
        payload.push_back(color.r);
        payload.push_back(color.g);
        payload.push_back(color.b);
    }

    payload.resize(packet_length_, 0);
    return payload;
}

KeyboardModel::Layout readLayoutFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open layout file: " + path.string());
    }

    KeyboardModel::Layout layout;
    std::string line;
    while (std::getline(in, line)) {
        if (auto hash_pos = line.find('#'); hash_pos != std::string::npos) {
            line.erase(hash_pos);
        }
        line = trim(line);
        if (line.empty()) continue;

        KeyboardModel::LayoutRow row;
        std::istringstream line_stream(line);
        std::string token;
        while (std::getline(line_stream, token, ',')) {
            token = trim(token);
            if (!token.empty()) {
                row.push_back(token);
            }
        }
        if (!row.empty()) {
            layout.push_back(std::move(row));
        }
    }
    if (layout.empty()) throw std::runtime_error("Layout file is empty: " + path.string());
    return layout;
}

}  // namespace tt::trainer
