#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "typing_trainer/types.hpp"

namespace tt::trainer {

// Physical RGB keyboard: key labels in layout order plus the feature report
// framing used to push one color per key.
class KeyboardModel {
public:
    using LayoutRow = std::vector<std::string>;
    using Layout = std::vector<LayoutRow>;

    KeyboardModel(std::string name,
                  std::uint16_t vendor_id,
                  std::uint16_t product_id,
                  std::vector<std::uint8_t> packet_header,
                  std::size_t packet_length,
                  Layout layout,
                  std::optional<std::uint16_t> interface_usage_page = std::nullopt,
                  std::optional<std::uint16_t> interface_usage = std::nullopt);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::uint16_t vendorId() const noexcept { return vendor_id_; }
    [[nodiscard]] std::uint16_t productId() const noexcept { return product_id_; }
    [[nodiscard]] const std::vector<std::uint8_t>& packetHeader() const noexcept { return packet_header_; }
    [[nodiscard]] std::size_t packetLength() const noexcept { return packet_length_; }
    [[nodiscard]] const std::vector<std::string>& keyLabels() const noexcept { return key_labels_; }
    [[nodiscard]] std::optional<std::uint16_t> interfaceUsagePage() const noexcept { return interface_usage_page_; }
    [[nodiscard]] std::optional<std::uint16_t> interfaceUsage() const noexcept { return interface_usage_; }

    [[nodiscard]] std::size_t keyCount() const noexcept { return key_labels_.size(); }
    [[nodiscard]] std::optional<std::size_t> indexForKey(const std::string& label) const;

    // Character typed by the key at index: single-letter labels give the
    // lowercase letter, "Space" gives ' '. Other keys type nothing.
    [[nodiscard]] std::optional<char> characterAt(std::size_t index) const;

    [[nodiscard]] std::vector<std::uint8_t> encodeFrame(const std::vector<RgbColor>& colors) const;

private:
    std::string name_;
    std::uint16_t vendor_id_;
    std::uint16_t product_id_;
    std::vector<std::uint8_t> packet_header_;
    std::size_t packet_length_;
    std::vector<std::string> key_labels_;
    std::unordered_map<std::string, std::size_t> key_to_index_;
    std::optional<std::uint16_t> interface_usage_page_;
    std::optional<std::uint16_t> interface_usage_;
};

// Layout CSV: one keyboard row per line, comma separated labels, '#' comments,
// "NAN" for positions without a key.
[[nodiscard]] KeyboardModel::Layout readLayoutFile(const std::filesystem::path& path);

}  // namespace tt::trainer
