#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "typing_trainer/device_transport.hpp"
#include "typing_trainer/heatmap_color_mapper.hpp"
#include "typing_trainer/keyboard_model.hpp"

namespace tt::trainer {

enum class HeatmapKind {
    Speed,
    Accuracy,
};

[[nodiscard]] std::optional<HeatmapKind> parseHeatmapKind(std::string_view value);

// Paints a finished session's heatmap onto an RGB keyboard.
class KeyboardHeatmap {
public:
    KeyboardHeatmap(KeyboardModel model,
                    std::unique_ptr<DeviceTransport> transport,
                    HeatmapKind kind);

    // Failure leaves the heatmap disabled; the trainer keeps running.
    bool connect();
    [[nodiscard]] bool connected() const noexcept { return connected_; }

    [[nodiscard]] std::vector<RgbColor> render(const HeatmapColorMapper& mapper) const;
    bool show(const HeatmapColorMapper& mapper);
    // Every key in the "unused" color, for a session that has not started.
    bool blank();

    [[nodiscard]] const KeyboardModel& model() const noexcept { return model_; }

private:
    bool push(const std::vector<RgbColor>& colors);

    KeyboardModel model_;
    std::unique_ptr<DeviceTransport> transport_;
    HeatmapKind kind_;
    bool connected_{false};
};

}  // namespace tt::trainer
