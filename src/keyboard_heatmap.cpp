#include "typing_trainer/keyboard_heatmap.hpp"

#include <iostream>
#include <stdexcept>

#include "typing_trainer/hidapi_transport.hpp"
#include "typing_trainer/logging_transport.hpp"

namespace tt::trainer {

std::unique_ptr<DeviceTransport> createTransport(const std::string& id) {
    if (id == "logging") return std::make_unique<LoggingTransport>();
    if (id == "hidapi") return std::make_unique<HidapiTransport>();
    throw std::runtime_error("Unsupported transport: " + id);
}

std::optional<HeatmapKind> parseHeatmapKind(std::string_view value) {
    if (value == "speed") return HeatmapKind::Speed;
    if (value == "accuracy") return HeatmapKind::Accuracy;
    return std::nullopt;
}

KeyboardHeatmap::KeyboardHeatmap(KeyboardModel model,
                                 std::unique_ptr<DeviceTransport> transport,
                                 HeatmapKind kind)
    : model_(std::move(model)), transport_(std::move(transport)), kind_(kind) {
    if (!transport_) {
        throw std::invalid_argument("KeyboardHeatmap requires a transport");
    }
}

bool KeyboardHeatmap::connect() {
    connected_ = transport_->connect(model_);
    if (!connected_) {
        std::cerr << "[KeyboardHeatmap] Warning: could not connect to " << model_.name()
                  << " via " << transport_->id() << "; keyboard heatmap disabled" << '\n';
    }
    return connected_;
}

std::vector<RgbColor> KeyboardHeatmap::render(const HeatmapColorMapper& mapper) const {
    std::vector<RgbColor> colors(model_.keyCount(), bandColor(SpeedBand::Unused));
    for (std::size_t idx = 0; idx < colors.size(); ++idx) {
        const auto ch = model_.characterAt(idx);
        if (!ch) continue;
        colors[idx] = kind_ == HeatmapKind::Speed ? bandColor(mapper.speedBand(*ch))
                                                  : bandColor(mapper.accuracyBand(*ch));
    }
    return colors;
}

bool KeyboardHeatmap::show(const HeatmapColorMapper& mapper) {
    return push(render(mapper));
}

bool KeyboardHeatmap::blank() {
    return push(std::vector<RgbColor>(model_.keyCount(), bandColor(SpeedBand::Unused)));
}

bool KeyboardHeatmap::push(const std::vector<RgbColor>& colors) {
    if (!connected_) {
        return false;
    }
    return transport_->sendFrame(model_, model_.encodeFrame(colors));
}

}  // namespace tt::trainer
