#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "typing_trainer/keyboard_model.hpp"

namespace tt::trainer {

class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual std::string id() const = 0;
    virtual bool connect(const KeyboardModel& model) = 0;
    virtual bool sendFrame(const KeyboardModel& model,
                           const std::vector<std::uint8_t>& payload) = 0;
};

// "hidapi" or "logging". Throws std::runtime_error for anything else.
[[nodiscard]] std::unique_ptr<DeviceTransport> createTransport(const std::string& id);

}  // namespace tt::trainer
