#pragma once

#include <memory>
#include <string>
#include <vector>

#include <hidapi/hidapi.h>

#include "typing_trainer/device_transport.hpp"

namespace tt::trainer {

// Sends heatmap frames as HID feature reports.
class HidapiTransport : public DeviceTransport {
public:
    HidapiTransport();
    ~HidapiTransport() override;

    HidapiTransport(const HidapiTransport&) = delete;
    HidapiTransport& operator=(const HidapiTransport&) = delete;

    std::string id() const override;
    bool connect(const KeyboardModel& model) override;
    bool sendFrame(const KeyboardModel& model,
                   const std::vector<std::uint8_t>& payload) override;

private:
    struct HidDeleter {
        void operator()(hid_device* device) const noexcept;
    };
    using DeviceHandle = std::unique_ptr<hid_device, HidDeleter>;

    bool ensureInitialized();
    static DeviceHandle openLightingInterface(const KeyboardModel& model);

    bool initialized_{false};
    DeviceHandle handle_;
};

}  // namespace tt::trainer
