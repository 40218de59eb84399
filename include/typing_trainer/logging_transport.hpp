#pragma once

#include <cstddef>
#include <iosfwd>

#include "typing_trainer/device_transport.hpp"

namespace tt::trainer {

// Prints each frame as header bytes plus one label=#rrggbb per key instead
// of talking to hardware.
class LoggingTransport : public DeviceTransport {
public:
    LoggingTransport();
    explicit LoggingTransport(std::ostream& out);

    std::string id() const override;
    bool connect(const KeyboardModel& model) override;
    bool sendFrame(const KeyboardModel& model,
                   const std::vector<std::uint8_t>& payload) override;

    [[nodiscard]] std::size_t framesSent() const noexcept { return frames_sent_; }

private:
    std::ostream& out_;
    std::size_t frames_sent_{0};
};

}  // namespace tt::trainer
