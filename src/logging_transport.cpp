#include "typing_trainer/logging_transport.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace tt::trainer {

namespace {

constexpr std::size_t kKeysPerLine = 8;

std::string hexByte(std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

}  // namespace

LoggingTransport::LoggingTransport() : LoggingTransport(std::cerr) {}

LoggingTransport::LoggingTransport(std::ostream& out) : out_(out) {}

std::string LoggingTransport::id() const {
    return "logging";
}

bool LoggingTransport::connect(const KeyboardModel& model) {
    out_ << "[LoggingTransport] Connected to keyboard: " << model.name()
         << " (" << model.keyCount() << " keys)" << '\n';
    return true;
}

bool LoggingTransport::sendFrame(const KeyboardModel& model,
                                 const std::vector<std::uint8_t>& payload) {
    const auto& header = model.packetHeader();
    const auto& labels = model.keyLabels();
    if (payload.size() < header.size() + labels.size() * 3) {
        out_ << "[LoggingTransport] Short frame for " << model.name() << " ("
             << payload.size() << " bytes)" << '\n';
        return false;
    }

    ++frames_sent_;
    out_ << "[LoggingTransport] Frame " << frames_sent_ << " for " << model.name()
         << " (" << payload.size() << " bytes)" << '\n';

    out_ << "  header:";
    for (std::size_t i = 0; i < header.size(); ++i) {
        out_ << " 0x" << hexByte(payload[i]);
    }
    out_ << '\n';

    for (std::size_t key = 0; key < labels.size(); ++key) {
        const std::size_t offset = header.size() + key * 3;
        out_ << (key % kKeysPerLine == 0 ? "  " : " ") << labels[key] << "=#"
             << hexByte(payload[offset]) << hexByte(payload[offset + 1]) << hexByte(payload[offset + 2]);
        if (key % kKeysPerLine == kKeysPerLine - 1 || key + 1 == labels.size()) {
            out_ << '\n';
        }
    }
    return true;
}

}  // namespace tt::trainer
