#include "typing_trainer/hidapi_transport.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace tt::trainer {

namespace {

constexpr unsigned short kVendorUsagePage = 0xFF00;
constexpr unsigned short kVendorUsage = 0x0001;

std::string toNarrow(const wchar_t* text) {
    std::string out;
    if (text == nullptr) {
        return out;
    }
    for (; *text != L'\0'; ++text) {
        out.push_back(*text < 0x80 ? static_cast<char>(*text) : '?');
    }
    return out;
}

std::string lastError(hid_device* device) {
    const auto message = toNarrow(hid_error(device));
    return message.empty() ? "unknown error" : message;
}

std::string hexId(unsigned short value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(4) << std::setfill('0') << value;
    return oss.str();
}

// Without an explicit usage in the config, take the vendor-defined interface
// most RGB keyboards expose for lighting.
bool isLightingInterface(const hid_device_info& info, const KeyboardModel& model) {
    const unsigned short page = model.interfaceUsagePage().value_or(kVendorUsagePage);
    const unsigned short usage = model.interfaceUsage().value_or(kVendorUsage);
    return info.usage_page == page && info.usage == usage;
}

}  // namespace

HidapiTransport::HidapiTransport() = default;

HidapiTransport::~HidapiTransport() {
    handle_.reset();
    if (initialized_) {
        hid_exit();
    }
}

void HidapiTransport::HidDeleter::operator()(hid_device* device) const noexcept {
    if (device != nullptr) {
        hid_close(device);
    }
}

std::string HidapiTransport::id() const {
    return "hidapi";
}

bool HidapiTransport::ensureInitialized() {
    if (initialized_) {
        return true;
    }
    if (hid_init() != 0) {
        std::cerr << "[HidapiTransport] hid_init failed" << '\n';
        return false;
    }
    initialized_ = true;
    return true;
}

HidapiTransport::DeviceHandle HidapiTransport::openLightingInterface(const KeyboardModel& model) {
    hid_device_info* devices = hid_enumerate(model.vendorId(), model.productId());
    if (devices == nullptr) {
        return DeviceHandle{};
    }

    DeviceHandle handle;
    std::string seen;
    for (const hid_device_info* info = devices; info != nullptr && !handle; info = info->next) {
        if (isLightingInterface(*info, model)) {
            handle.reset(hid_open_path(info->path));
        } else {
            seen += " " + hexId(info->usage_page) + "/" + hexId(info->usage);
        }
    }
    hid_free_enumeration(devices);

    if (!handle && !seen.empty()) {
        std::cerr << "[HidapiTransport] No lighting interface on " << model.name()
                  << "; interfaces seen (usage page/usage):" << seen << '\n';
    }
    return handle;
}

bool HidapiTransport::connect(const KeyboardModel& model) {
    if (!ensureInitialized()) {
        return false;
    }

    handle_ = openLightingInterface(model);
    if (!handle_) {
        handle_.reset(hid_open(model.vendorId(), model.productId(), nullptr));
    }
    if (!handle_) {
        std::cerr << "[HidapiTransport] Unable to open " << model.name() << " (VID="
                  << hexId(model.vendorId()) << ", PID=" << hexId(model.productId()) << ")" << '\n';
        return false;
    }

    hid_set_nonblocking(handle_.get(), 1);
    std::cerr << "[HidapiTransport] Connected to keyboard: " << model.name() << '\n';
    return true;
}

bool HidapiTransport::sendFrame(const KeyboardModel& model,
                                const std::vector<std::uint8_t>& payload) {
    if (!handle_) {
        return false;
    }
    if (payload.size() != model.packetLength()) {
        std::cerr << "[HidapiTransport] Refusing " << payload.size() << "-byte frame for "
                  << model.name() << ", expected " << model.packetLength() << '\n';
        return false;
    }

    const int written = hid_send_feature_report(handle_.get(), payload.data(), payload.size());
    if (written < 0) {
        std::cerr << "[HidapiTransport] Feature report to " << model.name()
                  << " failed: " << lastError(handle_.get()) << "; closing device" << '\n';
        handle_.reset();
        return false;
    }
    return true;
}

}  // namespace tt::trainer
