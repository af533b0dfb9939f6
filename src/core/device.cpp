#include "core/device.hpp"

namespace emu_manager::core {

std::string platform_to_string(Platform platform) {
    switch (platform) {
        case Platform::Android: return "Android";
        case Platform::Ios: return "iOS";
        default: return "Unknown";
    }
}

std::string status_to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Stopped: return "Stopped";
        case DeviceStatus::Starting: return "Starting";
        case DeviceStatus::Running: return "Running";
        case DeviceStatus::Stopping: return "Stopping";
        case DeviceStatus::Creating: return "Creating";
        case DeviceStatus::Error: return "Error";
        case DeviceStatus::Unknown: return "Unknown";
        default: return "Unknown";
    }
}

std::optional<DeviceStatus> status_from_string(const std::string& text) {
    if (text == "Stopped") return DeviceStatus::Stopped;
    if (text == "Starting") return DeviceStatus::Starting;
    if (text == "Running") return DeviceStatus::Running;
    if (text == "Stopping") return DeviceStatus::Stopping;
    if (text == "Creating") return DeviceStatus::Creating;
    if (text == "Error") return DeviceStatus::Error;
    if (text == "Unknown") return DeviceStatus::Unknown;
    return std::nullopt;
}

} // namespace emu_manager::core
