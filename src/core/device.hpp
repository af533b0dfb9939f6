#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace emu_manager::core {

enum class Platform {
    Android,
    Ios
};

enum class DeviceStatus {
    Stopped,
    Starting,
    Running,
    Stopping,
    Creating,
    Error,
    Unknown
};

std::string platform_to_string(Platform platform);
std::string status_to_string(DeviceStatus status);
std::optional<DeviceStatus> status_from_string(const std::string& text);

struct AndroidInfo {
    uint32_t api_level = 0;
    std::string device_type;
    std::string ram_size;     // MB, as reported by the AVD config
    std::string storage_size; // e.g. "8192M"
};

struct IosInfo {
    std::string udid;
    std::string ios_version;     // "17.0"
    std::string runtime_version; // "iOS 17.0"
    std::string device_type;     // human readable, "iPhone 15 Pro"
    bool is_available = true;
};

// One snapshot of a device as reported by the vendor tools. Records are
// replaced, never mutated, between refreshes.
struct Device {
    std::string name;
    std::string identifier; // AVD name on Android, UDID on iOS
    DeviceStatus status = DeviceStatus::Unknown;
    std::variant<AndroidInfo, IosInfo> info;

    bool is_running() const { return status == DeviceStatus::Running; }
    Platform platform() const {
        return std::holds_alternative<AndroidInfo>(info) ? Platform::Android : Platform::Ios;
    }
    const AndroidInfo* android() const { return std::get_if<AndroidInfo>(&info); }
    const IosInfo* ios() const { return std::get_if<IosInfo>(&info); }
};

// Creation input. Consumed once by create_device().
struct DeviceConfig {
    std::string name;
    std::string device_type;
    std::string version; // API level on Android, runtime on iOS
    std::optional<std::string> ram_size;
    std::optional<std::string> storage_size;
    std::map<std::string, std::string> additional_options;
};

struct DeviceDetails {
    std::string name;
    std::string status;
    Platform platform = Platform::Android;
    std::string device_type;
    std::string api_level_or_version;
    std::optional<std::string> ram_size;
    std::optional<std::string> storage_size;
    std::optional<std::string> resolution;
    std::optional<std::string> dpi;
    std::optional<std::string> device_path;
    std::optional<std::string> system_image;
    std::string identifier;
};

struct InstallProgress {
    std::string operation;
    uint8_t percentage = 0;
    std::optional<uint32_t> eta_seconds;
};

} // namespace emu_manager::core
