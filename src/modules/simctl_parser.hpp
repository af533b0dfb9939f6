#pragma once

#include "core/device.hpp"
#include "core/device_error.hpp"

#include <map>
#include <string>
#include <vector>

namespace emu_manager::modules::ios {

// One entry of `simctl list devices --json`, flattened with its runtime key.
struct SimDeviceRecord {
    std::string udid;
    std::string name;
    std::string state; // "Booted", "Shutdown", ...
    std::string device_type_identifier;
    std::string runtime_identifier;
    std::string data_path;
    bool is_available = true;
};

struct SimDeviceType {
    std::string identifier; // "com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro"
    std::string name;       // "iPhone 15 Pro"
};

struct SimRuntime {
    std::string identifier; // "com.apple.CoreSimulator.SimRuntime.iOS-17-0"
    std::string name;       // "iOS 17.0"
    std::string version;    // "17.0"
    bool is_available = true;
};

// Records that lack a udid or name are skipped; a payload that is not a
// JSON object with a "devices" member is a Parse error.
core::DeviceResult<std::vector<SimDeviceRecord>> parse_device_records(const std::string& json_text);
core::DeviceResult<std::vector<SimDeviceType>> parse_device_types(const std::string& json_text);
core::DeviceResult<std::vector<SimRuntime>> parse_runtimes(const std::string& json_text);

// "com.apple.CoreSimulator.SimRuntime.iOS-17-0" -> "17.0"
std::string runtime_version(const std::string& runtime_identifier);
// "com.apple.CoreSimulator.SimRuntime.iOS-17-0" -> "iOS 17.0"
std::string runtime_display_name(const std::string& runtime_identifier);

// "com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro" -> "iPhone 15 Pro"
std::string device_type_fallback_name(const std::string& identifier);

core::DeviceStatus state_to_status(const std::string& state);

// Orders dotted versions numerically: "17.10" sorts after "17.2".
bool version_less(const std::string& a, const std::string& b);

core::Device to_device(const SimDeviceRecord& record,
                       const std::map<std::string, std::string>& type_names);

} // namespace emu_manager::modules::ios
