#pragma once

#include "core/api_level.hpp"
#include "core/device.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace emu_manager::modules::android {

// One "---------"-separated block of `avdmanager list avd`.
struct AvdStanza {
    std::string name;
    std::string device; // "pixel_7 (Google)"
    std::string path;
    std::string target; // Target line plus its "Based on:" continuation
    std::string abi;    // "google_apis/x86_64"
    uint32_t api_level = 0;
};

struct AdbDevice {
    std::string serial;
    std::string state; // "device", "offline", "unauthorized", ...
};

// One entry of `avdmanager list device`.
struct DeviceProfile {
    std::string id;   // "pixel_7"
    std::string name; // "Pixel 7"
    std::string oem;  // "Google"

    // "Pixel 7 (Google)", or just the name for Generic profiles
    std::string display_name() const;
};

std::vector<AvdStanza> parse_avd_list(const std::string& output);

// API level from a stanza's target text: "Based on: Android 14.0" first,
// then "(API level 34)". 0 when neither is present.
uint32_t parse_api_level(const std::string& target);

// Marketing version major ("14", "12L") to API level.
std::optional<uint32_t> api_from_android_version(const std::string& version);

// "Android 14", "Android 12L", ... or "API N" for unknown levels.
std::string android_version_name(uint32_t api);

std::vector<AdbDevice> parse_adb_devices(const std::string& output);

std::vector<DeviceProfile> parse_device_profiles(const std::string& output);

// Resolution order: exact id, exact display name, case-insensitive id or
// name, then keyword overlap on brand and model words.
std::optional<std::string> find_matching_device_id(const std::vector<DeviceProfile>& profiles,
                                                   const std::string& requested);

// `sdkmanager --list` package paths from the "Installed packages:" section.
std::vector<std::string> parse_installed_system_images(const std::string& output);

// Every system image mentioned by `sdkmanager --list --verbose`, grouped by
// API level, newest first.
std::vector<core::ApiLevel> parse_api_levels(const std::string& output);

// "system-images;android-34;google_apis;x86_64" -> {34, "google_apis", "x86_64"}
struct SystemImagePackage {
    uint32_t api = 0;
    std::string tag;
    std::string abi;
};
std::optional<SystemImagePackage> parse_system_image_package(const std::string& package_id);
std::string system_image_package(uint32_t api, const std::string& tag, const std::string& abi);

// key=value lines of an AVD config.ini
std::map<std::string, std::string> parse_config_ini(const std::string& content);
std::string render_config_ini(const std::map<std::string, std::string>& values);

// API level recorded in config.ini (image.sysdir.1 or target), 0 if absent.
uint32_t api_level_from_config(const std::map<std::string, std::string>& config);

// "8192M" / "8G" / "2048" -> MB
std::optional<uint32_t> parse_size_mb(const std::string& value);

// AVD names: keeps [A-Za-z0-9.-], maps space and '_' to '_', drops the rest
// and trims '_' from both ends.
std::string sanitize_avd_name(const std::string& name);

// Most useful single line of an avdmanager failure.
std::string summarize_tool_error(const std::string& output);

// Progress implied by one sdkmanager output line, if any.
std::optional<core::InstallProgress> parse_install_progress_line(const std::string& line);

// (target id, display) pairs from `avdmanager list target`
std::vector<std::pair<std::string, std::string>> parse_targets(const std::string& output);

} // namespace emu_manager::modules::android
