#pragma once

#include "core/device.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace emu_manager::modules {

enum class DeviceCategory {
    Phone,
    Foldable,
    Tablet,
    Tv,
    Wear,
    Automotive,
    Desktop
};

std::string category_to_string(DeviceCategory category);
std::optional<DeviceCategory> category_from_string(const std::string& text);

// Substring classifier over an avdmanager profile id and its display name.
// Fold/flip is checked first so "Pixel Fold" lands in Foldable.
DeviceCategory classify_device_category(const std::string& id, const std::string& display_name);

// Lower sorts first.
uint32_t calculate_android_device_priority(const std::string& id, const std::string& display_name);
uint32_t calculate_ios_device_priority(const std::string& display_name);

// 100 - generation for a recognized model number, 50 when none is found.
uint32_t extract_device_version(const std::string& text);

// First model number in an Apple product name ("iPhone 15 Pro" -> 15), 0 if none.
uint32_t extract_ios_version(const std::string& display_name);

// Stable: devices with equal priority keep their listing order.
void sort_android_devices(std::vector<core::Device>& devices);
void sort_ios_devices(std::vector<core::Device>& devices);

} // namespace emu_manager::modules
