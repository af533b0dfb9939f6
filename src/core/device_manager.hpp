#pragma once

#include "core/device.hpp"
#include "core/device_error.hpp"

#include <string>
#include <utility>
#include <vector>

namespace emu_manager::core {

// Capability set shared by the Android and iOS managers. The refresh
// coordinator only ever talks to this interface.
class DeviceManager {
public:
    virtual ~DeviceManager() = default;

    virtual Platform platform() const = 0;

    // False when the vendor tools are missing; listing then yields nothing
    // and lifecycle calls fail with PlatformNotSupported or SdkNotFound.
    virtual bool is_available() const = 0;

    virtual DeviceResult<std::vector<Device>> list_devices() = 0;

    // Returns the identifier of the new device.
    virtual DeviceResult<std::string> create_device(const DeviceConfig& config) = 0;

    // Start on a running device and stop on a stopped one both succeed.
    virtual DeviceResult<void> start_device(const std::string& identifier) = 0;
    virtual DeviceResult<void> stop_device(const std::string& identifier) = 0;
    virtual DeviceResult<void> delete_device(const std::string& identifier) = 0;
    virtual DeviceResult<void> wipe_device(const std::string& identifier) = 0;

    virtual DeviceResult<DeviceDetails> get_device_details(const std::string& identifier) = 0;

    // (identifier, display name) pairs usable as DeviceConfig::device_type.
    virtual DeviceResult<std::vector<std::pair<std::string, std::string>>> list_device_types() = 0;
};

} // namespace emu_manager::core
