#pragma once

#include "core/command_executor.hpp"
#include "core/device_manager.hpp"
#include "modules/simctl_parser.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace emu_manager::modules {

struct IosSettings {
    // Forces availability; unset means "macOS with xcrun on PATH".
    std::optional<bool> available;
    unsigned max_retries = 2;
    bool quiet = false;
};

// Drives `xcrun simctl`. Constructs everywhere; off macOS it lists nothing
// and every lifecycle call fails with PlatformNotSupported.
class IosManager : public core::DeviceManager {
public:
    explicit IosManager(std::shared_ptr<core::CommandExecutor> executor, IosSettings settings = {});
    ~IosManager() override = default;

    IosManager(const IosManager&) = delete;
    IosManager& operator=(const IosManager&) = delete;

    core::Platform platform() const override { return core::Platform::Ios; }
    bool is_available() const override { return available_; }

    core::DeviceResult<std::vector<core::Device>> list_devices() override;
    core::DeviceResult<std::string> create_device(const core::DeviceConfig& config) override;
    core::DeviceResult<void> start_device(const std::string& identifier) override;
    core::DeviceResult<void> stop_device(const std::string& identifier) override;
    core::DeviceResult<void> delete_device(const std::string& identifier) override;
    core::DeviceResult<void> wipe_device(const std::string& identifier) override;
    core::DeviceResult<core::DeviceDetails> get_device_details(const std::string& identifier) override;
    core::DeviceResult<std::vector<std::pair<std::string, std::string>>> list_device_types() override;

    // Available runtimes, newest first.
    core::DeviceResult<std::vector<ios::SimRuntime>> list_runtimes();

private:
    core::DeviceResult<void> require_available() const;
    core::DeviceResult<std::vector<ios::SimDeviceRecord>> device_records();
    // Accepts a UDID or a simulator name.
    core::DeviceResult<ios::SimDeviceRecord> find_record(const std::string& identifier);
    std::map<std::string, std::string> device_type_names();
    core::DeviceResult<std::string> resolve_device_type(const std::string& requested);
    core::DeviceResult<std::string> resolve_runtime(const std::string& requested);
    void quit_simulator_if_idle();

    void log_info(const std::string& message) const;

    std::shared_ptr<core::CommandExecutor> executor_;
    IosSettings settings_;
    bool available_;

    std::mutex types_mutex_;
    std::map<std::string, std::string> type_names_;
};

} // namespace emu_manager::modules
