#pragma once

#include "core/api_level.hpp"
#include "core/command_executor.hpp"
#include "core/device_manager.hpp"
#include "modules/android_parser.hpp"
#include "modules/priority_engine.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace emu_manager::modules {

struct AndroidSettings {
    // Overrides ANDROID_HOME / ANDROID_SDK_ROOT when set.
    std::optional<std::filesystem::path> sdk_root;
    // Overrides ANDROID_AVD_HOME / ~/.android/avd when set.
    std::optional<std::filesystem::path> avd_home;

    std::vector<std::string> emulator_flags = {"-no-audio", "-no-snapshot-save", "-no-boot-anim",
                                               "-netfast"};
    uint32_t default_ram_mb = 2048;
    uint32_t default_storage_mb = 8192;
    std::string default_tag = "google_apis_playstore";
    unsigned max_retries = 2;
    // How long delete and wipe wait for a killed emulator to leave adb.
    std::chrono::milliseconds stop_poll_interval{500};
    unsigned stop_poll_attempts = 20;
    bool quiet = false;
};

using ProgressCallback = std::function<void(const core::InstallProgress&)>;

// Drives avdmanager, sdkmanager, adb and emulator from one Android SDK.
class AndroidManager : public core::DeviceManager {
public:
    static std::expected<std::unique_ptr<AndroidManager>, core::DeviceError>
    create(std::shared_ptr<core::CommandExecutor> executor, AndroidSettings settings = {});

    ~AndroidManager() override = default;

    AndroidManager(const AndroidManager&) = delete;
    AndroidManager& operator=(const AndroidManager&) = delete;

    core::Platform platform() const override { return core::Platform::Android; }
    bool is_available() const override { return true; }

    core::DeviceResult<std::vector<core::Device>> list_devices() override;
    core::DeviceResult<std::string> create_device(const core::DeviceConfig& config) override;
    core::DeviceResult<void> start_device(const std::string& name) override;
    core::DeviceResult<void> stop_device(const std::string& name) override;
    core::DeviceResult<void> delete_device(const std::string& name) override;
    core::DeviceResult<void> wipe_device(const std::string& name) override;
    core::DeviceResult<core::DeviceDetails> get_device_details(const std::string& name) override;
    core::DeviceResult<std::vector<std::pair<std::string, std::string>>> list_device_types() override;

    static DeviceCategory get_device_category(const std::string& id, const std::string& display_name) {
        return classify_device_category(id, display_name);
    }

    core::DeviceResult<std::vector<core::ApiLevel>> list_api_levels();

    // `progress` sees a non-decreasing percentage ending at 100 on success.
    core::DeviceResult<void> install_system_image(const std::string& package_id,
                                                  const ProgressCallback& progress);
    core::DeviceResult<void> uninstall_system_image(const std::string& package_id);

    core::DeviceResult<std::vector<std::pair<std::string, std::string>>> list_targets();
    core::DeviceResult<std::vector<std::pair<std::string, std::string>>>
    list_devices_by_category(DeviceCategory category);

    // Waits until `serial` reports sys.boot_completed=1.
    core::DeviceResult<void> wait_for_boot(const std::string& serial, std::chrono::seconds timeout,
                                           std::stop_token stop = {});

    // AVD name -> adb state for every emulator serial adb can attribute.
    std::map<std::string, android::AdbDevice> running_avds();

    const std::filesystem::path& sdk_root() const { return sdk_root_; }

private:
    AndroidManager(std::shared_ptr<core::CommandExecutor> executor, AndroidSettings settings,
                   std::filesystem::path sdk_root, std::map<std::string, std::string> tools);

    core::DeviceResult<std::string> tool(const std::string& name) const;

    core::DeviceResult<std::vector<android::AvdStanza>> list_avd_stanzas();
    core::DeviceResult<android::AvdStanza> find_avd(const std::string& name);
    std::optional<std::string> resolve_avd_name(const std::string& adb, const std::string& serial);
    std::vector<android::DeviceProfile> device_profiles();
    core::DeviceResult<std::string> resolve_system_image(const std::string& name, uint32_t api,
                                                         const core::DeviceConfig& config);
    std::filesystem::path config_ini_path(const android::AvdStanza& stanza) const;
    std::filesystem::path avd_home() const;
    core::DeviceResult<void> write_hardware_config(const std::string& name, uint32_t ram_mb,
                                                   uint32_t storage_mb);
    core::DeviceResult<void> launch_emulator(const std::string& name, bool wipe);
    // Stops the emulator and polls adb until it no longer reports `name`.
    core::DeviceResult<void> stop_and_wait(const std::string& name);

    void log_info(const std::string& message) const;

    std::shared_ptr<core::CommandExecutor> executor_;
    AndroidSettings settings_;
    std::filesystem::path sdk_root_;
    std::map<std::string, std::string> tools_;
};

} // namespace emu_manager::modules
