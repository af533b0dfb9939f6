#include "modules/android_manager.hpp"

#include "utils/string_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

namespace emu_manager::modules {

using core::DeviceError;
using core::DeviceResult;
namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxNameLength = 50;
constexpr uint32_t kMinRamMb = 512;
constexpr uint32_t kMaxRamMb = 8192;
constexpr uint32_t kMinStorageMb = 1024;
constexpr uint32_t kMaxStorageMb = 65536;

const char* kSdkMissing = "Android SDK not found. Please set ANDROID_HOME or ANDROID_SDK_ROOT";

std::optional<fs::path> env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return fs::path(value);
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// "pixel_7 (Google)" -> "pixel_7"
std::string profile_id(const std::string& device_line) {
    size_t paren = device_line.find(" (");
    return utils::trim(device_line.substr(0, paren));
}

std::optional<uint32_t> api_from_version_text(const std::string& version) {
    static const std::regex number(R"((\d+))");
    std::smatch match;
    if (!std::regex_search(version, match, number)) return std::nullopt;
    auto api = utils::parse_uint(match[1].str());
    if (!api || *api == 0) return std::nullopt;
    return api;
}

DeviceResult<uint32_t> size_option(const std::optional<std::string>& value, uint32_t fallback,
                                   uint32_t min, uint32_t max, const char* what) {
    if (!value) return fallback;
    auto mb = android::parse_size_mb(*value);
    if (!mb || *mb < min || *mb > max) {
        return std::unexpected(DeviceError::invalid_config(
            std::string(what) + " must be between " + std::to_string(min) + " and " +
            std::to_string(max) + " MB, got '" + *value + "'"));
    }
    return *mb;
}

} // namespace

std::expected<std::unique_ptr<AndroidManager>, DeviceError>
AndroidManager::create(std::shared_ptr<core::CommandExecutor> executor, AndroidSettings settings) {
    std::optional<fs::path> root = settings.sdk_root;
    if (!root) root = env_path("ANDROID_HOME");
    if (!root) root = env_path("ANDROID_SDK_ROOT");

    std::error_code ec;
    if (!root || !fs::is_directory(*root, ec)) {
        return std::unexpected(DeviceError::sdk_not_found("Android", kSdkMissing));
    }

    struct ToolLocation {
        const char* name;
        const char* dirs[2];
    };
    const ToolLocation layout[] = {
        {"avdmanager", {"cmdline-tools/latest/bin", "tools/bin"}},
        {"sdkmanager", {"cmdline-tools/latest/bin", "tools/bin"}},
        {"adb", {"platform-tools", "platform-tools"}},
        {"emulator", {"emulator", "tools"}},
    };

    std::map<std::string, std::string> tools;
    for (const auto& [name, dirs] : layout) {
        for (const char* dir : dirs) {
            fs::path candidate = *root / dir / name;
            if (fs::exists(candidate, ec)) {
                tools[name] = candidate.string();
                break;
            }
        }
    }

    if (!tools.contains("avdmanager")) {
        return std::unexpected(
            DeviceError::sdk_not_found("Android", "Tool 'avdmanager' not found in Android SDK"));
    }

    return std::unique_ptr<AndroidManager>(
        new AndroidManager(std::move(executor), std::move(settings), *root, std::move(tools)));
}

AndroidManager::AndroidManager(std::shared_ptr<core::CommandExecutor> executor, AndroidSettings settings,
                               fs::path sdk_root, std::map<std::string, std::string> tools)
    : executor_(std::move(executor)),
      settings_(std::move(settings)),
      sdk_root_(std::move(sdk_root)),
      tools_(std::move(tools)) {
    log_info("Using Android SDK at " + sdk_root_.string());
}

void AndroidManager::log_info(const std::string& message) const {
    if (!settings_.quiet) {
        std::cout << "[Android] " << message << "\n";
    }
}

DeviceResult<std::string> AndroidManager::tool(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return std::unexpected(
            DeviceError::sdk_not_found("Android", "Tool '" + name + "' not found in Android SDK"));
    }
    return it->second;
}

fs::path AndroidManager::avd_home() const {
    if (settings_.avd_home) return *settings_.avd_home;
    if (auto home = env_path("ANDROID_AVD_HOME")) return *home;
    if (auto user_home = env_path("ANDROID_USER_HOME")) return *user_home / "avd";
    if (auto home = env_path("HOME")) return *home / ".android" / "avd";
    return fs::path(".android") / "avd";
}

fs::path AndroidManager::config_ini_path(const android::AvdStanza& stanza) const {
    if (!stanza.path.empty()) return fs::path(stanza.path) / "config.ini";
    return avd_home() / (stanza.name + ".avd") / "config.ini";
}

DeviceResult<std::vector<android::AvdStanza>> AndroidManager::list_avd_stanzas() {
    auto avdmanager = tool("avdmanager");
    if (!avdmanager) return std::unexpected(avdmanager.error());

    auto output = executor_->run(*avdmanager, {"list", "avd"});
    if (!output) return std::unexpected(output.error());
    return android::parse_avd_list(*output);
}

DeviceResult<android::AvdStanza> AndroidManager::find_avd(const std::string& name) {
    auto stanzas = list_avd_stanzas();
    if (!stanzas) return std::unexpected(stanzas.error());

    auto it = std::find_if(stanzas->begin(), stanzas->end(),
                           [&](const android::AvdStanza& s) { return s.name == name; });
    if (it == stanzas->end()) return std::unexpected(DeviceError::not_found(name));
    return *it;
}

std::optional<std::string> AndroidManager::resolve_avd_name(const std::string& adb,
                                                            const std::string& serial) {
    auto prop = executor_->run(adb, {"-s", serial, "shell", "getprop", "ro.boot.qemu.avd_name"});
    if (prop) {
        std::string name = utils::trim(*prop);
        if (!name.empty()) return name;
    }

    // Older images only answer on the emulator console.
    auto console = executor_->run(adb, {"-s", serial, "emu", "avd", "name"});
    if (!console) return std::nullopt;
    for (const auto& raw : utils::split_lines(*console)) {
        std::string line = utils::trim(raw);
        if (!line.empty() && line != "OK") return line;
    }
    return std::nullopt;
}

std::map<std::string, android::AdbDevice> AndroidManager::running_avds() {
    std::map<std::string, android::AdbDevice> running;

    auto adb = tool("adb");
    if (!adb) return running;

    auto output = executor_->run(*adb, {"devices"});
    if (!output) {
        std::cerr << "[Android] adb devices failed: " << output.error().message() << "\n";
        return running;
    }

    for (const auto& device : android::parse_adb_devices(*output)) {
        if (device.serial.rfind("emulator-", 0) != 0) continue;
        if (auto name = resolve_avd_name(*adb, device.serial)) {
            running.emplace(*name, device);
        }
    }
    return running;
}

DeviceResult<std::vector<core::Device>> AndroidManager::list_devices() {
    auto stanzas = list_avd_stanzas();
    if (!stanzas) return std::unexpected(stanzas.error());

    const auto running = running_avds();

    std::vector<core::Device> devices;
    devices.reserve(stanzas->size());
    for (const auto& stanza : *stanzas) {
        core::AndroidInfo info;
        info.api_level = stanza.api_level;
        info.device_type = profile_id(stanza.device);

        if (auto content = read_file(config_ini_path(stanza))) {
            auto config = android::parse_config_ini(*content);
            if (info.api_level == 0) info.api_level = android::api_level_from_config(config);
            if (auto it = config.find("hw.ramSize"); it != config.end()) info.ram_size = it->second;
            if (auto it = config.find("disk.dataPartition.size"); it != config.end()) {
                info.storage_size = it->second;
            }
            if (info.device_type.empty()) {
                if (auto it = config.find("hw.device.name"); it != config.end()) info.device_type = it->second;
            }
        }

        if (info.api_level == 0) {
            std::cerr << "[Android] Could not determine API level of '" << stanza.name << "'\n";
        }

        core::DeviceStatus status = core::DeviceStatus::Stopped;
        if (auto it = running.find(stanza.name); it != running.end()) {
            if (it->second.state == "device") {
                status = core::DeviceStatus::Running;
            } else if (it->second.state == "offline") {
                status = core::DeviceStatus::Starting;
            } else {
                status = core::DeviceStatus::Unknown;
            }
        }

        devices.push_back({stanza.name, stanza.name, status, std::move(info)});
    }

    sort_android_devices(devices);
    return devices;
}

std::vector<android::DeviceProfile> AndroidManager::device_profiles() {
    auto avdmanager = tool("avdmanager");
    if (!avdmanager) return {};
    auto output = executor_->run(*avdmanager, {"list", "device"});
    if (!output) {
        std::cerr << "[Android] Failed to list device profiles: " << output.error().message() << "\n";
        return {};
    }
    return android::parse_device_profiles(*output);
}

DeviceResult<std::string> AndroidManager::resolve_system_image(const std::string& name, uint32_t api,
                                                               const core::DeviceConfig& config) {
    auto option = [&](const char* key) -> std::optional<std::string> {
        auto it = config.additional_options.find(key);
        if (it == config.additional_options.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };
    const auto tag = option("tag");
    const auto abi = option("abi");
    const std::string expected_package = android::system_image_package(
        api, tag.value_or(settings_.default_tag), abi.value_or(core::host_architecture()));

    auto sdkmanager = tool("sdkmanager");
    if (!sdkmanager) {
        std::cerr << "[Android] sdkmanager missing, assuming " << expected_package << " is installed\n";
        return expected_package;
    }

    auto listing = executor_->run(*sdkmanager, {"--list", "--verbose", "--include_obsolete"});
    if (!listing) listing = executor_->run(*sdkmanager, {"--list"});
    if (!listing) {
        std::cerr << "[Android] Failed to query system images: " << listing.error().message() << "\n";
        return expected_package;
    }

    core::ApiLevel installed;
    installed.api = api;
    for (const auto& level : android::parse_api_levels(*listing)) {
        if (level.api != api) continue;
        for (const auto& variant : level.variants) {
            if (!variant.is_installed) continue;
            if (tag && variant.variant != *tag) continue;
            if (abi && variant.architecture != *abi) continue;
            installed.variants.push_back(variant);
        }
    }

    if (const auto* variant = installed.get_recommended_variant()) {
        return variant->package_id;
    }
    return std::unexpected(DeviceError::create_failed(
        name, "System image '" + expected_package + "' not found. Install it with: sdkmanager \"" +
                  expected_package + "\""));
}

DeviceResult<void> AndroidManager::write_hardware_config(const std::string& name, uint32_t ram_mb,
                                                         uint32_t storage_mb) {
    const fs::path path = avd_home() / (name + ".avd") / "config.ini";
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(DeviceError::io("Cannot read " + path.string()));
    }

    auto config = android::parse_config_ini(*content);
    config["hw.ramSize"] = std::to_string(ram_mb);
    config["disk.dataPartition.size"] = std::to_string(storage_mb) + "M";

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(DeviceError::io("Cannot write " + path.string()));
    }
    file << android::render_config_ini(config);
    return {};
}

DeviceResult<std::string> AndroidManager::create_device(const core::DeviceConfig& config) {
    const std::string name = android::sanitize_avd_name(config.name);
    if (name.empty()) {
        return std::unexpected(DeviceError::invalid_config("Device name must contain letters or digits"));
    }
    if (name.size() > kMaxNameLength) {
        return std::unexpected(DeviceError::invalid_config(
            "Device name must be at most " + std::to_string(kMaxNameLength) + " characters"));
    }

    auto api = api_from_version_text(config.version);
    if (!api) {
        return std::unexpected(DeviceError::invalid_config("Invalid API level: '" + config.version + "'"));
    }
    auto ram_mb = size_option(config.ram_size, settings_.default_ram_mb, kMinRamMb, kMaxRamMb, "RAM");
    if (!ram_mb) return std::unexpected(ram_mb.error());
    auto storage_mb = size_option(config.storage_size, settings_.default_storage_mb, kMinStorageMb,
                                  kMaxStorageMb, "Storage");
    if (!storage_mb) return std::unexpected(storage_mb.error());

    auto avdmanager = tool("avdmanager");
    if (!avdmanager) return std::unexpected(avdmanager.error());

    auto stanzas = list_avd_stanzas();
    if (!stanzas) return std::unexpected(stanzas.error());
    if (std::any_of(stanzas->begin(), stanzas->end(),
                    [&](const android::AvdStanza& s) { return s.name == name; })) {
        return std::unexpected(DeviceError::create_failed(name, "Device '" + name + "' already exists"));
    }

    auto package = resolve_system_image(name, *api, config);
    if (!package) return std::unexpected(package.error());

    std::optional<std::string> device_id;
    if (!config.device_type.empty() && utils::to_lower(config.device_type) != "custom") {
        device_id = android::find_matching_device_id(device_profiles(), config.device_type);
        if (!device_id) {
            std::cerr << "[Android] No hardware profile matches '" << config.device_type
                      << "', creating without --device\n";
        }
    }

    std::vector<std::string> args = {"create", "avd", "-n", name, "-k", *package};
    if (device_id) {
        args.insert(args.end(), {"--device", *device_id, "--skin", *device_id});
    }

    log_info("Creating '" + name + "' from " + *package);
    // avdmanager asks whether to create a custom hardware profile.
    auto result = executor_->execute_with_input(*avdmanager, args, "no\n", {});
    if (!result && device_id && utils::contains_icase(core::failure_text(result.error()), "skin")) {
        std::cerr << "[Android] avdmanager rejected --skin, retrying without it\n";
        args.resize(args.size() - 2);
        result = executor_->execute_with_input(*avdmanager, args, "no\n", {});
    }
    if (!result) {
        std::string reason = android::summarize_tool_error(core::failure_text(result.error()));
        if (reason.empty()) reason = result.error().message();
        return std::unexpected(DeviceError::create_failed(name, reason));
    }

    if (auto written = write_hardware_config(name, *ram_mb, *storage_mb); !written) {
        std::cerr << "[Android] Created '" << name << "' but could not set RAM/storage: "
                  << written.error().message() << "\n";
    }

    log_info("Created '" + name + "'");
    return name;
}

DeviceResult<void> AndroidManager::launch_emulator(const std::string& name, bool wipe) {
    auto emulator = tool("emulator");
    if (!emulator) return std::unexpected(emulator.error());

    std::vector<std::string> args = {"-avd", name};
    args.insert(args.end(), settings_.emulator_flags.begin(), settings_.emulator_flags.end());
    if (wipe) args.push_back("-wipe-data");

    auto pid = executor_->spawn(*emulator, args);
    if (!pid) {
        return std::unexpected(DeviceError::start_failed(name, core::failure_text(pid.error())));
    }
    log_info("Launched emulator for '" + name + "' (pid " + std::to_string(*pid) + ")");
    return {};
}

DeviceResult<void> AndroidManager::start_device(const std::string& name) {
    auto stanza = find_avd(name);
    if (!stanza) return std::unexpected(stanza.error());

    if (running_avds().contains(name)) {
        log_info("'" + name + "' is already running");
        return {};
    }
    return launch_emulator(name, false);
}

DeviceResult<void> AndroidManager::stop_device(const std::string& name) {
    const auto running = running_avds();
    auto it = running.find(name);
    if (it == running.end()) {
        return {};
    }

    auto adb = tool("adb");
    if (!adb) return std::unexpected(adb.error());

    auto result = executor_->run_ignoring_errors(*adb, {"-s", it->second.serial, "emu", "kill"},
                                                 {"not found"});
    if (!result) {
        return std::unexpected(DeviceError::stop_failed(name, core::failure_text(result.error())));
    }
    log_info("Stopped '" + name + "'");
    return {};
}

DeviceResult<void> AndroidManager::stop_and_wait(const std::string& name) {
    if (!running_avds().contains(name)) return {};

    if (auto stopped = stop_device(name); !stopped) {
        return std::unexpected(stopped.error());
    }
    for (unsigned attempt = 0; attempt < settings_.stop_poll_attempts; ++attempt) {
        if (!running_avds().contains(name)) return {};
        core::sleep_for(settings_.stop_poll_interval, std::stop_token{});
    }
    std::cerr << "[Android] '" << name << "' is still shutting down, continuing anyway\n";
    return {};
}

DeviceResult<void> AndroidManager::delete_device(const std::string& name) {
    auto stanza = find_avd(name);
    if (!stanza) return std::unexpected(stanza.error());

    if (auto stopped = stop_and_wait(name); !stopped) {
        return std::unexpected(stopped.error());
    }

    auto avdmanager = tool("avdmanager");
    if (!avdmanager) return std::unexpected(avdmanager.error());

    auto result = executor_->run(*avdmanager, {"delete", "avd", "-n", name});
    if (!result) {
        const std::string text = core::failure_text(result.error());
        if (utils::contains(text, "no Android Virtual Device")) {
            return std::unexpected(DeviceError::not_found(name));
        }
        return std::unexpected(DeviceError::delete_failed(name, android::summarize_tool_error(text)));
    }
    log_info("Deleted '" + name + "'");
    return {};
}

DeviceResult<void> AndroidManager::wipe_device(const std::string& name) {
    auto stanza = find_avd(name);
    if (!stanza) return std::unexpected(stanza.error());

    if (auto stopped = stop_and_wait(name); !stopped) {
        return std::unexpected(stopped.error());
    }
    return launch_emulator(name, true);
}

DeviceResult<core::DeviceDetails> AndroidManager::get_device_details(const std::string& name) {
    auto stanza = find_avd(name);
    if (!stanza) return std::unexpected(stanza.error());

    std::map<std::string, std::string> config;
    if (auto content = read_file(config_ini_path(*stanza))) {
        config = android::parse_config_ini(*content);
    }
    auto value = [&](const char* key) -> std::optional<std::string> {
        auto it = config.find(key);
        if (it == config.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };

    uint32_t api = stanza->api_level != 0 ? stanza->api_level : android::api_level_from_config(config);
    const auto running = running_avds();
    std::string status = "Stopped";
    if (auto it = running.find(name); it != running.end()) {
        status = it->second.state == "device" ? "Running" : "Starting";
    }

    core::DeviceDetails details;
    details.name = name;
    details.identifier = name;
    details.status = status;
    details.platform = core::Platform::Android;
    details.device_type = stanza->device.empty() ? value("hw.device.name").value_or("") : stanza->device;
    details.api_level_or_version =
        "API " + std::to_string(api) + " (" + android::android_version_name(api) + ")";
    if (auto ram = value("hw.ramSize")) details.ram_size = *ram + " MB";
    details.storage_size = value("disk.dataPartition.size");
    if (auto w = value("hw.lcd.width"), h = value("hw.lcd.height"); w && h) {
        details.resolution = *w + "x" + *h;
    }
    if (auto dpi = value("hw.lcd.density")) details.dpi = *dpi + " DPI";
    if (!stanza->path.empty()) details.device_path = stanza->path;
    details.system_image = value("image.sysdir.1");
    return details;
}

DeviceResult<std::vector<std::pair<std::string, std::string>>> AndroidManager::list_device_types() {
    auto avdmanager = tool("avdmanager");
    if (!avdmanager) return std::unexpected(avdmanager.error());

    auto output = executor_->run(*avdmanager, {"list", "device"});
    if (!output) return std::unexpected(output.error());

    std::vector<std::pair<std::string, std::string>> types;
    for (const auto& profile : android::parse_device_profiles(*output)) {
        types.emplace_back(profile.id, profile.display_name());
    }
    std::stable_sort(types.begin(), types.end(), [](const auto& a, const auto& b) {
        return calculate_android_device_priority(a.first, a.second) <
               calculate_android_device_priority(b.first, b.second);
    });
    return types;
}

DeviceResult<std::vector<std::pair<std::string, std::string>>>
AndroidManager::list_devices_by_category(DeviceCategory category) {
    auto types = list_device_types();
    if (!types) return std::unexpected(types.error());

    std::vector<std::pair<std::string, std::string>> filtered;
    for (auto& entry : *types) {
        if (classify_device_category(entry.first, entry.second) == category) {
            filtered.push_back(std::move(entry));
        }
    }
    return filtered;
}

DeviceResult<std::vector<std::pair<std::string, std::string>>> AndroidManager::list_targets() {
    auto avdmanager = tool("avdmanager");
    if (!avdmanager) return std::unexpected(avdmanager.error());

    auto output = executor_->run(*avdmanager, {"list", "target"});
    if (!output) return std::unexpected(output.error());
    return android::parse_targets(*output);
}

DeviceResult<std::vector<core::ApiLevel>> AndroidManager::list_api_levels() {
    auto sdkmanager = tool("sdkmanager");
    if (!sdkmanager) return std::unexpected(sdkmanager.error());

    auto output = executor_->run_with_retry(*sdkmanager, {"--list", "--verbose"}, settings_.max_retries);
    if (!output) return std::unexpected(output.error());
    return android::parse_api_levels(*output);
}

DeviceResult<void> AndroidManager::install_system_image(const std::string& package_id,
                                                        const ProgressCallback& progress) {
    if (!android::parse_system_image_package(package_id)) {
        return std::unexpected(DeviceError::invalid_config("Not a system image package: '" + package_id + "'"));
    }
    auto sdkmanager = tool("sdkmanager");
    if (!sdkmanager) return std::unexpected(sdkmanager.error());

    uint8_t reported = 0;
    bool any_reported = false;
    auto report = [&](const core::InstallProgress& update) {
        if (any_reported && update.percentage < reported) return;
        reported = update.percentage;
        any_reported = true;
        if (progress) progress(update);
    };

    report({"Preparing installation...", 0, std::nullopt});
    report({"Starting installation process...", 5, std::nullopt});
    log_info("Installing " + package_id);

    // sdkmanager prompts for license acceptance before downloading.
    auto result = executor_->execute_with_input(*sdkmanager, {package_id}, "y\n",
                                                [&](const std::string& line) {
                                                    if (auto update = android::parse_install_progress_line(line)) {
                                                        report(*update);
                                                    }
                                                });
    if (!result) {
        std::string reason = android::summarize_tool_error(core::failure_text(result.error()));
        return std::unexpected(DeviceError::other("Failed to install " + package_id + ": " + reason));
    }

    report({"Installation complete", 100, std::nullopt});
    return {};
}

DeviceResult<void> AndroidManager::uninstall_system_image(const std::string& package_id) {
    auto sdkmanager = tool("sdkmanager");
    if (!sdkmanager) return std::unexpected(sdkmanager.error());

    auto result = executor_->run(*sdkmanager, {"--uninstall", package_id});
    if (!result) {
        std::string reason = android::summarize_tool_error(core::failure_text(result.error()));
        return std::unexpected(DeviceError::other("Failed to uninstall " + package_id + ": " + reason));
    }
    log_info("Uninstalled " + package_id);
    return {};
}

DeviceResult<void> AndroidManager::wait_for_boot(const std::string& serial, std::chrono::seconds timeout,
                                                 std::stop_token stop) {
    auto adb = tool("adb");
    if (!adb) return std::unexpected(adb.error());

    if (auto attached = executor_->run(*adb, {"-s", serial, "wait-for-device"}); !attached) {
        return std::unexpected(DeviceError::start_failed(serial, core::failure_text(attached.error())));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto booted = executor_->run(*adb, {"-s", serial, "shell", "getprop", "sys.boot_completed"});
        if (booted && utils::trim(*booted) == "1") {
            log_info(serial + " finished booting");
            return {};
        }
        if (!core::sleep_for(std::chrono::seconds(1), stop)) {
            return std::unexpected(DeviceError::other("operation cancelled"));
        }
    }
    return std::unexpected(DeviceError::start_failed(
        serial, "Boot did not complete within " + std::to_string(timeout.count()) + "s"));
}

} // namespace emu_manager::modules
