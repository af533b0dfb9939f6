#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <future>
#include <memory>
#include <iomanip>
#include <string>
#include <vector>

#include "core/device_error.hpp"
#include "core/process_executor.hpp"
#include "modules/android_manager.hpp"
#include "modules/cache_store.hpp"
#include "modules/config_module.hpp"
#include "modules/config_validator.hpp"
#include "modules/ios_manager.hpp"
#include "modules/refresh_coordinator.hpp"

using namespace emu_manager;

std::atomic<bool> g_running{true};

void sigint_handler(int) {
    g_running = false;
}

namespace {

void print_usage() {
    std::cerr << "Usage: emu_manager [--config PATH] <command>\n"
              << "  list\n"
              << "  start NAME | stop NAME | delete NAME | wipe NAME | details NAME\n"
              << "  create android NAME DEVICE_TYPE API\n"
              << "  create ios NAME DEVICE_TYPE RUNTIME\n"
              << "  api-levels\n"
              << "  install PACKAGE\n"
              << "  device-types\n"
              << "  watch\n";
}

int report(const core::DeviceError& err) {
    std::cerr << "[Core] " << core::error_title(err.kind) << ": " << core::user_message(err) << "\n";
    return 1;
}

void print_devices(core::Platform platform, const std::vector<core::Device>& devices) {
    std::cout << core::platform_to_string(platform) << " (" << devices.size() << ")\n";
    for (const auto& d : devices) {
        std::cout << "  " << std::left << std::setw(32) << d.name << std::setw(10)
                  << core::status_to_string(d.status);
        if (const auto* a = d.android()) {
            std::cout << "API " << a->api_level << "  " << a->device_type;
        } else if (const auto* i = d.ios()) {
            std::cout << i->runtime_version << "  " << i->device_type;
            if (!i->is_available) std::cout << " (unavailable)";
        }
        std::cout << "\n";
    }
}

// Platform and identifier of the device called `name` on any platform.
core::DeviceResult<std::pair<core::Platform, std::string>> locate(modules::RefreshCoordinator& coordinator,
                                                                  const std::string& name) {
    for (auto platform : {core::Platform::Android, core::Platform::Ios}) {
        if (!coordinator.has_platform(platform)) continue;
        if (auto refreshed = coordinator.refresh_now(platform); !refreshed) {
            std::cerr << "[Core] " << core::platform_to_string(platform)
                      << " listing failed: " << refreshed.error().message() << "\n";
            continue;
        }
        for (const auto& d : *coordinator.devices(platform)) {
            if (d.name == name || d.identifier == name) {
                return std::make_pair(platform, d.identifier);
            }
        }
    }
    return std::unexpected(core::DeviceError::not_found(name));
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, sigint_handler);
    std::signal(SIGTERM, sigint_handler);

    std::string config_path = modules::default_config_path().string();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        print_usage();
        return 1;
    }
    const std::string& command = args[0];

    // 1. Load Configuration
    modules::ConfigModule config_module;
    auto app_config_res = config_module.load_or_create_config(config_path);
    if (!app_config_res) {
        std::cerr << "[Core] Fatal Config Error (" << modules::config_error_to_string(app_config_res.error())
                  << ")! Cannot proceed.\n";
        return 1;
    }
    auto app_config = app_config_res.value();

    // 2. Validate Configuration
    auto config_errors = modules::ConfigValidator::validate(app_config);
    if (!config_errors.empty()) {
        std::cerr << "[Config] " << config_errors.size() << " validation error(s):\n";
        for (const auto& err : config_errors) {
            std::cerr << "  - " << err << "\n";
        }
        return 1;
    }

    // 3. Platform managers
    auto executor = std::make_shared<core::ProcessExecutor>();
    executor->set_retry_policy(modules::to_retry_policy(app_config));

    std::shared_ptr<modules::AndroidManager> android;
    if (auto created = modules::AndroidManager::create(executor, modules::to_android_settings(app_config))) {
        android = std::move(created.value());
    } else {
        std::cerr << "[Core] Android unavailable: " << created.error().message() << "\n";
    }
    auto ios = std::make_shared<modules::IosManager>(executor, modules::to_ios_settings(app_config));

    std::vector<std::shared_ptr<core::DeviceManager>> managers;
    if (android) managers.push_back(android);
    if (ios->is_available()) managers.push_back(ios);

    modules::RefreshCoordinator coordinator(managers, modules::to_refresh_settings(app_config));

    modules::CacheStore cache_store(app_config.cache.path.empty() ? modules::CacheStore::default_path()
                                                                  : std::filesystem::path(app_config.cache.path));
    auto save_cache = [&]() {
        if (!app_config.cache.enabled) return;
        if (auto saved = cache_store.save(*coordinator.devices(core::Platform::Android),
                                          *coordinator.devices(core::Platform::Ios));
            !saved) {
            std::cerr << "[Cache] " << saved.error().message() << "\n";
        }
    };

    // 4. Commands
    if (command == "list") {
        bool failed = false;
        for (auto platform : {core::Platform::Android, core::Platform::Ios}) {
            if (!coordinator.has_platform(platform)) continue;
            if (auto refreshed = coordinator.refresh_now(platform); !refreshed) {
                report(refreshed.error());
                failed = true;
                continue;
            }
            print_devices(platform, *coordinator.devices(platform));
        }
        save_cache();
        return failed ? 1 : 0;
    }

    if (command == "start" || command == "stop" || command == "delete" || command == "wipe") {
        if (args.size() != 2) {
            print_usage();
            return 1;
        }
        auto target = locate(coordinator, args[1]);
        if (!target) return report(target.error());
        auto [platform, identifier] = *target;

        std::future<core::DeviceResult<void>> pending;
        if (command == "start") pending = coordinator.start_device(platform, identifier);
        else if (command == "stop") pending = coordinator.stop_device(platform, identifier);
        else if (command == "delete") pending = coordinator.delete_device(platform, identifier);
        else pending = coordinator.wipe_device(platform, identifier);

        if (auto result = pending.get(); !result) return report(result.error());
        std::cout << "[Core] " << command << " " << args[1] << ": done\n";
        return 0;
    }

    if (command == "details") {
        if (args.size() != 2) {
            print_usage();
            return 1;
        }
        auto target = locate(coordinator, args[1]);
        if (!target) return report(target.error());
        std::shared_ptr<core::DeviceManager> manager =
            target->first == core::Platform::Android ? std::shared_ptr<core::DeviceManager>(android)
                                                     : std::shared_ptr<core::DeviceManager>(ios);
        auto details = manager->get_device_details(target->second);
        if (!details) return report(details.error());

        auto field = [](const char* label, const std::string& value) {
            std::cout << "  " << std::left << std::setw(14) << label << value << "\n";
        };
        field("Name", details->name);
        field("Identifier", details->identifier);
        field("Platform", core::platform_to_string(details->platform));
        field("Status", details->status);
        field("Device", details->device_type);
        field("Version", details->api_level_or_version);
        if (details->ram_size) field("RAM", *details->ram_size);
        if (details->storage_size) field("Storage", *details->storage_size);
        if (details->resolution) field("Resolution", *details->resolution);
        if (details->dpi) field("Density", *details->dpi);
        if (details->system_image) field("Image", *details->system_image);
        if (details->device_path) field("Path", *details->device_path);
        return 0;
    }

    if (command == "create") {
        if (args.size() < 4 || args.size() > 5) {
            print_usage();
            return 1;
        }
        core::DeviceConfig config;
        config.name = args[2];
        config.device_type = args[3];

        core::Platform platform = core::Platform::Android;
        if (args[1] == "android") {
            platform = core::Platform::Android;
            config.version = args.size() == 5 ? args[4] : std::to_string(app_config.android.default_api_level);
        } else if (args[1] == "ios") {
            platform = core::Platform::Ios;
            config.version = args.size() == 5 ? args[4] : app_config.ios.default_runtime;
        } else {
            print_usage();
            return 1;
        }

        auto created = coordinator.create_device(platform, config).get();
        if (!created) return report(created.error());
        std::cout << "[Core] Created " << *created << "\n";
        return 0;
    }

    if (command == "api-levels") {
        if (!android) return report(core::DeviceError::sdk_not_found("Android", "Android SDK not found. Please set ANDROID_HOME or ANDROID_SDK_ROOT"));
        auto levels = android->list_api_levels();
        if (!levels) return report(levels.error());
        for (const auto& level : *levels) {
            std::cout << (level.is_installed ? "* " : "  ") << level.display_name();
            if (const auto* v = level.get_recommended_variant()) {
                std::cout << "  [" << v->package_id << "]";
            }
            std::cout << "\n";
        }
        return 0;
    }

    if (command == "install") {
        if (args.size() != 2) {
            print_usage();
            return 1;
        }
        if (!android) return report(core::DeviceError::sdk_not_found("Android", "Android SDK not found. Please set ANDROID_HOME or ANDROID_SDK_ROOT"));
        auto installed = android->install_system_image(args[1], [](const core::InstallProgress& p) {
            std::cout << "[" << std::setw(3) << static_cast<int>(p.percentage) << "%] " << p.operation << "\n";
        });
        if (!installed) return report(installed.error());
        return 0;
    }

    if (command == "device-types") {
        for (const auto& manager : managers) {
            auto types = manager->list_device_types();
            if (!types) {
                report(types.error());
                continue;
            }
            std::cout << core::platform_to_string(manager->platform()) << "\n";
            for (const auto& [id, display] : *types) {
                std::cout << "  " << std::left << std::setw(40) << id << display << "\n";
            }
        }
        return 0;
    }

    if (command == "watch") {
        if (app_config.cache.enabled) {
            auto max_age = std::chrono::seconds(app_config.refresh.cache_ttl_secs);
            if (auto stored = cache_store.load(max_age)) {
                coordinator.seed(core::Platform::Android, stored->android);
                coordinator.seed(core::Platform::Ios, stored->ios);
                std::cout << "[Core] Loaded cached device list from " << cache_store.path() << "\n";
            }
        }

        coordinator.set_listener([](core::Platform platform, const modules::CachedDeviceList::Snapshot& snapshot) {
            print_devices(platform, *snapshot);
        });
        coordinator.start();
        std::cout << "[Core] Watching devices. Press Ctrl+C to stop.\n";

        while (g_running) {
            for (const auto& message : coordinator.take_notifications()) {
                std::cout << "[Core] " << message << "\n";
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "\n[Core] Shutting down gracefully...\n";
        coordinator.stop();
        save_cache();
        return 0;
    }

    std::cerr << "[Core] Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
