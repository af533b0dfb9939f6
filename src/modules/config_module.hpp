#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "core/command_executor.hpp"
#include "modules/android_manager.hpp"
#include "modules/ios_manager.hpp"
#include "modules/refresh_coordinator.hpp"

namespace emu_manager::modules {

enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

std::string config_error_to_string(ConfigError error);

struct AndroidConfig {
    uint32_t default_ram_mb = 2048;
    uint32_t default_storage_mb = 8192;
    uint32_t default_api_level = 34;
    std::string default_tag = "google_apis_playstore";
    std::vector<std::string> emulator_flags = {"-no-audio", "-no-snapshot-save", "-no-boot-anim", "-netfast"};
};

struct IosConfig {
    std::string default_device_type; // "" = let the caller pick
    std::string default_runtime;     // "" = newest installed
};

struct RefreshConfig {
    uint32_t interval_secs = 5;
    uint32_t fast_interval_secs = 1;
    uint32_t start_timeout_secs = 60;
    uint32_t cache_ttl_secs = 300;
};

struct CommandsConfig {
    uint32_t max_retries = 2;
    uint32_t initial_retry_delay_ms = 100;
    uint32_t max_retry_delay_ms = 2000;
};

struct CacheConfig {
    bool enabled = true;
    std::string path; // "" = CacheStore::default_path()
};

struct AppConfig {
    AndroidConfig android;
    IosConfig ios;
    RefreshConfig refresh;
    CommandsConfig commands;
    CacheConfig cache;
    bool quiet = false;
};

// $XDG_CONFIG_HOME/emu_manager/config.json, else ~/.config/emu_manager/config.json
std::filesystem::path default_config_path();

AndroidSettings to_android_settings(const AppConfig& config);
IosSettings to_ios_settings(const AppConfig& config);
RefreshSettings to_refresh_settings(const AppConfig& config);
core::RetryPolicy to_retry_policy(const AppConfig& config);

class ConfigModule {
public:
    ConfigModule() = default;
    ~ConfigModule() = default;

    // Missing file or missing sections are filled with defaults and written back.
    std::expected<AppConfig, ConfigError> load_or_create_config(const std::string& filepath);

    std::expected<void, ConfigError> save_config(const AppConfig& config, const std::string& filepath);
};

} // namespace emu_manager::modules
