#include "config_module.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace emu_manager::modules {

std::string config_error_to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "FileNotFound";
        case ConfigError::ParseError: return "ParseError";
        case ConfigError::WriteError: return "WriteError";
        default: return "Unknown";
    }
}

std::filesystem::path default_config_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".config";
    }
    return base / "emu_manager" / "config.json";
}

AndroidSettings to_android_settings(const AppConfig& config) {
    AndroidSettings settings;
    settings.emulator_flags = config.android.emulator_flags;
    settings.default_ram_mb = config.android.default_ram_mb;
    settings.default_storage_mb = config.android.default_storage_mb;
    settings.default_tag = config.android.default_tag;
    settings.max_retries = config.commands.max_retries;
    settings.quiet = config.quiet;
    return settings;
}

IosSettings to_ios_settings(const AppConfig& config) {
    IosSettings settings;
    settings.max_retries = config.commands.max_retries;
    settings.quiet = config.quiet;
    return settings;
}

RefreshSettings to_refresh_settings(const AppConfig& config) {
    RefreshSettings settings;
    settings.interval = std::chrono::seconds(config.refresh.interval_secs);
    settings.fast_interval = std::chrono::seconds(config.refresh.fast_interval_secs);
    settings.start_timeout = std::chrono::seconds(config.refresh.start_timeout_secs);
    settings.cache_ttl = std::chrono::seconds(config.refresh.cache_ttl_secs);
    settings.quiet = config.quiet;
    return settings;
}

core::RetryPolicy to_retry_policy(const AppConfig& config) {
    return {std::chrono::milliseconds(config.commands.initial_retry_delay_ms),
            std::chrono::milliseconds(config.commands.max_retry_delay_ms)};
}

std::expected<void, ConfigError> ConfigModule::save_config(const AppConfig& config, const std::string& filepath) {
    nlohmann::json j;

    j["android"]["default_ram_mb"] = config.android.default_ram_mb;
    j["android"]["default_storage_mb"] = config.android.default_storage_mb;
    j["android"]["default_api_level"] = config.android.default_api_level;
    j["android"]["default_tag"] = config.android.default_tag;
    j["android"]["emulator_flags"] = config.android.emulator_flags;

    j["ios"]["default_device_type"] = config.ios.default_device_type;
    j["ios"]["default_runtime"] = config.ios.default_runtime;

    j["refresh"]["interval_secs"] = config.refresh.interval_secs;
    j["refresh"]["fast_interval_secs"] = config.refresh.fast_interval_secs;
    j["refresh"]["start_timeout_secs"] = config.refresh.start_timeout_secs;
    j["refresh"]["cache_ttl_secs"] = config.refresh.cache_ttl_secs;

    j["commands"]["max_retries"] = config.commands.max_retries;
    j["commands"]["initial_retry_delay_ms"] = config.commands.initial_retry_delay_ms;
    j["commands"]["max_retry_delay_ms"] = config.commands.max_retry_delay_ms;

    j["cache"]["enabled"] = config.cache.enabled;
    j["cache"]["path"] = config.cache.path;

    j["quiet"] = config.quiet;

    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(filepath);
    if (!out.is_open()) {
        std::cerr << "[Config] Cannot write " << filepath << "\n";
        return std::unexpected(ConfigError::WriteError);
    }
    out << j.dump(4);
    return {};
}

std::expected<AppConfig, ConfigError> ConfigModule::load_or_create_config(const std::string& filepath) {
    AppConfig config;
    bool needs_save = false;

    std::ifstream in(filepath);
    if (!in.is_open()) {
        std::cout << "[Config] Config not found at " << filepath << ". Generating default config.\n";
        needs_save = true;
    } else {
        try {
            nlohmann::json j;
            in >> j;

            if (j.contains("android") && j["android"].is_object()) {
                const auto& a = j["android"];
                config.android.default_ram_mb = a.value("default_ram_mb", 2048u);
                config.android.default_storage_mb = a.value("default_storage_mb", 8192u);
                config.android.default_api_level = a.value("default_api_level", 34u);
                config.android.default_tag = a.value("default_tag", "google_apis_playstore");

                if (a.contains("emulator_flags") && a["emulator_flags"].is_array()) {
                    config.android.emulator_flags.clear();
                    for (const auto& item : a["emulator_flags"]) {
                        if (item.is_string()) config.android.emulator_flags.push_back(item.get<std::string>());
                    }
                }
            } else {
                needs_save = true; // Repair missing section
            }

            if (j.contains("ios") && j["ios"].is_object()) {
                config.ios.default_device_type = j["ios"].value("default_device_type", "");
                config.ios.default_runtime = j["ios"].value("default_runtime", "");
            } else {
                needs_save = true;
            }

            if (j.contains("refresh") && j["refresh"].is_object()) {
                const auto& r = j["refresh"];
                config.refresh.interval_secs = r.value("interval_secs", 5u);
                config.refresh.fast_interval_secs = r.value("fast_interval_secs", 1u);
                config.refresh.start_timeout_secs = r.value("start_timeout_secs", 60u);
                config.refresh.cache_ttl_secs = r.value("cache_ttl_secs", 300u);
            } else {
                needs_save = true;
            }

            if (j.contains("commands") && j["commands"].is_object()) {
                const auto& c = j["commands"];
                config.commands.max_retries = c.value("max_retries", 2u);
                config.commands.initial_retry_delay_ms = c.value("initial_retry_delay_ms", 100u);
                config.commands.max_retry_delay_ms = c.value("max_retry_delay_ms", 2000u);
            } else {
                needs_save = true;
            }

            if (j.contains("cache") && j["cache"].is_object()) {
                config.cache.enabled = j["cache"].value("enabled", true);
                config.cache.path = j["cache"].value("path", "");
            } else {
                needs_save = true;
            }

            config.quiet = j.value("quiet", false);

        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[Config] Parse error: " << e.what() << "\n";
            return std::unexpected(ConfigError::ParseError);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[Config] Parse error: " << e.what() << "\n";
            return std::unexpected(ConfigError::ParseError);
        }
    }

    if (needs_save) {
        if (auto saved = save_config(config, filepath); !saved) {
            std::cerr << "[Config] Continuing with unsaved defaults\n";
        }
    }

    return config;
}

} // namespace emu_manager::modules
