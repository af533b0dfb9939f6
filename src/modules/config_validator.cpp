#include "modules/config_validator.hpp"

namespace emu_manager::modules {

std::vector<std::string> ConfigValidator::validate(const AppConfig& config) {
    std::vector<std::string> errors;

    auto check_range = [&](uint32_t val, uint32_t min, uint32_t max, const std::string& name) {
        if (val < min || val > max) {
            errors.push_back(name + " out of range [" + std::to_string(min) + ", " + std::to_string(max) +
                             "]: " + std::to_string(val));
        }
    };

    // 1. Android defaults
    check_range(config.android.default_ram_mb, 512, 8192, "android.default_ram_mb");
    check_range(config.android.default_storage_mb, 1024, 65536, "android.default_storage_mb");
    check_range(config.android.default_api_level, 1, 50, "android.default_api_level");
    if (config.android.default_tag.empty()) {
        errors.push_back("android.default_tag must not be empty.");
    }
    for (size_t i = 0; i < config.android.emulator_flags.size(); ++i) {
        const auto& flag = config.android.emulator_flags[i];
        if (flag.empty() || flag[0] != '-') {
            errors.push_back("android.emulator_flags[" + std::to_string(i) + "] is not a flag: '" + flag + "'");
        }
        if (flag == "-wipe-data" || flag == "-avd") {
            errors.push_back("android.emulator_flags[" + std::to_string(i) + "] is managed internally: " + flag);
        }
    }

    // 2. Refresh timing
    const auto& r = config.refresh;
    if (r.fast_interval_secs < 1) {
        errors.push_back("refresh.fast_interval_secs must be at least 1.");
    }
    if (r.fast_interval_secs > r.interval_secs) {
        errors.push_back("refresh.fast_interval_secs (" + std::to_string(r.fast_interval_secs) +
                         ") exceeds refresh.interval_secs (" + std::to_string(r.interval_secs) + ").");
    }
    if (r.start_timeout_secs == 0) {
        errors.push_back("refresh.start_timeout_secs must be positive.");
    }
    if (r.cache_ttl_secs == 0) {
        errors.push_back("refresh.cache_ttl_secs must be positive.");
    }

    // 3. Command retries
    const auto& c = config.commands;
    if (c.max_retries > 10) {
        errors.push_back("commands.max_retries out of range [0, 10]: " + std::to_string(c.max_retries));
    }
    if (c.initial_retry_delay_ms > c.max_retry_delay_ms) {
        errors.push_back("commands.initial_retry_delay_ms (" + std::to_string(c.initial_retry_delay_ms) +
                         ") exceeds commands.max_retry_delay_ms (" + std::to_string(c.max_retry_delay_ms) + ").");
    }

    return errors;
}

} // namespace emu_manager::modules
