#pragma once

#include "core/device.hpp"
#include "core/device_error.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <vector>

namespace emu_manager::modules {

struct StoredDevices {
    std::vector<core::Device> android;
    std::vector<core::Device> ios;
    std::chrono::system_clock::time_point last_updated;
};

// Snapshot of both platforms persisted between runs so the first screen
// has something to show before the first refresh completes.
class CacheStore {
public:
    static constexpr int kVersion = 1;

    explicit CacheStore(std::filesystem::path path);

    // $XDG_CACHE_HOME/emu_manager/devices.json, else ~/.cache/emu_manager/devices.json
    static std::filesystem::path default_path();

    core::DeviceResult<void> save(const std::vector<core::Device>& android,
                                  const std::vector<core::Device>& ios,
                                  std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    // nullopt for a missing, corrupt, foreign-version or expired file.
    std::optional<StoredDevices> load(std::chrono::seconds max_age,
                                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace emu_manager::modules
