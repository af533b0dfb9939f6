#include "modules/cache_store.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace emu_manager::modules {

namespace {

nlohmann::json device_to_json(const core::Device& device) {
    nlohmann::json j;
    j["name"] = device.name;
    j["identifier"] = device.identifier;
    j["status"] = core::status_to_string(device.status);

    if (const auto* android = device.android()) {
        j["platform"] = "android";
        j["api_level"] = android->api_level;
        j["device_type"] = android->device_type;
        j["ram_size"] = android->ram_size;
        j["storage_size"] = android->storage_size;
    } else if (const auto* ios = device.ios()) {
        j["platform"] = "ios";
        j["udid"] = ios->udid;
        j["ios_version"] = ios->ios_version;
        j["runtime_version"] = ios->runtime_version;
        j["device_type"] = ios->device_type;
        j["is_available"] = ios->is_available;
    }
    return j;
}

std::optional<core::Device> device_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    core::Device device;
    device.name = j.value("name", "");
    device.identifier = j.value("identifier", "");
    if (device.name.empty() || device.identifier.empty()) return std::nullopt;
    device.status = core::status_from_string(j.value("status", "")).value_or(core::DeviceStatus::Unknown);

    const std::string platform = j.value("platform", "");
    if (platform == "android") {
        core::AndroidInfo info;
        info.api_level = j.value("api_level", 0u);
        info.device_type = j.value("device_type", "");
        info.ram_size = j.value("ram_size", "");
        info.storage_size = j.value("storage_size", "");
        device.info = std::move(info);
    } else if (platform == "ios") {
        core::IosInfo info;
        info.udid = j.value("udid", device.identifier);
        info.ios_version = j.value("ios_version", "");
        info.runtime_version = j.value("runtime_version", "");
        info.device_type = j.value("device_type", "");
        info.is_available = j.value("is_available", true);
        device.info = std::move(info);
    } else {
        return std::nullopt;
    }
    return device;
}

std::vector<core::Device> devices_from_json(const nlohmann::json& j, const char* key) {
    std::vector<core::Device> devices;
    if (!j.contains(key) || !j[key].is_array()) return devices;
    for (const auto& item : j[key]) {
        if (auto device = device_from_json(item)) {
            devices.push_back(std::move(*device));
        }
    }
    return devices;
}

} // namespace

CacheStore::CacheStore(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path CacheStore::default_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path(home) / ".cache";
    } else {
        base = ".cache";
    }
    return base / "emu_manager" / "devices.json";
}

core::DeviceResult<void> CacheStore::save(const std::vector<core::Device>& android,
                                          const std::vector<core::Device>& ios,
                                          std::chrono::system_clock::time_point now) const {
    nlohmann::json j;
    j["version"] = kVersion;
    j["last_updated"] = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    j["android"] = nlohmann::json::array();
    for (const auto& device : android) j["android"].push_back(device_to_json(device));
    j["ios"] = nlohmann::json::array();
    for (const auto& device : ios) j["ios"].push_back(device_to_json(device));

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return std::unexpected(core::DeviceError::io("Cannot create " + path_.parent_path().string() +
                                                         ": " + ec.message()));
        }
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(core::DeviceError::io("Cannot write " + path_.string()));
    }
    out << j.dump(2);
    return {};
}

std::optional<StoredDevices> CacheStore::load(std::chrono::seconds max_age,
                                              std::chrono::system_clock::time_point now) const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[Cache] Ignoring corrupt cache " << path_ << ": " << e.what() << "\n";
        return std::nullopt;
    }

    try {
        if (!j.is_object() || j.value("version", 0) != kVersion) {
            std::cerr << "[Cache] Ignoring cache " << path_ << " with unsupported version\n";
            return std::nullopt;
        }

        const auto stamp = std::chrono::system_clock::time_point(
            std::chrono::seconds(j.value("last_updated", int64_t{0})));
        if (now - stamp > max_age) {
            return std::nullopt;
        }
        return StoredDevices{devices_from_json(j, "android"), devices_from_json(j, "ios"), stamp};
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Cache] Ignoring malformed cache " << path_ << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace emu_manager::modules
