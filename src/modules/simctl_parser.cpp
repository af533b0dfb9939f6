#include "modules/simctl_parser.hpp"

#include "utils/string_utils.hpp"

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

namespace emu_manager::modules::ios {

using core::DeviceError;
using core::DeviceResult;

namespace {

DeviceResult<nlohmann::json> parse_object(const std::string& json_text, const char* member) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(DeviceError::parse(std::string("simctl output is not JSON: ") + e.what()));
    }
    if (!json.is_object() || !json.contains(member)) {
        return std::unexpected(DeviceError::parse(std::string("simctl output has no '") + member + "' member"));
    }
    return json[member];
}

std::string string_field(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// Xcode 10 and older report availability as a string.
bool availability(const nlohmann::json& object) {
    if (auto it = object.find("isAvailable"); it != object.end()) {
        if (it->is_boolean()) return it->get<bool>();
        if (it->is_string()) return it->get<std::string>() == "YES";
    }
    if (auto it = object.find("availability"); it != object.end() && it->is_string()) {
        return it->get<std::string>() == "(available)";
    }
    return true;
}

// "iOS-17-0" or "iOS 17.0" -> {"iOS", "17.0"}
std::pair<std::string, std::string> split_runtime(const std::string& runtime_identifier) {
    std::string tail = runtime_identifier;
    if (size_t pos = tail.rfind("SimRuntime."); pos != std::string::npos) {
        tail = tail.substr(pos + 11);
        size_t dash = tail.find('-');
        if (dash == std::string::npos) return {tail, {}};
        std::string version = tail.substr(dash + 1);
        std::replace(version.begin(), version.end(), '-', '.');
        return {tail.substr(0, dash), version};
    }
    size_t space = tail.find(' ');
    if (space == std::string::npos) return {tail, {}};
    return {tail.substr(0, space), utils::trim(std::string_view(tail).substr(space + 1))};
}

} // namespace

DeviceResult<std::vector<SimDeviceRecord>> parse_device_records(const std::string& json_text) {
    auto devices = parse_object(json_text, "devices");
    if (!devices) return std::unexpected(devices.error());
    if (!devices->is_object()) {
        return std::unexpected(DeviceError::parse("simctl 'devices' member is not an object"));
    }

    std::vector<SimDeviceRecord> records;
    for (const auto& [runtime, entries] : devices->items()) {
        if (!entries.is_array()) continue;
        for (const auto& entry : entries) {
            if (!entry.is_object()) continue;
            SimDeviceRecord record;
            record.udid = string_field(entry, "udid");
            record.name = string_field(entry, "name");
            if (record.udid.empty() || record.name.empty()) {
                std::cerr << "[iOS] Skipping malformed simulator entry under " << runtime << "\n";
                continue;
            }
            record.state = string_field(entry, "state");
            record.device_type_identifier = string_field(entry, "deviceTypeIdentifier");
            record.data_path = string_field(entry, "dataPath");
            record.runtime_identifier = runtime;
            record.is_available = availability(entry);
            records.push_back(std::move(record));
        }
    }
    return records;
}

DeviceResult<std::vector<SimDeviceType>> parse_device_types(const std::string& json_text) {
    auto types = parse_object(json_text, "devicetypes");
    if (!types) return std::unexpected(types.error());
    if (!types->is_array()) {
        return std::unexpected(DeviceError::parse("simctl 'devicetypes' member is not an array"));
    }

    std::vector<SimDeviceType> result;
    for (const auto& entry : *types) {
        if (!entry.is_object()) continue;
        SimDeviceType type{string_field(entry, "identifier"), string_field(entry, "name")};
        if (type.identifier.empty()) continue;
        if (type.name.empty()) type.name = device_type_fallback_name(type.identifier);
        result.push_back(std::move(type));
    }
    return result;
}

DeviceResult<std::vector<SimRuntime>> parse_runtimes(const std::string& json_text) {
    auto runtimes = parse_object(json_text, "runtimes");
    if (!runtimes) return std::unexpected(runtimes.error());
    if (!runtimes->is_array()) {
        return std::unexpected(DeviceError::parse("simctl 'runtimes' member is not an array"));
    }

    std::vector<SimRuntime> result;
    for (const auto& entry : *runtimes) {
        if (!entry.is_object()) continue;
        SimRuntime runtime;
        runtime.identifier = string_field(entry, "identifier");
        if (runtime.identifier.empty()) continue;
        runtime.version = string_field(entry, "version");
        if (runtime.version.empty()) runtime.version = runtime_version(runtime.identifier);
        runtime.name = string_field(entry, "name");
        if (runtime.name.empty()) runtime.name = "iOS " + runtime.version;
        runtime.is_available = availability(entry);
        result.push_back(std::move(runtime));
    }
    return result;
}

std::string runtime_version(const std::string& runtime_identifier) {
    return split_runtime(runtime_identifier).second;
}

std::string runtime_display_name(const std::string& runtime_identifier) {
    auto [platform, version] = split_runtime(runtime_identifier);
    if (version.empty()) return platform;
    return platform + " " + version;
}

std::string device_type_fallback_name(const std::string& identifier) {
    std::string tail = identifier;
    if (size_t pos = tail.rfind("SimDeviceType."); pos != std::string::npos) {
        tail = tail.substr(pos + 14);
    }
    std::replace(tail.begin(), tail.end(), '-', ' ');
    return tail;
}

core::DeviceStatus state_to_status(const std::string& state) {
    if (state == "Booted") return core::DeviceStatus::Running;
    if (state == "Shutdown") return core::DeviceStatus::Stopped;
    if (state == "Creating") return core::DeviceStatus::Creating;
    if (state == "Shutting Down") return core::DeviceStatus::Stopping;
    if (state == "Booting") return core::DeviceStatus::Starting;
    return core::DeviceStatus::Unknown;
}

bool version_less(const std::string& a, const std::string& b) {
    auto pa = utils::split(a, '.');
    auto pb = utils::split(b, '.');
    for (size_t i = 0; i < std::max(pa.size(), pb.size()); ++i) {
        uint32_t va = i < pa.size() ? utils::parse_leading_uint(pa[i]).value_or(0) : 0;
        uint32_t vb = i < pb.size() ? utils::parse_leading_uint(pb[i]).value_or(0) : 0;
        if (va != vb) return va < vb;
    }
    return false;
}

core::Device to_device(const SimDeviceRecord& record,
                       const std::map<std::string, std::string>& type_names) {
    core::IosInfo info;
    info.udid = record.udid;
    info.ios_version = runtime_version(record.runtime_identifier);
    info.runtime_version = runtime_display_name(record.runtime_identifier);
    if (auto it = type_names.find(record.device_type_identifier); it != type_names.end()) {
        info.device_type = it->second;
    } else {
        info.device_type = device_type_fallback_name(record.device_type_identifier);
    }
    info.is_available = record.is_available;

    return {record.name, record.udid, state_to_status(record.state), std::move(info)};
}

} // namespace emu_manager::modules::ios
