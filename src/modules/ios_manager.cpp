#include "modules/ios_manager.hpp"

#include "core/process_executor.hpp"
#include "modules/priority_engine.hpp"
#include "utils/string_utils.hpp"

#include <algorithm>
#include <iostream>

namespace emu_manager::modules {

using core::DeviceError;
using core::DeviceResult;

namespace {

const char* kXcrun = "xcrun";

bool detect_simctl() {
#ifdef __APPLE__
    return core::is_executable_on_path(kXcrun);
#else
    return false;
#endif
}

} // namespace

IosManager::IosManager(std::shared_ptr<core::CommandExecutor> executor, IosSettings settings)
    : executor_(std::move(executor)), settings_(settings) {
    available_ = settings_.available.value_or(detect_simctl());
    if (!available_ && !settings_.quiet) {
        std::cout << "[iOS] Simulator tools unavailable on this host\n";
    }
}

void IosManager::log_info(const std::string& message) const {
    if (!settings_.quiet) {
        std::cout << "[iOS] " << message << "\n";
    }
}

DeviceResult<void> IosManager::require_available() const {
    if (!available_) return std::unexpected(DeviceError::platform_not_supported("iOS"));
    return {};
}

DeviceResult<std::vector<ios::SimDeviceRecord>> IosManager::device_records() {
    auto output = executor_->run(kXcrun, {"simctl", "list", "devices", "--json"});
    if (!output) return std::unexpected(output.error());
    return ios::parse_device_records(*output);
}

DeviceResult<ios::SimDeviceRecord> IosManager::find_record(const std::string& identifier) {
    auto records = device_records();
    if (!records) return std::unexpected(records.error());

    auto it = std::find_if(records->begin(), records->end(),
                           [&](const ios::SimDeviceRecord& r) { return r.udid == identifier; });
    if (it == records->end()) {
        it = std::find_if(records->begin(), records->end(),
                          [&](const ios::SimDeviceRecord& r) { return r.name == identifier; });
    }
    if (it == records->end()) return std::unexpected(DeviceError::not_found(identifier));
    return *it;
}

std::map<std::string, std::string> IosManager::device_type_names() {
    {
        std::lock_guard<std::mutex> lock(types_mutex_);
        if (!type_names_.empty()) return type_names_;
    }

    auto output = executor_->run(kXcrun, {"simctl", "list", "devicetypes", "--json"});
    if (!output) {
        std::cerr << "[iOS] Failed to list device types: " << output.error().message() << "\n";
        return {};
    }
    auto types = ios::parse_device_types(*output);
    if (!types) {
        std::cerr << "[iOS] " << types.error().message() << "\n";
        return {};
    }

    std::map<std::string, std::string> names;
    for (const auto& type : *types) {
        names[type.identifier] = type.name;
    }
    std::lock_guard<std::mutex> lock(types_mutex_);
    type_names_ = names;
    return names;
}

DeviceResult<std::vector<core::Device>> IosManager::list_devices() {
    if (!available_) return std::vector<core::Device>{};

    auto records = device_records();
    if (!records) return std::unexpected(records.error());

    const auto names = device_type_names();
    std::vector<core::Device> devices;
    devices.reserve(records->size());
    for (const auto& record : *records) {
        devices.push_back(ios::to_device(record, names));
    }
    sort_ios_devices(devices);
    return devices;
}

DeviceResult<std::vector<std::pair<std::string, std::string>>> IosManager::list_device_types() {
    if (!available_) return std::vector<std::pair<std::string, std::string>>{};

    auto output = executor_->run(kXcrun, {"simctl", "list", "devicetypes", "--json"});
    if (!output) return std::unexpected(output.error());
    auto types = ios::parse_device_types(*output);
    if (!types) return std::unexpected(types.error());

    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& type : *types) {
        result.emplace_back(type.identifier, type.name);
    }
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return calculate_ios_device_priority(a.second) < calculate_ios_device_priority(b.second);
    });
    return result;
}

DeviceResult<std::vector<ios::SimRuntime>> IosManager::list_runtimes() {
    if (!available_) return std::vector<ios::SimRuntime>{};

    auto output = executor_->run_with_retry(kXcrun, {"simctl", "list", "runtimes", "--json"},
                                            settings_.max_retries);
    if (!output) return std::unexpected(output.error());
    auto runtimes = ios::parse_runtimes(*output);
    if (!runtimes) return std::unexpected(runtimes.error());

    std::vector<ios::SimRuntime> available;
    for (auto& runtime : *runtimes) {
        if (runtime.is_available) available.push_back(std::move(runtime));
    }
    std::stable_sort(available.begin(), available.end(), [](const auto& a, const auto& b) {
        return ios::version_less(b.version, a.version);
    });
    return available;
}

DeviceResult<std::string> IosManager::resolve_device_type(const std::string& requested) {
    if (requested.rfind("com.apple.", 0) == 0) return requested;

    auto output = executor_->run(kXcrun, {"simctl", "list", "devicetypes", "--json"});
    if (output) {
        if (auto types = ios::parse_device_types(*output)) {
            for (const auto& type : *types) {
                if (utils::to_lower(type.name) == utils::to_lower(requested)) return type.identifier;
            }
        }
    }
    // simctl itself also accepts a device type name.
    return requested;
}

DeviceResult<std::string> IosManager::resolve_runtime(const std::string& requested) {
    if (requested.rfind("com.apple.", 0) == 0) return requested;

    auto runtimes = list_runtimes();
    if (!runtimes) return std::unexpected(runtimes.error());
    if (runtimes->empty()) {
        return std::unexpected(DeviceError::create_failed(requested, "No iOS runtimes are installed"));
    }
    if (requested.empty()) return runtimes->front().identifier;

    for (const auto& runtime : *runtimes) {
        if (runtime.version == requested || runtime.name == requested ||
            runtime.name == "iOS " + requested) {
            return runtime.identifier;
        }
    }
    return std::unexpected(DeviceError::create_failed(requested, "Runtime '" + requested + "' not found"));
}

DeviceResult<std::string> IosManager::create_device(const core::DeviceConfig& config) {
    if (auto ok = require_available(); !ok) return std::unexpected(ok.error());

    const std::string name = utils::trim(config.name);
    if (name.empty()) {
        return std::unexpected(DeviceError::invalid_config("Device name must not be empty"));
    }
    if (config.device_type.empty()) {
        return std::unexpected(DeviceError::invalid_config("Device type must not be empty"));
    }

    auto device_type = resolve_device_type(config.device_type);
    if (!device_type) return std::unexpected(device_type.error());
    auto runtime = resolve_runtime(config.version);
    if (!runtime) {
        DeviceError err = runtime.error();
        if (err.kind == core::DeviceErrorKind::CreateFailed) err.subject = name;
        return std::unexpected(err);
    }

    log_info("Creating '" + name + "' (" + *device_type + ", " + *runtime + ")");
    auto output = executor_->run(kXcrun, {"simctl", "create", name, *device_type, *runtime});
    if (!output) {
        return std::unexpected(DeviceError::create_failed(name, utils::trim(core::failure_text(output.error()))));
    }

    std::string udid = utils::trim(*output);
    if (udid.empty()) {
        return std::unexpected(DeviceError::create_failed(name, "simctl create printed no UDID"));
    }
    return udid;
}

DeviceResult<void> IosManager::start_device(const std::string& identifier) {
    if (auto ok = require_available(); !ok) return std::unexpected(ok.error());

    auto record = find_record(identifier);
    if (!record) return std::unexpected(record.error());
    if (record->state == "Booted") {
        log_info("'" + record->name + "' is already booted");
        return {};
    }

    auto booted = executor_->run_ignoring_errors(kXcrun, {"simctl", "boot", record->udid},
                                                 {"Unable to boot device in current state"});
    if (!booted) {
        return std::unexpected(DeviceError::start_failed(record->name, core::failure_text(booted.error())));
    }

    if (auto app = executor_->spawn("open", {"-a", "Simulator"}); !app) {
        std::cerr << "[iOS] Could not open Simulator.app: " << app.error().message() << "\n";
    }
    log_info("Booted '" + record->name + "'");
    return {};
}

void IosManager::quit_simulator_if_idle() {
    auto records = device_records();
    if (!records) return;
    bool any_booted = std::any_of(records->begin(), records->end(),
                                  [](const ios::SimDeviceRecord& r) { return r.state == "Booted"; });
    if (any_booted) return;

    auto quit = executor_->run("osascript", {"-e", "tell application \"Simulator\" to quit"});
    if (!quit) {
        auto killed = executor_->run_ignoring_errors("killall", {"Simulator"}, {"No matching processes"});
        if (!killed) {
            std::cerr << "[iOS] Could not quit Simulator.app: " << killed.error().message() << "\n";
        }
    }
}

DeviceResult<void> IosManager::stop_device(const std::string& identifier) {
    if (auto ok = require_available(); !ok) return std::unexpected(ok.error());

    auto record = find_record(identifier);
    if (!record) return std::unexpected(record.error());

    auto result = executor_->run_ignoring_errors(kXcrun, {"simctl", "shutdown", record->udid},
                                                 {"Unable to shutdown device in current state"});
    if (!result) {
        return std::unexpected(DeviceError::stop_failed(record->name, core::failure_text(result.error())));
    }
    log_info("Shut down '" + record->name + "'");
    quit_simulator_if_idle();
    return {};
}

DeviceResult<void> IosManager::delete_device(const std::string& identifier) {
    if (auto ok = require_available(); !ok) return std::unexpected(ok.error());

    auto record = find_record(identifier);
    if (!record) return std::unexpected(record.error());

    if (record->state == "Booted") {
        auto shutdown = executor_->run_ignoring_errors(kXcrun, {"simctl", "shutdown", record->udid},
                                                       {"Unable to shutdown device in current state"});
        if (!shutdown) {
            std::cerr << "[iOS] Shutdown before delete failed: " << shutdown.error().message() << "\n";
        }
    }

    auto result = executor_->run(kXcrun, {"simctl", "delete", record->udid});
    if (!result) {
        return std::unexpected(DeviceError::delete_failed(record->name, core::failure_text(result.error())));
    }
    log_info("Deleted '" + record->name + "'");
    return {};
}

DeviceResult<void> IosManager::wipe_device(const std::string& identifier) {
    if (auto ok = require_available(); !ok) return std::unexpected(ok.error());

    auto record = find_record(identifier);
    if (!record) return std::unexpected(record.error());

    // erase refuses a booted simulator.
    auto shutdown = executor_->run_ignoring_errors(kXcrun, {"simctl", "shutdown", record->udid},
                                                   {"Unable to shutdown device in current state"});
    if (!shutdown) {
        std::cerr << "[iOS] Shutdown before erase failed: " << shutdown.error().message() << "\n";
    }

    auto result = executor_->run(kXcrun, {"simctl", "erase", record->udid});
    if (!result) {
        return std::unexpected(DeviceError::other("Failed to wipe device " + record->name + ": " +
                                                  utils::trim(core::failure_text(result.error()))));
    }
    log_info("Erased '" + record->name + "'");
    return {};
}

DeviceResult<core::DeviceDetails> IosManager::get_device_details(const std::string& identifier) {
    if (auto ok = require_available(); !ok) return std::unexpected(ok.error());

    auto record = find_record(identifier);
    if (!record) return std::unexpected(record.error());

    const core::Device device = ios::to_device(*record, device_type_names());
    const core::IosInfo& info = *device.ios();

    core::DeviceDetails details;
    details.name = device.name;
    details.identifier = record->udid;
    details.status = core::status_to_string(device.status);
    details.platform = core::Platform::Ios;
    details.device_type = info.device_type;
    details.api_level_or_version = info.runtime_version;
    if (!record->data_path.empty()) details.device_path = record->data_path;
    return details;
}

} // namespace emu_manager::modules
