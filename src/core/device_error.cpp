#include "core/device_error.hpp"

#include "utils/string_utils.hpp"

#include <utility>

namespace emu_manager::core {

namespace {
constexpr size_t kMaxUserMessageLength = 150;
}

std::string error_to_string(DeviceErrorKind kind) {
    switch (kind) {
        case DeviceErrorKind::NotFound: return "NotFound";
        case DeviceErrorKind::AlreadyRunning: return "AlreadyRunning";
        case DeviceErrorKind::NotRunning: return "NotRunning";
        case DeviceErrorKind::StartFailed: return "StartFailed";
        case DeviceErrorKind::StopFailed: return "StopFailed";
        case DeviceErrorKind::CreateFailed: return "CreateFailed";
        case DeviceErrorKind::DeleteFailed: return "DeleteFailed";
        case DeviceErrorKind::CommandFailed: return "CommandFailed";
        case DeviceErrorKind::PlatformNotSupported: return "PlatformNotSupported";
        case DeviceErrorKind::SdkNotFound: return "SdkNotFound";
        case DeviceErrorKind::InvalidConfig: return "InvalidConfig";
        case DeviceErrorKind::Io: return "Io";
        case DeviceErrorKind::Parse: return "Parse";
        case DeviceErrorKind::NotConfigured: return "NotConfigured";
        case DeviceErrorKind::Other: return "Other";
        default: return "Unknown Error";
    }
}

std::string error_title(DeviceErrorKind kind) {
    switch (kind) {
        case DeviceErrorKind::NotFound: return "Device Not Found";
        case DeviceErrorKind::AlreadyRunning: return "Device Running";
        case DeviceErrorKind::NotRunning: return "Device Stopped";
        case DeviceErrorKind::StartFailed: return "Start Error";
        case DeviceErrorKind::StopFailed: return "Stop Error";
        case DeviceErrorKind::CreateFailed: return "Creation Error";
        case DeviceErrorKind::DeleteFailed: return "Deletion Error";
        case DeviceErrorKind::CommandFailed: return "Command Error";
        case DeviceErrorKind::PlatformNotSupported: return "Platform Error";
        case DeviceErrorKind::SdkNotFound: return "SDK Error";
        case DeviceErrorKind::InvalidConfig: return "Config Error";
        case DeviceErrorKind::Io: return "IO Error";
        case DeviceErrorKind::Parse: return "Parse Error";
        case DeviceErrorKind::NotConfigured: return "Mock Error";
        default: return "Error";
    }
}

std::string DeviceError::message() const {
    switch (kind) {
        case DeviceErrorKind::NotFound:
            return "Device not found: " + subject;
        case DeviceErrorKind::AlreadyRunning:
            return "Device " + subject + " is already running";
        case DeviceErrorKind::NotRunning:
            return "Device " + subject + " is not running";
        case DeviceErrorKind::StartFailed:
            return "Failed to start device " + subject + ": " + reason;
        case DeviceErrorKind::StopFailed:
            return "Failed to stop device " + subject + ": " + reason;
        case DeviceErrorKind::CreateFailed:
            return "Failed to create device " + subject + ": " + reason;
        case DeviceErrorKind::DeleteFailed:
            return "Failed to delete device " + subject + ": " + reason;
        case DeviceErrorKind::CommandFailed:
            if (!reason.empty()) return reason;
            return "Command execution failed: " + subject;
        case DeviceErrorKind::PlatformNotSupported:
            return "Platform not supported: " + subject;
        case DeviceErrorKind::SdkNotFound:
            if (!reason.empty()) return reason;
            return "SDK not found: " + subject;
        case DeviceErrorKind::InvalidConfig:
            return "Invalid configuration: " + reason;
        case DeviceErrorKind::Io:
            return "IO error: " + reason;
        case DeviceErrorKind::Parse:
            return "Parse error: " + reason;
        case DeviceErrorKind::NotConfigured:
            return "No mock response configured for: " + subject;
        case DeviceErrorKind::Other:
        default:
            return reason;
    }
}

DeviceError DeviceError::not_found(std::string name) {
    return {DeviceErrorKind::NotFound, std::move(name), {}, std::nullopt};
}

DeviceError DeviceError::already_running(std::string name) {
    return {DeviceErrorKind::AlreadyRunning, std::move(name), {}, std::nullopt};
}

DeviceError DeviceError::not_running(std::string name) {
    return {DeviceErrorKind::NotRunning, std::move(name), {}, std::nullopt};
}

DeviceError DeviceError::start_failed(std::string name, std::string reason) {
    return {DeviceErrorKind::StartFailed, std::move(name), std::move(reason), std::nullopt};
}

DeviceError DeviceError::stop_failed(std::string name, std::string reason) {
    return {DeviceErrorKind::StopFailed, std::move(name), std::move(reason), std::nullopt};
}

DeviceError DeviceError::create_failed(std::string name, std::string reason) {
    return {DeviceErrorKind::CreateFailed, std::move(name), std::move(reason), std::nullopt};
}

DeviceError DeviceError::delete_failed(std::string name, std::string reason) {
    return {DeviceErrorKind::DeleteFailed, std::move(name), std::move(reason), std::nullopt};
}

DeviceError DeviceError::command_failed(CommandFailure failure) {
    std::string command_line = failure.program;
    if (!failure.args.empty()) {
        command_line += " " + utils::join(failure.args, " ");
    }
    std::string reason = "Command failed with exit code " + std::to_string(failure.exit_code) +
                         ": stderr: " + utils::trim(failure.stderr_text) +
                         " stdout: " + utils::trim(failure.stdout_text);
    return {DeviceErrorKind::CommandFailed, std::move(command_line), std::move(reason),
            std::move(failure)};
}

DeviceError DeviceError::platform_not_supported(std::string platform) {
    return {DeviceErrorKind::PlatformNotSupported, std::move(platform), {}, std::nullopt};
}

DeviceError DeviceError::sdk_not_found(std::string sdk, std::string reason) {
    return {DeviceErrorKind::SdkNotFound, std::move(sdk), std::move(reason), std::nullopt};
}

DeviceError DeviceError::invalid_config(std::string reason) {
    return {DeviceErrorKind::InvalidConfig, {}, std::move(reason), std::nullopt};
}

DeviceError DeviceError::io(std::string reason) {
    return {DeviceErrorKind::Io, {}, std::move(reason), std::nullopt};
}

DeviceError DeviceError::parse(std::string reason) {
    return {DeviceErrorKind::Parse, {}, std::move(reason), std::nullopt};
}

DeviceError DeviceError::not_configured(std::string command_key) {
    return {DeviceErrorKind::NotConfigured, std::move(command_key), {}, std::nullopt};
}

DeviceError DeviceError::other(std::string reason) {
    return {DeviceErrorKind::Other, {}, std::move(reason), std::nullopt};
}

std::string format_user_error(const std::string& message) {
    const std::string lower = utils::to_lower(message);
    auto has = [&lower](const char* needle) { return lower.find(needle) != std::string::npos; };

    if (has("licenses") || has("accept")) {
        return "Android SDK licenses not accepted. Run 'sdkmanager --licenses' in terminal to accept licenses.";
    }
    if (has("system image") || has("not installed")) {
        return "Required system image not installed. Install system images using SDK Manager.";
    }
    if (has("android_home") || has("android_sdk_root")) {
        return "Android SDK not found. Set ANDROID_HOME environment variable.";
    }
    if (has("already exists")) {
        return "Device with same name already exists. Choose different name or delete existing device.";
    }
    if (has("device") && has("not found")) {
        return "Specified device type not found. Select from available device types.";
    }
    if (has("emulator") && has("not found")) {
        return "Android emulator not found. Check if Android SDK is properly installed.";
    }
    if (has("adb") && (has("not found") || has("command not found"))) {
        return "ADB command not found. Check if Android SDK path is properly set.";
    }
    if (has("xcrun") && has("not found")) {
        return "Xcode command line tools not found. Run 'xcode-select --install' to install.";
    }
    if (has("permission") || has("denied")) {
        return "Permission error occurred. Check file/directory access permissions.";
    }
    if (has("timeout") || has("timed out")) {
        return "Operation timed out. Please try again later.";
    }

    return utils::truncate_with_ellipsis(message, kMaxUserMessageLength);
}

std::string failure_text(const DeviceError& err) {
    if (err.command) {
        std::string stderr_text = utils::trim(err.command->stderr_text);
        if (!stderr_text.empty()) return stderr_text;
        std::string stdout_text = utils::trim(err.command->stdout_text);
        if (!stdout_text.empty()) return stdout_text;
    }
    return err.message();
}

} // namespace emu_manager::core
