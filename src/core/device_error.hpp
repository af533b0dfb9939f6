#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace emu_manager::core {

enum class DeviceErrorKind {
    NotFound,
    AlreadyRunning,
    NotRunning,
    StartFailed,
    StopFailed,
    CreateFailed,
    DeleteFailed,
    CommandFailed,
    PlatformNotSupported,
    SdkNotFound,
    InvalidConfig,
    Io,
    Parse,
    NotConfigured, // Mock executor only: no canned response for the invocation
    Other
};

std::string error_to_string(DeviceErrorKind kind);

// Short heading for dialogs and CLI output ("Start Error", "SDK Error", ...)
std::string error_title(DeviceErrorKind kind);

// Everything a failed subprocess left behind.
struct CommandFailure {
    std::string program;
    std::vector<std::string> args;
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

struct DeviceError {
    DeviceErrorKind kind = DeviceErrorKind::Other;
    std::string subject; // device name, command line, platform or sdk
    std::string reason;
    std::optional<CommandFailure> command;

    std::string message() const;

    static DeviceError not_found(std::string name);
    static DeviceError already_running(std::string name);
    static DeviceError not_running(std::string name);
    static DeviceError start_failed(std::string name, std::string reason);
    static DeviceError stop_failed(std::string name, std::string reason);
    static DeviceError create_failed(std::string name, std::string reason);
    static DeviceError delete_failed(std::string name, std::string reason);
    static DeviceError command_failed(CommandFailure failure);
    static DeviceError platform_not_supported(std::string platform);
    static DeviceError sdk_not_found(std::string sdk, std::string reason = {});
    static DeviceError invalid_config(std::string reason);
    static DeviceError io(std::string reason);
    static DeviceError parse(std::string reason);
    static DeviceError not_configured(std::string command_key);
    static DeviceError other(std::string reason);
};

template <typename T>
using DeviceResult = std::expected<T, DeviceError>;

// Maps raw tool output onto an actionable sentence. Unknown messages pass
// through, cut to 150 characters.
std::string format_user_error(const std::string& message);

inline std::string user_message(const DeviceError& err) {
    return format_user_error(err.message());
}

// The text most likely to explain a command failure: stderr if present,
// then stdout, then the rendered message.
std::string failure_text(const DeviceError& err);

} // namespace emu_manager::core
