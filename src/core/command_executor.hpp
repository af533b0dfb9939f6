#pragma once

#include "core/device_error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace emu_manager::core {

struct CommandOutput {
    std::string program;
    std::vector<std::string> args;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

struct RetryPolicy {
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{2000};
};

using LineCallback = std::function<void(const std::string&)>;

// "adb -s emulator-5554 emu kill"
std::string command_key(const std::string& program, const std::vector<std::string>& args);

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // Runs to completion. Non-zero exit is CommandFailed, a binary that
    // cannot be launched is Io.
    virtual DeviceResult<CommandOutput> execute(const std::string& program,
                                                const std::vector<std::string>& args) = 0;

    // Same as execute(), but feeds `input` to stdin and reports each stdout
    // line to `on_line` as it arrives.
    virtual DeviceResult<CommandOutput> execute_with_input(const std::string& program,
                                                           const std::vector<std::string>& args,
                                                           const std::string& input,
                                                           const LineCallback& on_line) = 0;

    // Launches a detached process and returns its PID without waiting.
    virtual DeviceResult<uint32_t> spawn(const std::string& program,
                                         const std::vector<std::string>& args) = 0;

    // stdout of a successful execute()
    DeviceResult<std::string> run(const std::string& program, const std::vector<std::string>& args);

    // A failure whose stderr contains one of `ignore_substrings` becomes an
    // empty success.
    DeviceResult<std::string> run_ignoring_errors(const std::string& program,
                                                  const std::vector<std::string>& args,
                                                  const std::vector<std::string>& ignore_substrings);

    DeviceResult<std::string> run_with_retry(const std::string& program,
                                             const std::vector<std::string>& args,
                                             unsigned max_retries,
                                             std::stop_token stop = {});

    void set_retry_policy(RetryPolicy policy) { retry_policy_ = policy; }
    const RetryPolicy& retry_policy() const { return retry_policy_; }

private:
    RetryPolicy retry_policy_;
};

// Interruptible sleep. Returns false when `stop` was requested before the
// duration elapsed.
bool sleep_for(std::chrono::milliseconds duration, std::stop_token stop);

} // namespace emu_manager::core
