#include "core/command_executor.hpp"

#include "utils/string_utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <mutex>

namespace emu_manager::core {

std::string command_key(const std::string& program, const std::vector<std::string>& args) {
    if (args.empty()) return program;
    return program + " " + utils::join(args, " ");
}

bool sleep_for(std::chrono::milliseconds duration, std::stop_token stop) {
    if (stop.stop_requested()) return false;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    (void)cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

DeviceResult<std::string> CommandExecutor::run(const std::string& program,
                                               const std::vector<std::string>& args) {
    auto output = execute(program, args);
    if (!output) return std::unexpected(output.error());
    return output->stdout_text;
}

DeviceResult<std::string> CommandExecutor::run_ignoring_errors(
    const std::string& program, const std::vector<std::string>& args,
    const std::vector<std::string>& ignore_substrings) {
    auto output = execute(program, args);
    if (output) return output->stdout_text;

    const DeviceError& err = output.error();
    const std::string stderr_text = err.command ? err.command->stderr_text : err.message();
    for (const auto& pattern : ignore_substrings) {
        if (utils::contains(stderr_text, pattern)) {
            return std::string();
        }
    }
    return std::unexpected(err);
}

DeviceResult<std::string> CommandExecutor::run_with_retry(const std::string& program,
                                                          const std::vector<std::string>& args,
                                                          unsigned max_retries,
                                                          std::stop_token stop) {
    const unsigned attempts = max_retries + 1;
    auto delay = retry_policy_.initial_delay;
    DeviceError last_error;

    for (unsigned attempt = 0; attempt < attempts; ++attempt) {
        auto output = execute(program, args);
        if (output) return output->stdout_text;
        last_error = output.error();

        if (attempt + 1 == attempts) break;

        std::cerr << "[Command] Attempt " << (attempt + 1) << "/" << attempts << " of '"
                  << command_key(program, args) << "' failed, retrying in " << delay.count()
                  << "ms\n";
        if (!sleep_for(delay, stop)) {
            return std::unexpected(DeviceError::other("operation cancelled"));
        }
        delay = std::min(delay * 2, retry_policy_.max_delay);
    }

    DeviceError aggregate = last_error;
    aggregate.kind = DeviceErrorKind::CommandFailed;
    aggregate.subject = command_key(program, args);
    aggregate.reason = "Command '" + aggregate.subject + "' failed after " +
                       std::to_string(attempts) + " attempts: " + last_error.message();
    return std::unexpected(aggregate);
}

} // namespace emu_manager::core
