#include "core/mock_command_executor.hpp"

#include "utils/string_utils.hpp"

#include <algorithm>
#include <thread>

namespace emu_manager::core {

template <typename Map>
auto MockCommandExecutor::find_response(const Map& map, const std::string& program,
                                        const std::vector<std::string>& args)
    -> std::optional<typename Map::mapped_type> {
    if (auto it = map.find(command_key(program, args)); it != map.end()) {
        return it->second;
    }
    if (auto it = map.find(command_key(utils::basename(program), args)); it != map.end()) {
        return it->second;
    }
    return std::nullopt;
}

MockCommandExecutor& MockCommandExecutor::with_success(const std::string& program,
                                                       const std::vector<std::string>& args,
                                                       const std::string& stdout_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[command_key(program, args)] = {MockResponse::Kind::Success, stdout_text, {}, 0};
    return *this;
}

MockCommandExecutor& MockCommandExecutor::with_error(const std::string& program,
                                                     const std::vector<std::string>& args,
                                                     const std::string& message) {
    return with_failure(program, args, 1, {}, message);
}

MockCommandExecutor& MockCommandExecutor::with_failure(const std::string& program,
                                                       const std::vector<std::string>& args,
                                                       int exit_code, const std::string& stdout_text,
                                                       const std::string& stderr_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[command_key(program, args)] = {MockResponse::Kind::Failure, stdout_text, stderr_text,
                                              exit_code};
    return *this;
}

MockCommandExecutor& MockCommandExecutor::with_spawn(const std::string& program,
                                                     const std::vector<std::string>& args,
                                                     uint32_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    spawn_responses_[command_key(program, args)] = pid;
    return *this;
}

MockCommandExecutor& MockCommandExecutor::with_delay(const std::string& program,
                                                     const std::vector<std::string>& args,
                                                     std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delays_[command_key(program, args)] = delay;
    return *this;
}

void MockCommandExecutor::record_call(const std::string& program, const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back({program, args, std::chrono::system_clock::now()});
}

void MockCommandExecutor::apply_delay(const std::string& program,
                                      const std::vector<std::string>& args) const {
    std::optional<std::chrono::milliseconds> delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = find_response(delays_, program, args);
    }
    if (delay && delay->count() > 0) {
        std::this_thread::sleep_for(*delay);
    }
}

DeviceResult<CommandOutput> MockCommandExecutor::execute(const std::string& program,
                                                         const std::vector<std::string>& args) {
    record_call(program, args);
    apply_delay(program, args);

    std::optional<MockResponse> response;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        response = find_response(responses_, program, args);
    }
    if (!response) {
        return std::unexpected(DeviceError::not_configured(command_key(program, args)));
    }
    if (response->kind == MockResponse::Kind::Failure) {
        return std::unexpected(DeviceError::command_failed(
            {program, args, response->exit_code, response->stdout_text, response->stderr_text}));
    }
    return CommandOutput{program, args, response->stdout_text, response->stderr_text, 0};
}

DeviceResult<CommandOutput> MockCommandExecutor::execute_with_input(const std::string& program,
                                                                    const std::vector<std::string>& args,
                                                                    const std::string& /*input*/,
                                                                    const LineCallback& on_line) {
    auto output = execute(program, args);
    const std::string& text = output ? output->stdout_text
                                     : (output.error().command ? output.error().command->stdout_text
                                                               : std::string());
    if (on_line) {
        for (const auto& line : utils::split_lines(text)) {
            on_line(line);
        }
    }
    return output;
}

DeviceResult<uint32_t> MockCommandExecutor::spawn(const std::string& program,
                                                  const std::vector<std::string>& args) {
    record_call(program, args);
    apply_delay(program, args);

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto pid = find_response(spawn_responses_, program, args)) {
        return *pid;
    }
    // A configured execute() failure also applies to spawn of the same key.
    if (auto response = find_response(responses_, program, args);
        response && response->kind == MockResponse::Kind::Failure) {
        return std::unexpected(DeviceError::command_failed(
            {program, args, response->exit_code, response->stdout_text, response->stderr_text}));
    }
    return std::unexpected(DeviceError::not_configured(command_key(program, args)));
}

std::vector<CallRecord> MockCommandExecutor::call_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

size_t MockCommandExecutor::call_count(const std::string& program,
                                       const std::vector<std::string>& args) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(history_.begin(), history_.end(), [&](const CallRecord& call) {
        return call.args == args &&
               (call.program == program || utils::basename(call.program) == program);
    }));
}

bool MockCommandExecutor::was_called(const std::string& program,
                                     const std::vector<std::string>& args) const {
    return call_count(program, args) > 0;
}

void MockCommandExecutor::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.clear();
    spawn_responses_.clear();
    delays_.clear();
    history_.clear();
}

void MockCommandExecutor::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

} // namespace emu_manager::core
