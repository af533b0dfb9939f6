#pragma once

#include "core/command_executor.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace emu_manager::core {

struct MockResponse {
    enum class Kind {
        Success,
        Failure
    };

    Kind kind = Kind::Success;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

struct CallRecord {
    std::string program;
    std::vector<std::string> args;
    std::chrono::system_clock::time_point timestamp;
};

// Deterministic executor for tests. Responses are keyed by the exact
// command line; a key that was never configured fails with NotConfigured.
// Lookup falls back to the same command with the program reduced to its
// basename, so "/opt/sdk/platform-tools/adb devices" matches "adb devices".
class MockCommandExecutor : public CommandExecutor {
public:
    MockCommandExecutor() = default;
    ~MockCommandExecutor() override = default;

    MockCommandExecutor(const MockCommandExecutor&) = delete;
    MockCommandExecutor& operator=(const MockCommandExecutor&) = delete;

    MockCommandExecutor& with_success(const std::string& program, const std::vector<std::string>& args,
                                      const std::string& stdout_text);
    // Fails with exit code 1 and `message` on stderr.
    MockCommandExecutor& with_error(const std::string& program, const std::vector<std::string>& args,
                                    const std::string& message);
    MockCommandExecutor& with_failure(const std::string& program, const std::vector<std::string>& args,
                                      int exit_code, const std::string& stdout_text,
                                      const std::string& stderr_text);
    MockCommandExecutor& with_spawn(const std::string& program, const std::vector<std::string>& args,
                                    uint32_t pid);
    MockCommandExecutor& with_delay(const std::string& program, const std::vector<std::string>& args,
                                    std::chrono::milliseconds delay);

    DeviceResult<CommandOutput> execute(const std::string& program,
                                        const std::vector<std::string>& args) override;

    DeviceResult<CommandOutput> execute_with_input(const std::string& program,
                                                   const std::vector<std::string>& args,
                                                   const std::string& input,
                                                   const LineCallback& on_line) override;

    DeviceResult<uint32_t> spawn(const std::string& program,
                                 const std::vector<std::string>& args) override;

    std::vector<CallRecord> call_history() const;
    size_t call_count(const std::string& program, const std::vector<std::string>& args) const;
    bool was_called(const std::string& program, const std::vector<std::string>& args) const;

    // Forgets every configured response, delay and recorded call.
    void clear();
    void clear_history();

private:
    template <typename Map>
    static auto find_response(const Map& map, const std::string& program,
                              const std::vector<std::string>& args)
        -> std::optional<typename Map::mapped_type>;

    void record_call(const std::string& program, const std::vector<std::string>& args);
    void apply_delay(const std::string& program, const std::vector<std::string>& args) const;

    mutable std::mutex mutex_;
    std::map<std::string, MockResponse> responses_;
    std::map<std::string, uint32_t> spawn_responses_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::vector<CallRecord> history_;
};

} // namespace emu_manager::core
