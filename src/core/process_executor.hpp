#pragma once

#include "core/command_executor.hpp"

namespace emu_manager::core {

// fork/exec based executor. Every pipe is close-on-exec so a long-running
// spawned emulator never holds another command's output open.
class ProcessExecutor : public CommandExecutor {
public:
    ProcessExecutor();
    ~ProcessExecutor() override = default;

    ProcessExecutor(const ProcessExecutor&) = delete;
    ProcessExecutor& operator=(const ProcessExecutor&) = delete;

    DeviceResult<CommandOutput> execute(const std::string& program,
                                        const std::vector<std::string>& args) override;

    DeviceResult<CommandOutput> execute_with_input(const std::string& program,
                                                   const std::vector<std::string>& args,
                                                   const std::string& input,
                                                   const LineCallback& on_line) override;

    DeviceResult<uint32_t> spawn(const std::string& program,
                                 const std::vector<std::string>& args) override;

private:
    DeviceResult<CommandOutput> run_process(const std::string& program,
                                            const std::vector<std::string>& args,
                                            const std::string* input,
                                            const LineCallback* on_line);
};

// True when `program` resolves to an executable on PATH (or is one).
bool is_executable_on_path(const std::string& program);

} // namespace emu_manager::core
