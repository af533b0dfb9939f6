#include "core/process_executor.hpp"

#include "utils/string_utils.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace emu_manager::core {

namespace {

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

std::expected<Pipe, DeviceError> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(DeviceError::io(std::string("pipe2 failed: ") + std::strerror(errno)));
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

// argv storage must outlive the fork; exec only sees raw pointers.
std::vector<char*> make_argv(const std::string& program, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// Returns the child's errno if exec failed, 0 once exec succeeded.
int read_exec_status(int fd) {
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

int wait_for_exit(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return; // child closed stdin early; its exit status tells the rest
        }
        written += static_cast<size_t>(n);
    }
}

DeviceError launch_error(const std::string& program, int child_errno) {
    return DeviceError::io("Failed to execute '" + program + "': " + std::strerror(child_errno));
}

// Tools we exec expect the default SIGPIPE disposition, which exec keeps
// when it was ignored in the parent.
void restore_child_signals() {
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGPIPE, &action, nullptr);
}

} // namespace

ProcessExecutor::ProcessExecutor() {
    // Writing stdin to a child that already exited must surface as EPIPE.
    std::signal(SIGPIPE, SIG_IGN);
}

DeviceResult<CommandOutput> ProcessExecutor::execute(const std::string& program,
                                                     const std::vector<std::string>& args) {
    return run_process(program, args, nullptr, nullptr);
}

DeviceResult<CommandOutput> ProcessExecutor::execute_with_input(const std::string& program,
                                                                const std::vector<std::string>& args,
                                                                const std::string& input,
                                                                const LineCallback& on_line) {
    return run_process(program, args, &input, on_line ? &on_line : nullptr);
}

DeviceResult<CommandOutput> ProcessExecutor::run_process(const std::string& program,
                                                         const std::vector<std::string>& args,
                                                         const std::string* input,
                                                         const LineCallback* on_line) {
    auto stdin_pipe = make_pipe();
    if (!stdin_pipe) return std::unexpected(stdin_pipe.error());
    auto stdout_pipe = make_pipe();
    if (!stdout_pipe) return std::unexpected(stdout_pipe.error());
    auto stderr_pipe = make_pipe();
    if (!stderr_pipe) return std::unexpected(stderr_pipe.error());
    auto exec_pipe = make_pipe();
    if (!exec_pipe) return std::unexpected(exec_pipe.error());

    auto argv = make_argv(program, args);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(DeviceError::io(std::string("fork failed: ") + std::strerror(errno)));
    }

    if (pid == 0) {
        ::dup2(stdin_pipe->read_end.get(), STDIN_FILENO);
        ::dup2(stdout_pipe->write_end.get(), STDOUT_FILENO);
        ::dup2(stderr_pipe->write_end.get(), STDERR_FILENO);
        restore_child_signals();
        ::execvp(program.c_str(), argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe->write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    stdin_pipe->read_end.reset();
    stdout_pipe->write_end.reset();
    stderr_pipe->write_end.reset();
    exec_pipe->write_end.reset();

    if (int child_errno = read_exec_status(exec_pipe->read_end.get()); child_errno != 0) {
        wait_for_exit(pid);
        return std::unexpected(launch_error(program, child_errno));
    }

    if (input) {
        write_all(stdin_pipe->write_end.get(), *input);
    }
    stdin_pipe->write_end.reset();

    CommandOutput output{program, args, {}, {}, 0};
    std::string partial_line;

    std::array<pollfd, 2> fds{{
        {stdout_pipe->read_end.get(), POLLIN, 0},
        {stderr_pipe->read_end.get(), POLLIN, 0},
    }};
    int open_streams = 2;
    std::array<char, 4096> buffer{};

    while (open_streams > 0) {
        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                fds[i].fd = -1;
                --open_streams;
                continue;
            }

            std::string chunk(buffer.data(), static_cast<size_t>(n));
            if (i == 1) {
                output.stderr_text += chunk;
                continue;
            }
            output.stdout_text += chunk;
            if (on_line) {
                partial_line += chunk;
                size_t pos;
                while ((pos = partial_line.find('\n')) != std::string::npos) {
                    (*on_line)(partial_line.substr(0, pos));
                    partial_line.erase(0, pos + 1);
                }
            }
        }
    }
    if (on_line && !partial_line.empty()) {
        (*on_line)(partial_line);
    }

    output.exit_code = wait_for_exit(pid);
    if (output.exit_code != 0) {
        return std::unexpected(DeviceError::command_failed(
            {program, args, output.exit_code, output.stdout_text, output.stderr_text}));
    }
    return output;
}

DeviceResult<uint32_t> ProcessExecutor::spawn(const std::string& program,
                                              const std::vector<std::string>& args) {
    auto pid_pipe = make_pipe();
    if (!pid_pipe) return std::unexpected(pid_pipe.error());
    auto exec_pipe = make_pipe();
    if (!exec_pipe) return std::unexpected(exec_pipe.error());

    auto argv = make_argv(program, args);

    // Double fork: the intermediate child exits at once, so the emulator is
    // adopted by init and never becomes our zombie.
    pid_t intermediate = ::fork();
    if (intermediate < 0) {
        return std::unexpected(DeviceError::io(std::string("fork failed: ") + std::strerror(errno)));
    }

    if (intermediate == 0) {
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild == 0) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
            }
            restore_child_signals();
            ::execvp(program.c_str(), argv.data());
            int err = errno;
            ssize_t ignored = ::write(exec_pipe->write_end.get(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        int32_t reported = static_cast<int32_t>(grandchild);
        ssize_t ignored = ::write(pid_pipe->write_end.get(), &reported, sizeof(reported));
        (void)ignored;
        ::_exit(grandchild < 0 ? 1 : 0);
    }

    pid_pipe->write_end.reset();
    exec_pipe->write_end.reset();

    int32_t child_pid = -1;
    ssize_t n;
    do {
        n = ::read(pid_pipe->read_end.get(), &child_pid, sizeof(child_pid));
    } while (n < 0 && errno == EINTR);
    wait_for_exit(intermediate);

    if (n != static_cast<ssize_t>(sizeof(child_pid)) || child_pid <= 0) {
        return std::unexpected(DeviceError::io("Failed to fork process for '" + program + "'"));
    }
    if (int child_errno = read_exec_status(exec_pipe->read_end.get()); child_errno != 0) {
        return std::unexpected(launch_error(program, child_errno));
    }
    return static_cast<uint32_t>(child_pid);
}

bool is_executable_on_path(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;
    for (const auto& dir : utils::split(path_env, ':')) {
        if (dir.empty()) continue;
        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

} // namespace emu_manager::core
