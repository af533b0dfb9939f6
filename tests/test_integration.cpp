/**
 * Integration Test for emu_manager
 *
 * Runs the real emu_manager binary against a generated fake Android SDK whose
 * avdmanager, adb and emulator are shell scripts keeping their state on disk.
 * Each scenario forks the app with one command and checks its exit code and
 * output.
 *
 * Requires: /bin/sh.
 * Usage: ./emu_manager_integration [path/to/emu_manager] [--scenario N]
 */

#include <iostream>
#include <fstream>
#include <string>
#include <cstring>
#include <vector>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <filesystem>
#include <optional>

#include <unistd.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

// ============================================================================
// Fake Android SDK
// ============================================================================

class FakeSdk {
public:
    FakeSdk() {
        root_ = fs::temp_directory_path() / ("emu_manager_integ_" + std::to_string(getpid()));
        fs::remove_all(root_);
        fs::create_directories(state() / "avds");
        fs::create_directories(avd_home());

        write_script("cmdline-tools/latest/bin/avdmanager", avdmanager_script());
        write_script("platform-tools/adb", adb_script());
        write_script("emulator/emulator", emulator_script());

        add_avd("Pixel_7_API_34", "pixel_7");
    }

    ~FakeSdk() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path sdk() const { return root_ / "sdk"; }
    fs::path avd_home() const { return root_ / "avd"; }
    fs::path state() const { return root_ / "state"; }
    fs::path config() const { return root_ / "config.json"; }
    fs::path cache() const { return root_ / "cache" / "devices.json"; }

    bool is_running(const std::string& name) const {
        std::ifstream f(state() / "running");
        std::string running;
        return f.is_open() && std::getline(f, running) && running == name;
    }

    bool wait_until_running(const std::string& name, int timeout_ms = 5000) const {
        for (int waited = 0; waited < timeout_ms; waited += 100) {
            if (is_running(name)) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return false;
    }

    void write_config(uint32_t ram_mb = 2048) const {
        std::ofstream f(config());
        f << R"({
    "android": {
        "default_ram_mb": )" << ram_mb << R"(,
        "default_storage_mb": 4096,
        "default_api_level": 34,
        "default_tag": "google_apis_playstore",
        "emulator_flags": ["-no-audio", "-no-window"]
    },
    "ios": { "default_device_type": "", "default_runtime": "" },
    "refresh": { "interval_secs": 1, "fast_interval_secs": 1, "start_timeout_secs": 10, "cache_ttl_secs": 300 },
    "commands": { "max_retries": 0, "initial_retry_delay_ms": 10, "max_retry_delay_ms": 10 },
    "cache": { "enabled": true, "path": ")" << cache().string() << R"(" },
    "quiet": false
})";
    }

private:
    void add_avd(const std::string& name, const std::string& device) const {
        std::ofstream(state() / "avds" / name) << device << "\n";
        fs::create_directories(avd_home() / (name + ".avd"));
        std::ofstream(avd_home() / (name + ".avd") / "config.ini")
            << "hw.device.name=" << device << "\nhw.ramSize=1536\ndisk.dataPartition.size=6144M\n";
    }

    void write_script(const std::string& relative, const std::string& body) const {
        fs::path path = sdk() / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << "#!/bin/sh\nSTATE=\"" << state().string() << "\"\nAVD_HOME=\""
                            << avd_home().string() << "\"\n" << body;
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                        fs::perm_options::replace);
    }

    static std::string avdmanager_script() {
        return R"SH(
case "$1 $2" in
  "list avd")
    if [ -f "$STATE/fail_listing" ]; then
      echo "Error: cannot read AVD folder" >&2
      exit 1
    fi
    echo "Available Android Virtual Devices:"
    first=1
    for f in "$STATE"/avds/*; do
      [ -e "$f" ] || continue
      n=$(basename "$f")
      [ $first -eq 1 ] || echo "---------"
      first=0
      echo "    Name: $n"
      echo "  Device: $(cat "$f") (Google)"
      echo "    Path: $AVD_HOME/$n.avd"
      echo "  Target: Google Play (Google Inc.)"
      echo "          Based on: Android 14.0 (UpsideDownCake) Tag/ABI: google_apis_playstore/x86_64"
    done
    ;;
  "list device")
    echo "Available devices definitions:"
    echo 'id: 0 or "pixel_7"'
    echo "    Name: Pixel 7"
    echo "    OEM : Google"
    ;;
  "create avd")
    shift 2
    name=""
    dev="pixel_7"
    while [ $# -gt 0 ]; do
      case "$1" in
        -n) name="$2"; shift ;;
        --device) dev="$2"; shift ;;
      esac
      shift
    done
    read answer
    mkdir -p "$AVD_HOME/$name.avd"
    printf 'hw.device.name=%s\nimage.sysdir.1=system-images/android-34/google_apis_playstore/x86_64/\n' "$dev" > "$AVD_HOME/$name.avd/config.ini"
    echo "$dev" > "$STATE/avds/$name"
    ;;
  "delete avd")
    rm -f "$STATE/avds/$4"
    rm -rf "$AVD_HOME/$4.avd"
    echo "AVD '$4' deleted."
    ;;
  *)
    echo "Error: unknown command $*" >&2
    exit 1
    ;;
esac
)SH";
    }

    static std::string adb_script() {
        return R"SH(
if [ "$1" = "devices" ]; then
  echo "List of devices attached"
  if [ -f "$STATE/running" ]; then
    printf 'emulator-5554\tdevice\n'
  fi
  exit 0
fi
if [ "$1" = "-s" ]; then
  case "$3" in
    shell)
      cat "$STATE/running"
      ;;
    emu)
      if [ "$4" = "kill" ]; then
        rm -f "$STATE/running"
        echo "OK: killing emulator, bye bye"
      else
        cat "$STATE/running"
        echo "OK"
      fi
      ;;
  esac
  exit 0
fi
echo "adb: unknown command $*" >&2
exit 1
)SH";
    }

    static std::string emulator_script() {
        return R"SH(
[ "$1" = "-avd" ] || exit 1
echo "$2" > "$STATE/running"
)SH";
    }

    fs::path root_;
};

// ============================================================================
// Command Runner
// ============================================================================

struct CommandResult {
    int exit_code = -1;
    std::string output;

    bool contains(const std::string& needle) const { return output.find(needle) != std::string::npos; }
};

/**
 * Fork the emu_manager binary with `args`, capturing stdout and stderr.
 * @param interrupt_after  Send SIGINT after this long (for long-running commands)
 */
static CommandResult run_command(const std::string& binary, const FakeSdk& sdk,
                                 const std::vector<std::string>& args,
                                 std::optional<std::chrono::milliseconds> interrupt_after = std::nullopt) {
    int pipe_fds[2];
    if (pipe(pipe_fds) != 0) {
        std::cerr << "[Runner] pipe failed: " << strerror(errno) << "\n";
        return {};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        return {};
    }

    if (pid == 0) {
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        close(pipe_fds[0]);
        close(pipe_fds[1]);

        setenv("ANDROID_HOME", sdk.sdk().c_str(), 1);
        setenv("ANDROID_AVD_HOME", sdk.avd_home().c_str(), 1);
        unsetenv("ANDROID_SDK_ROOT");

        std::vector<std::string> full = {binary, "--config", sdk.config().string()};
        full.insert(full.end(), args.begin(), args.end());
        std::vector<char*> argv;
        for (auto& a : full) argv.push_back(a.data());
        argv.push_back(nullptr);

        execv(binary.c_str(), argv.data());
        std::cerr << "[Child] Failed to exec " << binary << ": " << strerror(errno) << "\n";
        _exit(127);
    }

    close(pipe_fds[1]);

    std::thread interrupter;
    if (interrupt_after) {
        interrupter = std::thread([pid, delay = *interrupt_after]() {
            std::this_thread::sleep_for(delay);
            std::cout << "[Runner] Sending SIGINT to PID " << pid << "\n";
            kill(pid, SIGINT);
        });
    }

    CommandResult result;
    char buffer[4096];
    ssize_t n = 0;
    while ((n = read(pipe_fds[0], buffer, sizeof(buffer))) > 0) {
        result.output.append(buffer, static_cast<size_t>(n));
    }
    close(pipe_fds[0]);

    int status = 0;
    waitpid(pid, &status, 0);
    if (interrupter.joinable()) interrupter.join();

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : (128 + WTERMSIG(status));
    return result;
}

// ============================================================================
// Test Scenarios
// ============================================================================

struct ScenarioContext {
    std::string binary;
    FakeSdk& sdk;

    CommandResult run(const std::vector<std::string>& args) const { return run_command(binary, sdk, args); }
};

static bool expect(bool condition, const std::string& what, const CommandResult& result) {
    if (!condition) {
        std::cerr << "[Check] FAILED: " << what << " (exit=" << result.exit_code << ")\n"
                  << "---- output ----\n" << result.output << "----------------\n";
    }
    return condition;
}

// Scenario 1: Existing AVD is listed as stopped and the cache file is written
static bool scenario_list(ScenarioContext& ctx) {
    auto r = ctx.run({"list"});
    return expect(r.exit_code == 0, "list exits 0", r) &&
           expect(r.contains("Pixel_7_API_34"), "lists Pixel_7_API_34", r) &&
           expect(r.contains("Stopped"), "reports Stopped", r) &&
           expect(r.contains("API 34"), "reports API 34", r) &&
           expect(fs::exists(ctx.sdk.cache()), "writes device cache", r);
}

// Scenario 2: Create an AVD with configured defaults
static bool scenario_create(ScenarioContext& ctx) {
    auto r = ctx.run({"create", "android", "Test Device!", "Pixel 7", "34"});
    if (!expect(r.exit_code == 0, "create exits 0", r)) return false;
    if (!expect(r.contains("Created Test_Device"), "reports sanitized name", r)) return false;

    std::ifstream ini(ctx.sdk.avd_home() / "Test_Device.avd" / "config.ini");
    std::string content((std::istreambuf_iterator<char>(ini)), std::istreambuf_iterator<char>());
    CommandResult file{0, content};
    return expect(file.contains("hw.ramSize=2048"), "config.ini has RAM", file) &&
           expect(file.contains("disk.dataPartition.size=4096M"), "config.ini has storage", file) &&
           expect(file.contains("hw.device.name=pixel_7"), "config.ini keeps device", file);
}

// Scenario 3: Creating the same AVD twice fails
static bool scenario_create_duplicate(ScenarioContext& ctx) {
    auto r = ctx.run({"create", "android", "Test_Device", "pixel_7", "34"});
    return expect(r.exit_code == 1, "duplicate create exits 1", r) &&
           expect(r.contains("already exists"), "reports duplicate", r);
}

// Scenario 4: Start launches the emulator, list then reports Running
static bool scenario_start(ScenarioContext& ctx) {
    auto r = ctx.run({"start", "Test_Device"});
    if (!expect(r.exit_code == 0, "start exits 0", r)) return false;
    if (!expect(ctx.sdk.wait_until_running("Test_Device"), "emulator launched", r)) return false;

    auto listed = ctx.run({"list"});
    return expect(listed.contains("Running"), "list reports Running", listed);
}

// Scenario 5: Details read the AVD's config.ini
static bool scenario_details(ScenarioContext& ctx) {
    auto r = ctx.run({"details", "Pixel_7_API_34"});
    return expect(r.exit_code == 0, "details exits 0", r) &&
           expect(r.contains("1536"), "shows RAM", r) &&
           expect(r.contains("6144M"), "shows storage", r);
}

// Scenario 6: Stop kills the running emulator
static bool scenario_stop(ScenarioContext& ctx) {
    auto r = ctx.run({"stop", "Test_Device"});
    return expect(r.exit_code == 0, "stop exits 0", r) &&
           expect(!ctx.sdk.is_running("Test_Device"), "emulator gone", r);
}

// Scenario 7: Delete removes the AVD
static bool scenario_delete(ScenarioContext& ctx) {
    auto r = ctx.run({"delete", "Test_Device"});
    if (!expect(r.exit_code == 0, "delete exits 0", r)) return false;

    auto listed = ctx.run({"list"});
    return expect(!listed.contains("Test_Device"), "list no longer shows Test_Device", listed);
}

// Scenario 8: Unknown device fails with a user-facing error
static bool scenario_unknown_device(ScenarioContext& ctx) {
    auto r = ctx.run({"start", "Nope"});
    return expect(r.exit_code == 1, "unknown start exits 1", r) &&
           expect(r.contains("Device Not Found"), "reports not found", r);
}

// Scenario 9: Invalid configuration is rejected before any tool runs
static bool scenario_invalid_config(ScenarioContext& ctx) {
    ctx.sdk.write_config(100);
    auto r = ctx.run({"list"});
    ctx.sdk.write_config();
    return expect(r.exit_code == 1, "invalid config exits 1", r) &&
           expect(r.contains("validation error"), "reports validation errors", r);
}

// Scenario 10: Watch polls until SIGINT and shuts down cleanly
static bool scenario_watch(ScenarioContext& ctx) {
    fs::remove(ctx.sdk.cache());
    auto r = run_command(ctx.binary, ctx.sdk, {"watch"}, std::chrono::milliseconds(2500));
    return expect(r.exit_code == 0, "watch exits 0 on SIGINT", r) &&
           expect(r.contains("Pixel_7_API_34"), "watch printed devices", r) &&
           expect(r.contains("Shutting down gracefully"), "watch shut down", r) &&
           expect(fs::exists(ctx.sdk.cache()), "watch saved cache", r);
}

// Scenario 11: A platform that fails to refresh makes list exit non-zero
static bool scenario_list_failure(ScenarioContext& ctx) {
    const fs::path marker = ctx.sdk.state() / "fail_listing";
    std::ofstream(marker).close();
    auto r = ctx.run({"list"});
    fs::remove(marker);
    if (!expect(r.exit_code == 1, "failed list exits 1", r)) return false;

    auto recovered = ctx.run({"list"});
    return expect(recovered.exit_code == 0, "list exits 0 once avdmanager recovers", recovered);
}

// ============================================================================
// Main
// ============================================================================

static std::string find_binary(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]).rfind("--", 0) != 0) return argv[1];

    auto dir = fs::read_symlink("/proc/self/exe").parent_path();
    for (int i = 0; i < 3; ++i) {
        if (fs::exists(dir / "emu_manager")) return (dir / "emu_manager").string();
        dir = dir.parent_path();
    }
    return "";
}

int main(int argc, char** argv) {
    std::string binary = find_binary(argc, argv);
    if (binary.empty() || !fs::exists(binary)) {
        std::cerr << "ERROR: Cannot find emu_manager binary.\n";
        return 1;
    }
    std::cout << "Binary: " << binary << "\n";

    int only_scenario = -1;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--scenario" && i + 1 < argc) {
            only_scenario = std::atoi(argv[i + 1]);
        }
    }

    FakeSdk sdk;
    sdk.write_config();
    ScenarioContext ctx{binary, sdk};

    struct Scenario {
        const char* name;
        std::function<bool(ScenarioContext&)> fn;
    };

    // Scenarios build on each other and run in order.
    Scenario scenarios[] = {
        {"1. List",              scenario_list},
        {"2. Create",            scenario_create},
        {"3. Duplicate Create",  scenario_create_duplicate},
        {"4. Start",             scenario_start},
        {"5. Details",           scenario_details},
        {"6. Stop",              scenario_stop},
        {"7. Delete",            scenario_delete},
        {"8. Unknown Device",    scenario_unknown_device},
        {"9. Invalid Config",    scenario_invalid_config},
        {"10. Watch",            scenario_watch},
        {"11. List Failure",     scenario_list_failure},
    };

    int passed = 0, failed = 0;
    std::vector<std::pair<std::string, bool>> results;
    size_t num_scenarios = sizeof(scenarios) / sizeof(scenarios[0]);
    for (size_t i = 0; i < num_scenarios; ++i) {
        if (only_scenario >= 0 && (int)i != only_scenario - 1) continue;

        std::cout << "\n========================================\n";
        std::cout << "  SCENARIO: " << scenarios[i].name << "\n";
        std::cout << "========================================\n";

        auto start = std::chrono::steady_clock::now();
        bool ok = scenarios[i].fn(ctx);
        double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        std::cout << "[Runner] " << scenarios[i].name << ": duration=" << duration << "s"
                  << " → " << (ok ? "PASS ✅" : "FAIL ❌") << "\n";

        results.emplace_back(scenarios[i].name, ok);
        if (ok) ++passed;
        else ++failed;
    }

    std::cout << "\n========================================\n";
    std::cout << "  INTEGRATION TEST RESULTS\n";
    std::cout << "========================================\n";
    for (const auto& [name, ok] : results) {
        std::cout << (ok ? "  ✅ " : "  ❌ ") << name << "\n";
    }
    std::cout << "\nTotal: " << passed << " passed, " << failed << " failed\n";

    return (failed > 0) ? 1 : 0;
}
