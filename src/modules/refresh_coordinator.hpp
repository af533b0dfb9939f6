#pragma once

#include "core/device_manager.hpp"
#include "modules/device_cache.hpp"
#include "utils/thread_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace emu_manager::modules {

struct RefreshSettings {
    std::chrono::seconds interval{5};
    std::chrono::seconds fast_interval{1};
    std::chrono::seconds start_timeout{60};
    std::chrono::seconds cache_ttl{300};
    size_t worker_threads = 2;
    bool quiet = false;
};

// Owns one cached snapshot per platform and keeps it fresh: a background
// thread per platform polls its manager, lifecycle operations run on a
// worker pool and invalidate the affected snapshot when they finish.
class RefreshCoordinator {
public:
    using Listener = std::function<void(core::Platform, const CachedDeviceList::Snapshot&)>;

    RefreshCoordinator(std::vector<std::shared_ptr<core::DeviceManager>> managers,
                       RefreshSettings settings = {}, Clock clock = steady_clock_source());
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    void start();
    void stop();

    bool has_platform(core::Platform platform) const;

    // Empty snapshot for a platform without a manager.
    CachedDeviceList::Snapshot devices(core::Platform platform) const;
    bool is_stale(core::Platform platform) const;
    bool is_loading(core::Platform platform) const;

    // Publishes devices loaded from disk; the next poll replaces them.
    void seed(core::Platform platform, std::vector<core::Device> devices);

    // Synchronous refresh on the calling thread.
    core::DeviceResult<void> refresh_now(core::Platform platform);

    std::future<core::DeviceResult<std::string>> create_device(core::Platform platform, core::DeviceConfig config);
    // A successful start switches the platform to fast polling until the
    // device reports Running or start_timeout elapses.
    std::future<core::DeviceResult<void>> start_device(core::Platform platform, std::string identifier);
    std::future<core::DeviceResult<void>> stop_device(core::Platform platform, std::string identifier);
    std::future<core::DeviceResult<void>> delete_device(core::Platform platform, std::string identifier);
    std::future<core::DeviceResult<void>> wipe_device(core::Platform platform, std::string identifier);

    // Drains queued user notifications, oldest first.
    std::vector<std::string> take_notifications();

    // Poll interval the platform's loop is currently using.
    std::chrono::seconds current_interval(core::Platform platform) const;

    // Called after every successful refresh, from the refreshing thread.
    void set_listener(Listener listener);

private:
    struct PlatformState {
        PlatformState(std::shared_ptr<core::DeviceManager> m, std::chrono::seconds ttl, Clock clock)
            : manager(std::move(m)), cache(ttl, std::move(clock)) {}

        std::shared_ptr<core::DeviceManager> manager;
        CachedDeviceList cache;

        // Serializes list_devices() calls of this platform.
        std::mutex refresh_mutex;

        mutable std::mutex pending_mutex;
        std::map<std::string, std::chrono::steady_clock::time_point> pending_starts;

        std::mutex wake_mutex;
        std::condition_variable_any wake;
        bool wake_requested = false;

        std::jthread thread;
    };

    PlatformState* find_state(core::Platform platform) const;
    void run_loop(PlatformState& state, std::stop_token stop);
    core::DeviceResult<void> refresh(PlatformState& state);
    void check_pending_starts(PlatformState& state, const std::vector<core::Device>& devices);
    void after_mutation(PlatformState& state);
    void notify(std::string message);

    template <typename T, typename Operation>
    std::future<core::DeviceResult<T>> submit(core::Platform platform, Operation operation);

    RefreshSettings settings_;
    Clock clock_;
    std::map<core::Platform, std::unique_ptr<PlatformState>> states_;

    std::mutex notifications_mutex_;
    std::deque<std::string> notifications_;

    std::mutex listener_mutex_;
    Listener listener_;

    // Declared last: its destructor drains queued operations while the
    // platform states are still alive.
    utils::ThreadPool pool_;
};

} // namespace emu_manager::modules
