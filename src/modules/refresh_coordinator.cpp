#include "modules/refresh_coordinator.hpp"

#include <algorithm>
#include <iostream>

namespace emu_manager::modules {

using core::DeviceError;
using core::DeviceResult;
using core::Platform;

RefreshCoordinator::RefreshCoordinator(std::vector<std::shared_ptr<core::DeviceManager>> managers,
                                       RefreshSettings settings, Clock clock)
    : settings_(settings), clock_(std::move(clock)), pool_(std::max<size_t>(settings.worker_threads, 1)) {
    for (auto& manager : managers) {
        if (!manager) continue;
        const Platform platform = manager->platform();
        states_[platform] = std::make_unique<PlatformState>(std::move(manager), settings_.cache_ttl, clock_);
    }
}

RefreshCoordinator::~RefreshCoordinator() {
    stop();
}

void RefreshCoordinator::start() {
    for (auto& [platform, state] : states_) {
        if (state->thread.joinable()) continue;
        PlatformState* raw = state.get();
        state->thread = std::jthread([this, raw](std::stop_token stop) { run_loop(*raw, stop); });
        if (!settings_.quiet) {
            std::cout << "[Refresh] Polling " << core::platform_to_string(platform) << " every "
                      << settings_.interval.count() << "s\n";
        }
    }
}

void RefreshCoordinator::stop() {
    // Lifecycle operations still wake the pollers, so drain them first.
    pool_.wait_idle();
    for (auto& [platform, state] : states_) {
        if (!state->thread.joinable()) continue;
        state->thread.request_stop();
        state->thread.join();
    }
}

RefreshCoordinator::PlatformState* RefreshCoordinator::find_state(Platform platform) const {
    auto it = states_.find(platform);
    return it == states_.end() ? nullptr : it->second.get();
}

bool RefreshCoordinator::has_platform(Platform platform) const {
    return find_state(platform) != nullptr;
}

CachedDeviceList::Snapshot RefreshCoordinator::devices(Platform platform) const {
    if (const auto* state = find_state(platform)) return state->cache.snapshot();
    return std::make_shared<const std::vector<core::Device>>();
}

bool RefreshCoordinator::is_stale(Platform platform) const {
    const auto* state = find_state(platform);
    return state == nullptr || state->cache.is_stale();
}

bool RefreshCoordinator::is_loading(Platform platform) const {
    const auto* state = find_state(platform);
    return state != nullptr && state->cache.is_loading();
}

void RefreshCoordinator::seed(Platform platform, std::vector<core::Device> devices) {
    auto* state = find_state(platform);
    if (state == nullptr) return;
    state->cache.populate(std::move(devices));
    // Seeded data is only a placeholder until the first real listing.
    state->cache.invalidate();
}

void RefreshCoordinator::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

std::chrono::seconds RefreshCoordinator::current_interval(Platform platform) const {
    const auto* state = find_state(platform);
    if (state == nullptr) return settings_.interval;
    std::lock_guard<std::mutex> lock(state->pending_mutex);
    return state->pending_starts.empty() ? settings_.interval : settings_.fast_interval;
}

void RefreshCoordinator::run_loop(PlatformState& state, std::stop_token stop) {
    const Platform platform = state.manager->platform();
    while (!stop.stop_requested()) {
        if (auto refreshed = refresh(state); !refreshed) {
            std::cerr << "[Refresh] " << core::platform_to_string(platform)
                      << " refresh failed: " << refreshed.error().message() << "\n";
        }

        const auto interval = current_interval(platform);
        std::unique_lock<std::mutex> lock(state.wake_mutex);
        (void)state.wake.wait_for(lock, stop, interval, [&state] { return state.wake_requested; });
        state.wake_requested = false;
    }
}

DeviceResult<void> RefreshCoordinator::refresh_now(Platform platform) {
    auto* state = find_state(platform);
    if (state == nullptr) {
        return std::unexpected(DeviceError::platform_not_supported(core::platform_to_string(platform)));
    }
    return refresh(*state);
}

DeviceResult<void> RefreshCoordinator::refresh(PlatformState& state) {
    std::lock_guard<std::mutex> guard(state.refresh_mutex);
    state.cache.mark_loading();

    // No cache lock is held while the vendor tools run.
    auto devices = state.manager->list_devices();
    if (!devices) {
        state.cache.finish_loading();
        return std::unexpected(devices.error());
    }

    check_pending_starts(state, *devices);
    state.cache.populate(std::move(*devices));

    Listener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) listener(state.manager->platform(), state.cache.snapshot());
    return {};
}

void RefreshCoordinator::check_pending_starts(PlatformState& state, const std::vector<core::Device>& devices) {
    const auto now = clock_();
    std::vector<std::string> messages;
    {
        std::lock_guard<std::mutex> lock(state.pending_mutex);
        for (auto it = state.pending_starts.begin(); it != state.pending_starts.end();) {
            const std::string& id = it->first;
            auto device = std::find_if(devices.begin(), devices.end(), [&](const core::Device& d) {
                return d.identifier == id || d.name == id;
            });
            const std::string name = device != devices.end() ? device->name : id;

            if (device != devices.end() && device->is_running()) {
                messages.push_back("Device '" + name + "' is now running!");
                it = state.pending_starts.erase(it);
            } else if (now - it->second > settings_.start_timeout) {
                messages.push_back("Device '" + name + "' did not start within " +
                                   std::to_string(settings_.start_timeout.count()) + "s");
                it = state.pending_starts.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& message : messages) {
        notify(std::move(message));
    }
}

void RefreshCoordinator::notify(std::string message) {
    if (!settings_.quiet) {
        std::cout << "[Refresh] " << message << "\n";
    }
    std::lock_guard<std::mutex> lock(notifications_mutex_);
    notifications_.push_back(std::move(message));
}

std::vector<std::string> RefreshCoordinator::take_notifications() {
    std::lock_guard<std::mutex> lock(notifications_mutex_);
    std::vector<std::string> drained(notifications_.begin(), notifications_.end());
    notifications_.clear();
    return drained;
}

void RefreshCoordinator::after_mutation(PlatformState& state) {
    state.cache.invalidate();
    {
        std::lock_guard<std::mutex> lock(state.wake_mutex);
        state.wake_requested = true;
    }
    state.wake.notify_all();
}

template <typename T, typename Operation>
std::future<DeviceResult<T>> RefreshCoordinator::submit(Platform platform, Operation operation) {
    PlatformState* state = find_state(platform);
    if (state == nullptr) {
        std::promise<DeviceResult<T>> unsupported;
        unsupported.set_value(
            std::unexpected(DeviceError::platform_not_supported(core::platform_to_string(platform))));
        return unsupported.get_future();
    }

    return pool_.enqueue([this, state, operation]() -> DeviceResult<T> {
        DeviceResult<T> result = operation(*state);
        after_mutation(*state);
        return result;
    });
}

std::future<DeviceResult<std::string>> RefreshCoordinator::create_device(Platform platform,
                                                                         core::DeviceConfig config) {
    return submit<std::string>(platform, [config](PlatformState& state) {
        return state.manager->create_device(config);
    });
}

std::future<DeviceResult<void>> RefreshCoordinator::start_device(Platform platform, std::string identifier) {
    return submit<void>(platform, [this, identifier](PlatformState& state) {
        auto result = state.manager->start_device(identifier);
        if (result) {
            std::lock_guard<std::mutex> lock(state.pending_mutex);
            state.pending_starts[identifier] = clock_();
        }
        return result;
    });
}

std::future<DeviceResult<void>> RefreshCoordinator::stop_device(Platform platform, std::string identifier) {
    return submit<void>(platform, [identifier](PlatformState& state) {
        return state.manager->stop_device(identifier);
    });
}

std::future<DeviceResult<void>> RefreshCoordinator::delete_device(Platform platform, std::string identifier) {
    return submit<void>(platform, [identifier](PlatformState& state) {
        {
            std::lock_guard<std::mutex> lock(state.pending_mutex);
            state.pending_starts.erase(identifier);
        }
        return state.manager->delete_device(identifier);
    });
}

std::future<DeviceResult<void>> RefreshCoordinator::wipe_device(Platform platform, std::string identifier) {
    return submit<void>(platform, [identifier](PlatformState& state) {
        return state.manager->wipe_device(identifier);
    });
}

} // namespace emu_manager::modules
