#pragma once

#include "core/device.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace emu_manager::modules {

using Clock = std::function<std::chrono::steady_clock::time_point()>;

Clock steady_clock_source();

// Last known device list of one platform. The list is published as an
// immutable snapshot and swapped wholesale, so a reader holding a snapshot
// never sees a partial update.
class CachedDeviceList {
public:
    using Snapshot = std::shared_ptr<const std::vector<core::Device>>;

    explicit CachedDeviceList(std::chrono::seconds ttl = std::chrono::seconds(300),
                              Clock clock = steady_clock_source());

    CachedDeviceList(const CachedDeviceList&) = delete;
    CachedDeviceList& operator=(const CachedDeviceList&) = delete;

    // Never null; empty until the first populate().
    Snapshot snapshot() const;

    // Replaces the list, stamps it with the current time and clears both
    // the loading and the invalidation flag.
    void populate(std::vector<core::Device> devices);

    // True when never populated, older than the TTL, or invalidated.
    bool is_stale() const;
    bool is_populated() const;
    void invalidate();

    // Returns false when a load is already in progress.
    bool mark_loading();
    // Ends a load that produced no list.
    void finish_loading();
    bool is_loading() const;

    std::optional<std::chrono::steady_clock::time_point> last_refreshed() const;
    std::chrono::seconds ttl() const { return ttl_; }

private:
    const std::chrono::seconds ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    Snapshot snapshot_;
    std::optional<std::chrono::steady_clock::time_point> last_refreshed_;
    bool invalidated_ = false;
    bool loading_ = false;
};

} // namespace emu_manager::modules
