#include "modules/device_cache.hpp"

namespace emu_manager::modules {

Clock steady_clock_source() {
    return [] { return std::chrono::steady_clock::now(); };
}

CachedDeviceList::CachedDeviceList(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl),
      clock_(std::move(clock)),
      snapshot_(std::make_shared<const std::vector<core::Device>>()) {}

CachedDeviceList::Snapshot CachedDeviceList::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

void CachedDeviceList::populate(std::vector<core::Device> devices) {
    auto fresh = std::make_shared<const std::vector<core::Device>>(std::move(devices));
    const auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = std::move(fresh);
    last_refreshed_ = now;
    invalidated_ = false;
    loading_ = false;
}

bool CachedDeviceList::is_stale() const {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_refreshed_ || invalidated_) return true;
    return now - *last_refreshed_ > ttl_;
}

bool CachedDeviceList::is_populated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_refreshed_.has_value();
}

void CachedDeviceList::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    invalidated_ = true;
}

bool CachedDeviceList::mark_loading() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loading_) return false;
    loading_ = true;
    return true;
}

void CachedDeviceList::finish_loading() {
    std::lock_guard<std::mutex> lock(mutex_);
    loading_ = false;
}

bool CachedDeviceList::is_loading() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loading_;
}

std::optional<std::chrono::steady_clock::time_point> CachedDeviceList::last_refreshed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_refreshed_;
}

} // namespace emu_manager::modules
