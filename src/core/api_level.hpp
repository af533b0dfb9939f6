#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace emu_manager::core {

struct SystemImageVariant {
    std::string variant;      // "google_apis_playstore", "google_apis", "default", ...
    std::string architecture; // "x86_64", "arm64-v8a", ...
    std::string package_id;   // "system-images;android-34;google_apis;x86_64"
    bool is_installed = false;

    // "Google Play Store (x86_64)"
    std::string display_name() const;
};

struct ApiLevel {
    uint32_t api = 0;
    std::string version; // "Android 14"
    bool is_installed = false;
    std::vector<SystemImageVariant> variants;

    // "API 34 (Android 14)"
    std::string display_name() const;

    // Play Store image first, then Google APIs, then the plain AOSP image,
    // each at the preferred architecture before x86_64. Falls back to the
    // first variant; nullptr when there are none.
    const SystemImageVariant* get_recommended_variant(const std::string& preferred_arch) const;
    const SystemImageVariant* get_recommended_variant() const;
};

// ABI the emulator runs natively on this host.
std::string host_architecture();

} // namespace emu_manager::core
