#include "core/api_level.hpp"

#include <array>
#include <utility>

namespace emu_manager::core {

std::string SystemImageVariant::display_name() const {
    if (variant == "google_apis_playstore") return "Google Play Store (" + architecture + ")";
    if (variant == "google_apis") return "Google APIs (" + architecture + ")";
    if (variant == "default") return "Default (" + architecture + ")";
    return variant + " (" + architecture + ")";
}

std::string ApiLevel::display_name() const {
    return "API " + std::to_string(api) + " (" + version + ")";
}

const SystemImageVariant* ApiLevel::get_recommended_variant(const std::string& preferred_arch) const {
    const std::array<std::pair<const char*, std::string>, 6> order = {{
        {"google_apis_playstore", preferred_arch},
        {"google_apis_playstore", "x86_64"},
        {"google_apis", preferred_arch},
        {"google_apis", "x86_64"},
        {"default", preferred_arch},
        {"default", "x86_64"},
    }};

    for (const auto& [tag, arch] : order) {
        for (const auto& v : variants) {
            if (v.variant == tag && v.architecture == arch) {
                return &v;
            }
        }
    }
    return variants.empty() ? nullptr : &variants.front();
}

const SystemImageVariant* ApiLevel::get_recommended_variant() const {
    return get_recommended_variant(host_architecture());
}

std::string host_architecture() {
#if defined(__aarch64__) || defined(_M_ARM64)
    return "arm64-v8a";
#else
    return "x86_64";
#endif
}

} // namespace emu_manager::core
