#include "modules/priority_engine.hpp"

#include "utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <utility>

namespace emu_manager::modules {

namespace {

constexpr uint32_t kUnversionedBonus = 50;
constexpr uint32_t kPhoneBase = 30;
constexpr uint32_t kPixelOffset = 80;
constexpr uint32_t kPixelMaxBonus = 19;
constexpr uint32_t kPixelUnversioned = 25;

// Apple product bands, wide enough that the version bonus stays inside.
constexpr uint32_t kIosBandWidth = 100;
constexpr uint32_t kIosMaxVersionBonus = 50;

uint32_t category_priority(DeviceCategory category) {
    switch (category) {
        case DeviceCategory::Phone: return 0;
        case DeviceCategory::Foldable: return 20;
        case DeviceCategory::Tablet: return 100;
        case DeviceCategory::Tv: return 200;
        case DeviceCategory::Wear: return 300;
        case DeviceCategory::Automotive: return 400;
        default: return 500;
    }
}

std::vector<std::string> word_tokens(const std::string& lower) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += c;
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

bool has_token(const std::vector<std::string>& tokens, const char* word) {
    return std::find(tokens.begin(), tokens.end(), word) != tokens.end();
}

uint32_t oem_adjustment(const std::string& lower) {
    if (utils::contains(lower, "google") || utils::contains(lower, "pixel")) return 0;
    if (utils::contains(lower, "samsung") || utils::contains(lower, "galaxy")) return 10;
    if (utils::contains(lower, "oneplus")) return 20;

    static const std::array<std::pair<const char*, uint32_t>, 8> tagged_oems = {{
        {"xiaomi", 30},
        {"asus", 35},
        {"oppo", 40},
        {"vivo", 45},
        {"huawei", 50},
        {"motorola", 55},
        {"lenovo", 60},
        {"sony", 65},
    }};

    size_t open = lower.find('(');
    while (open != std::string::npos) {
        size_t close = lower.find(')', open);
        if (close == std::string::npos) break;
        std::string tag = utils::trim(lower.substr(open + 1, close - open - 1));
        for (const auto& [name, value] : tagged_oems) {
            if (utils::contains(tag, name)) return value;
        }
        open = lower.find('(', close);
    }
    return 100;
}

} // namespace

std::string category_to_string(DeviceCategory category) {
    switch (category) {
        case DeviceCategory::Phone: return "phone";
        case DeviceCategory::Foldable: return "foldable";
        case DeviceCategory::Tablet: return "tablet";
        case DeviceCategory::Tv: return "tv";
        case DeviceCategory::Wear: return "wear";
        case DeviceCategory::Automotive: return "automotive";
        case DeviceCategory::Desktop: return "desktop";
        default: return "phone";
    }
}

std::optional<DeviceCategory> category_from_string(const std::string& text) {
    const std::string lower = utils::to_lower(text);
    if (lower == "phone") return DeviceCategory::Phone;
    if (lower == "foldable") return DeviceCategory::Foldable;
    if (lower == "tablet") return DeviceCategory::Tablet;
    if (lower == "tv") return DeviceCategory::Tv;
    if (lower == "wear") return DeviceCategory::Wear;
    if (lower == "automotive") return DeviceCategory::Automotive;
    if (lower == "desktop") return DeviceCategory::Desktop;
    return std::nullopt;
}

DeviceCategory classify_device_category(const std::string& id, const std::string& display_name) {
    const std::string combined = utils::to_lower(id + " " + display_name);
    const auto tokens = word_tokens(combined);

    if (utils::contains(combined, "fold") || utils::contains(combined, "flip")) {
        return DeviceCategory::Foldable;
    }
    if (has_token(tokens, "tv") || utils::contains(combined, "television") ||
        utils::contains(combined, "1080p") || utils::contains(combined, "4k") ||
        utils::contains(combined, "720p")) {
        return DeviceCategory::Tv;
    }
    if (utils::contains(combined, "wear") || utils::contains(combined, "watch") ||
        has_token(tokens, "round") || has_token(tokens, "square")) {
        return DeviceCategory::Wear;
    }
    if (utils::contains(combined, "automotive") || has_token(tokens, "auto") ||
        has_token(tokens, "car")) {
        return DeviceCategory::Automotive;
    }
    if (utils::contains(combined, "desktop") || utils::contains(combined, "laptop")) {
        return DeviceCategory::Desktop;
    }
    if (utils::contains(combined, "tablet") || utils::contains(combined, "pad") ||
        has_token(tokens, "tab") || utils::contains(combined, "pixel_c") ||
        utils::contains(combined, "pixel c") || utils::contains(combined, "nexus_9") ||
        utils::contains(combined, "nexus 9") || utils::contains(combined, "nexus_10") ||
        utils::contains(combined, "nexus 10")) {
        return DeviceCategory::Tablet;
    }
    return DeviceCategory::Phone;
}

uint32_t extract_device_version(const std::string& text) {
    static const std::array<std::regex, 9> model_patterns = {
        std::regex(R"(pixel[_\s]?(\d+))", std::regex::icase),
        std::regex(R"(galaxy[_\s]?s(\d+))", std::regex::icase),
        std::regex(R"(galaxy[_\s]?z[_\s]?fold[_\s]?(\d+))", std::regex::icase),
        std::regex(R"(galaxy[_\s]?z[_\s]?flip[_\s]?(\d+))", std::regex::icase),
        std::regex(R"(oneplus[_\s]?(\d+))", std::regex::icase),
        std::regex(R"(nexus[_\s]?(\d+))", std::regex::icase),
        std::regex(R"((\d+)[_\s]?pro)", std::regex::icase),
        std::regex(R"((\d+)[_\s]?plus)", std::regex::icase),
        std::regex(R"((\d+)[_\s]?ultra)", std::regex::icase),
    };

    std::smatch match;
    for (const auto& pattern : model_patterns) {
        if (std::regex_search(text, match, pattern)) {
            if (auto version = utils::parse_uint(match[1].str())) {
                return 100 - std::min<uint32_t>(*version, 99);
            }
        }
    }

    // Any stand-alone one or two digit number that looks like a generation.
    static const std::regex generic_number(R"((?:^|[^0-9])(\d{1,2})(?=$|[^0-9]))");
    uint32_t best = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), generic_number);
         it != std::sregex_iterator(); ++it) {
        if (auto value = utils::parse_uint((*it)[1].str()); value && *value >= 1 && *value <= 50) {
            best = std::max(best, *value);
        }
    }
    if (best > 0) return 100 - best;
    return kUnversionedBonus;
}

uint32_t calculate_android_device_priority(const std::string& id, const std::string& display_name) {
    const DeviceCategory category = classify_device_category(id, display_name);
    const std::string lower_display = utils::to_lower(display_name);
    const std::string combined = utils::to_lower(id + " " + display_name);
    const uint32_t oem = oem_adjustment(lower_display.empty() ? combined : lower_display + " " + utils::to_lower(id));
    const uint32_t base = category_priority(category);

    if (category == DeviceCategory::Phone) {
        const bool is_pixel = utils::contains(combined, "pixel") && !utils::contains(combined, "nexus");
        if (is_pixel) {
            uint32_t bonus = extract_device_version(combined);
            if (bonus == kUnversionedBonus) {
                return base + kPixelUnversioned;
            }
            uint32_t pixel_bonus = bonus > kPixelOffset ? bonus - kPixelOffset : 0;
            return base + oem / 2 + std::min(pixel_bonus, kPixelMaxBonus);
        }
        return base + kPhoneBase + extract_device_version(combined) + oem / 2;
    }

    return base + oem * 2 + extract_device_version(combined);
}

uint32_t extract_ios_version(const std::string& display_name) {
    for (const auto& token : utils::split_whitespace(display_name)) {
        if (auto value = utils::parse_uint(token); value && *value >= 1 && *value <= 50) {
            return *value;
        }
    }
    // "(3rd generation)" style names
    static const std::regex generation(R"((\d+)(?:st|nd|rd|th)\s+generation)", std::regex::icase);
    std::smatch match;
    if (std::regex_search(display_name, match, generation)) {
        if (auto value = utils::parse_uint(match[1].str()); value && *value <= 50) return *value;
    }
    for (const auto& token : utils::split_whitespace(display_name)) {
        auto parts = utils::split(token, '-');
        if (parts.size() > 1) {
            if (auto value = utils::parse_uint(parts.back()); value && *value >= 1 && *value <= 50) {
                return *value;
            }
        }
    }
    return 0;
}

uint32_t calculate_ios_device_priority(const std::string& display_name) {
    const std::string lower = utils::to_lower(display_name);
    const auto tokens = word_tokens(lower);

    uint32_t band = 13; // unknown
    if (utils::contains(lower, "iphone")) {
        if (utils::contains(lower, "pro max")) band = 5;
        else if (has_token(tokens, "pro")) band = 4;
        else if (has_token(tokens, "plus") || has_token(tokens, "max")) band = 3;
        else if (has_token(tokens, "mini")) band = 0;
        else if (has_token(tokens, "se")) band = 1;
        else band = 2;
    } else if (utils::contains(lower, "ipad")) {
        if (has_token(tokens, "pro")) {
            band = (utils::contains(lower, "12.9") || utils::contains(lower, "13-inch") ||
                    utils::contains(lower, "13 inch")) ? 10 : 9;
        } else if (has_token(tokens, "air")) {
            band = 8;
        } else if (has_token(tokens, "mini")) {
            band = 6;
        } else {
            band = 7;
        }
    } else if (utils::contains(lower, "watch")) {
        band = 11;
    } else if (has_token(tokens, "tv")) {
        band = 12;
    }

    const uint32_t version = std::min(extract_ios_version(display_name), kIosMaxVersionBonus);
    return band * kIosBandWidth + (kIosMaxVersionBonus - version);
}

void sort_android_devices(std::vector<core::Device>& devices) {
    std::stable_sort(devices.begin(), devices.end(), [](const core::Device& a, const core::Device& b) {
        const std::string a_type = a.android() ? a.android()->device_type : std::string();
        const std::string b_type = b.android() ? b.android()->device_type : std::string();
        return calculate_android_device_priority(a_type, a.name) <
               calculate_android_device_priority(b_type, b.name);
    });
}

void sort_ios_devices(std::vector<core::Device>& devices) {
    std::stable_sort(devices.begin(), devices.end(), [](const core::Device& a, const core::Device& b) {
        return calculate_ios_device_priority(a.name) < calculate_ios_device_priority(b.name);
    });
}

} // namespace emu_manager::modules
