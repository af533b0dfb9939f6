#include "modules/android_parser.hpp"

#include "utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <regex>

namespace emu_manager::modules::android {

namespace {

bool starts_with(const std::string& text, std::string_view prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string after_prefix(const std::string& text, std::string_view prefix) {
    return utils::trim(std::string_view(text).substr(prefix.size()));
}

bool is_separator(const std::string& trimmed) {
    return starts_with(trimmed, "---");
}

std::string first_package_token(const std::string& trimmed) {
    auto tokens = utils::split_whitespace(trimmed);
    if (tokens.empty()) return {};
    std::string token = tokens.front();
    if (size_t bar = token.find('|'); bar != std::string::npos) {
        token = token.substr(0, bar);
    }
    return token;
}

std::string clean_for_match(const std::string& text) {
    std::string out = utils::to_lower(utils::trim(text));
    std::replace(out.begin(), out.end(), ' ', '_');
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

std::vector<std::string> match_words(const std::string& lower) {
    std::vector<std::string> words;
    std::string current;
    for (char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.') {
            current += c;
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

} // namespace

std::string DeviceProfile::display_name() const {
    if (oem.empty() || oem == "Generic") return name;
    return name + " (" + oem + ")";
}

std::vector<AvdStanza> parse_avd_list(const std::string& output) {
    std::vector<AvdStanza> stanzas;
    AvdStanza current;

    auto flush = [&]() {
        if (!current.name.empty()) {
            current.api_level = parse_api_level(current.target);
            stanzas.push_back(current);
        }
        current = AvdStanza{};
    };

    for (const auto& raw : utils::split_lines(output)) {
        const std::string line = utils::trim(raw);
        if (line.empty() || is_separator(line)) {
            flush();
            continue;
        }

        if (starts_with(line, "Name:")) {
            if (!current.name.empty()) flush();
            current.name = after_prefix(line, "Name:");
        } else if (starts_with(line, "Device:")) {
            current.device = after_prefix(line, "Device:");
        } else if (starts_with(line, "Path:")) {
            current.path = after_prefix(line, "Path:");
        } else if (starts_with(line, "Target:")) {
            current.target = after_prefix(line, "Target:");
        } else if (starts_with(line, "Based on:")) {
            std::string rest = after_prefix(line, "Based on:");
            if (size_t abi_pos = rest.find("Tag/ABI:"); abi_pos != std::string::npos) {
                current.abi = utils::trim(std::string_view(rest).substr(abi_pos + 8));
                rest = utils::trim(std::string_view(rest).substr(0, abi_pos));
            }
            current.target += (current.target.empty() ? "" : " ") + std::string("Based on: ") + rest;
        } else if (starts_with(line, "Tag/ABI:")) {
            current.abi = after_prefix(line, "Tag/ABI:");
        }
    }
    flush();
    return stanzas;
}

uint32_t parse_api_level(const std::string& target) {
    static const std::regex based_on(R"(Based on:\s*Android\s*([\d.]+L?))", std::regex::icase);
    static const std::regex api_level(R"(API level\s*(\d+))", std::regex::icase);
    static const std::regex platform_id(R"(android-(\d+))", std::regex::icase);

    std::smatch match;
    if (std::regex_search(target, match, based_on)) {
        if (auto api = api_from_android_version(match[1].str())) return *api;
    }
    if (std::regex_search(target, match, api_level)) {
        if (auto api = utils::parse_uint(match[1].str())) return *api;
    }
    if (std::regex_search(target, match, platform_id)) {
        if (auto api = utils::parse_uint(match[1].str())) return *api;
    }
    return 0;
}

std::optional<uint32_t> api_from_android_version(const std::string& version) {
    std::string v = utils::trim(version);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    static const std::array<std::pair<const char*, uint32_t>, 9> minor_releases = {{
        {"12L", 32}, {"8.1", 27}, {"7.1", 25}, {"5.1", 22}, {"4.4", 19},
        {"4.3", 18}, {"4.2", 17}, {"4.1", 16}, {"4.0.3", 15},
    }};
    for (const auto& [prefix, api] : minor_releases) {
        if (starts_with(v, prefix)) return api;
    }

    auto major = utils::parse_leading_uint(v);
    if (!major) return std::nullopt;
    switch (*major) {
        case 16: return 36;
        case 15: return 35;
        case 14: return 34;
        case 13: return 33;
        case 12: return 31;
        case 11: return 30;
        case 10: return 29;
        case 9: return 28;
        case 8: return 26;
        case 7: return 24;
        case 6: return 23;
        case 5: return 21;
        case 4: return 15;
        default: return *major;
    }
}

std::string android_version_name(uint32_t api) {
    switch (api) {
        case 36: return "Android 16 Preview";
        case 35: return "Android 15";
        case 34: return "Android 14";
        case 33: return "Android 13";
        case 32: return "Android 12L";
        case 31: return "Android 12";
        case 30: return "Android 11";
        case 29: return "Android 10";
        case 28: return "Android 9";
        case 27: return "Android 8.1";
        case 26: return "Android 8.0";
        case 25: return "Android 7.1";
        case 24: return "Android 7.0";
        case 23: return "Android 6.0";
        case 22: return "Android 5.1";
        case 21: return "Android 5.0";
        case 20: return "Android 4.4W";
        case 19: return "Android 4.4";
        case 18: return "Android 4.3";
        case 17: return "Android 4.2";
        case 16: return "Android 4.1";
        case 15: return "Android 4.0.3";
        case 14: return "Android 4.0";
        default: return "API " + std::to_string(api);
    }
}

std::vector<AdbDevice> parse_adb_devices(const std::string& output) {
    std::vector<AdbDevice> devices;
    for (const auto& raw : utils::split_lines(output)) {
        const std::string line = utils::trim(raw);
        if (line.empty() || starts_with(line, "List of devices") || starts_with(line, "*")) continue;
        auto parts = utils::split_whitespace(line);
        if (parts.size() < 2) continue;
        devices.push_back({parts[0], parts[1]});
    }
    return devices;
}

std::vector<DeviceProfile> parse_device_profiles(const std::string& output) {
    static const std::regex id_line(R"re(id:\s*\d+\s*or\s*"(.+)")re");
    static const std::regex name_line(R"(^Name:\s*(.+))");
    static const std::regex oem_line(R"(^OEM\s*:\s*(.+))");

    std::vector<DeviceProfile> profiles;
    DeviceProfile current;
    auto flush = [&]() {
        if (!current.id.empty()) {
            if (current.name.empty()) current.name = current.id;
            profiles.push_back(current);
        }
        current = DeviceProfile{};
    };

    std::smatch match;
    for (const auto& raw : utils::split_lines(output)) {
        const std::string line = utils::trim(raw);
        if (is_separator(line)) {
            flush();
        } else if (std::regex_search(line, match, id_line)) {
            if (!current.id.empty()) flush();
            current.id = match[1].str();
        } else if (std::regex_search(line, match, name_line)) {
            current.name = utils::trim(match[1].str());
        } else if (std::regex_search(line, match, oem_line)) {
            current.oem = utils::trim(match[1].str());
        }
    }
    flush();
    return profiles;
}

std::optional<std::string> find_matching_device_id(const std::vector<DeviceProfile>& profiles,
                                                   const std::string& requested) {
    const std::string wanted = utils::trim(requested);
    if (wanted.empty()) return std::nullopt;

    for (const auto& p : profiles) {
        if (p.id == wanted) return p.id;
    }
    for (const auto& p : profiles) {
        if (p.display_name() == wanted || p.name == wanted) return p.id;
    }

    const std::string cleaned = clean_for_match(wanted);
    for (const auto& p : profiles) {
        if (clean_for_match(p.id) == cleaned || clean_for_match(p.name) == cleaned ||
            clean_for_match(p.display_name()) == cleaned) {
            return p.id;
        }
    }

    static const std::array<const char*, 6> important_words = {"galaxy", "pixel", "nexus", "tv",
                                                               "wear", "automotive"};
    const auto wanted_words = match_words(utils::to_lower(wanted));
    std::vector<std::string> required;
    for (const auto& word : wanted_words) {
        bool important = std::find(important_words.begin(), important_words.end(), word) !=
                         important_words.end();
        bool specific = word.size() > 4 ||
                        std::any_of(word.begin(), word.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
        if (important || specific) required.push_back(word);
    }
    if (required.empty()) return std::nullopt;

    for (const auto& p : profiles) {
        const auto words = match_words(utils::to_lower(p.id + " " + p.name));
        bool all = std::all_of(required.begin(), required.end(), [&](const std::string& w) {
            return std::find(words.begin(), words.end(), w) != words.end();
        });
        if (all) return p.id;
    }
    return std::nullopt;
}

std::vector<std::string> parse_installed_system_images(const std::string& output) {
    std::vector<std::string> images;
    bool in_installed = false;
    for (const auto& raw : utils::split_lines(output)) {
        const std::string line = utils::trim(raw);
        if (starts_with(line, "Installed packages:")) {
            in_installed = true;
            continue;
        }
        if (starts_with(line, "Available Packages:") || starts_with(line, "Available Updates:")) {
            in_installed = false;
            continue;
        }
        if (!in_installed || !starts_with(line, "system-images;")) continue;

        std::string package = first_package_token(line);
        if (std::find(images.begin(), images.end(), package) == images.end()) {
            images.push_back(package);
        }
    }
    return images;
}

std::vector<core::ApiLevel> parse_api_levels(const std::string& output) {
    std::map<uint32_t, core::ApiLevel> levels;
    bool in_installed = false;

    for (const auto& raw : utils::split_lines(output)) {
        const std::string line = utils::trim(raw);
        if (starts_with(line, "Installed packages:")) {
            in_installed = true;
            continue;
        }
        if (starts_with(line, "Available Packages:") || starts_with(line, "Available Updates:")) {
            in_installed = false;
            continue;
        }
        if (!starts_with(line, "system-images;")) continue;

        const std::string package_id = first_package_token(line);
        auto package = parse_system_image_package(package_id);
        if (!package) continue;

        auto& level = levels[package->api];
        level.api = package->api;
        auto existing = std::find_if(level.variants.begin(), level.variants.end(),
                                     [&](const core::SystemImageVariant& v) { return v.package_id == package_id; });
        if (existing != level.variants.end()) {
            existing->is_installed = existing->is_installed || in_installed;
            continue;
        }
        level.variants.push_back({package->tag, package->abi, package_id, in_installed});
    }

    std::vector<core::ApiLevel> result;
    result.reserve(levels.size());
    for (auto& [api, level] : levels) {
        level.version = android_version_name(api);
        level.is_installed = std::any_of(level.variants.begin(), level.variants.end(),
                                         [](const core::SystemImageVariant& v) { return v.is_installed; });
        result.push_back(std::move(level));
    }
    std::sort(result.begin(), result.end(),
              [](const core::ApiLevel& a, const core::ApiLevel& b) { return a.api > b.api; });
    return result;
}

std::optional<SystemImagePackage> parse_system_image_package(const std::string& package_id) {
    auto parts = utils::split(package_id, ';');
    if (parts.size() != 4 || parts[0] != "system-images" || !starts_with(parts[1], "android-")) {
        return std::nullopt;
    }
    auto api = utils::parse_leading_uint(std::string_view(parts[1]).substr(8));
    if (!api || parts[2].empty() || parts[3].empty()) return std::nullopt;
    return SystemImagePackage{*api, parts[2], parts[3]};
}

std::string system_image_package(uint32_t api, const std::string& tag, const std::string& abi) {
    return "system-images;android-" + std::to_string(api) + ";" + tag + ";" + abi;
}

std::map<std::string, std::string> parse_config_ini(const std::string& content) {
    std::map<std::string, std::string> values;
    for (const auto& raw : utils::split_lines(content)) {
        const std::string line = utils::trim(raw);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        values[utils::trim(std::string_view(line).substr(0, eq))] =
            utils::trim(std::string_view(line).substr(eq + 1));
    }
    return values;
}

std::string render_config_ini(const std::map<std::string, std::string>& values) {
    std::string out;
    for (const auto& [key, value] : values) {
        out += key + "=" + value + "\n";
    }
    return out;
}

uint32_t api_level_from_config(const std::map<std::string, std::string>& config) {
    static const std::regex sysdir(R"(android-(\d+))");
    std::smatch match;
    for (const char* key : {"image.sysdir.1", "target"}) {
        auto it = config.find(key);
        if (it == config.end()) continue;
        if (std::regex_search(it->second, match, sysdir)) {
            if (auto api = utils::parse_uint(match[1].str())) return *api;
        }
    }
    return 0;
}

std::optional<uint32_t> parse_size_mb(const std::string& value) {
    std::string v = utils::to_lower(utils::trim(value));
    if (v.size() > 1 && v.ends_with("mb")) v.pop_back();
    if (v.size() > 1 && v.ends_with("gb")) v.pop_back();
    if (v.empty()) return std::nullopt;

    const char unit = v.back();
    if (unit == 'm' || unit == 'g' || unit == 'k') {
        auto number = utils::parse_uint(std::string_view(v).substr(0, v.size() - 1));
        if (!number) return std::nullopt;
        if (unit == 'g') return *number * 1024;
        if (unit == 'k') return *number / 1024;
        return *number;
    }

    uint64_t number = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), number);
    if (ec != std::errc() || ptr != v.data() + v.size()) return std::nullopt;
    // Plain numbers above a megabyte's worth are byte counts.
    if (number > 1024u * 1024u) number /= 1024u * 1024u;
    return static_cast<uint32_t>(number);
}

std::string sanitize_avd_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && (std::isalnum(uc) || c == '.' || c == '-')) {
            out += c;
        } else if (c == ' ' || c == '_') {
            out += '_';
        }
    }
    size_t begin = out.find_first_not_of('_');
    if (begin == std::string::npos) return {};
    size_t end = out.find_last_not_of('_');
    return out.substr(begin, end - begin + 1);
}

std::string summarize_tool_error(const std::string& output) {
    std::string first_line;
    for (const auto& raw : utils::split_lines(output)) {
        const std::string line = utils::trim(raw);
        if (line.empty()) continue;
        if (size_t pos = line.find("Error:"); pos != std::string::npos) {
            std::string detail = utils::trim(std::string_view(line).substr(pos + 6));
            if (!detail.empty()) return detail;
        }
        if (first_line.empty()) first_line = line;
    }
    return first_line;
}

std::optional<core::InstallProgress> parse_install_progress_line(const std::string& line) {
    if (utils::contains(line, "Downloading")) {
        size_t pct_pos = line.find('%');
        if (pct_pos == std::string::npos) return std::nullopt;
        size_t begin = pct_pos;
        while (begin > 0 && std::isdigit(static_cast<unsigned char>(line[begin - 1]))) --begin;
        auto pct = utils::parse_uint(std::string_view(line).substr(begin, pct_pos - begin));
        if (!pct) return std::nullopt;
        uint32_t percentage = std::min<uint32_t>(20 + std::min<uint32_t>(*pct, 100) * 50 / 100, 70);
        return core::InstallProgress{"Downloading system image...", static_cast<uint8_t>(percentage), std::nullopt};
    }
    if (utils::contains(line, "Unzipping") || utils::contains(line, "Extracting")) {
        return core::InstallProgress{"Extracting system image...", 75, std::nullopt};
    }
    if (utils::contains(line, "Installing")) {
        return core::InstallProgress{"Installing system image...", 85, std::nullopt};
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> parse_targets(const std::string& output) {
    static const std::regex id_line(R"re(id:\s*\d+\s*or\s*"(.+)")re");
    static const std::regex api_line(R"(API level:\s*(\d+))");

    std::vector<std::pair<std::string, std::string>> targets;
    std::string current_id;
    std::smatch match;
    for (const auto& raw : utils::split_lines(output)) {
        const std::string line = utils::trim(raw);
        if (std::regex_search(line, match, id_line)) {
            current_id = match[1].str();
        } else if (!current_id.empty() && std::regex_search(line, match, api_line)) {
            if (auto api = utils::parse_uint(match[1].str())) {
                targets.emplace_back(current_id, "API " + std::to_string(*api) + " (" +
                                                     android_version_name(*api) + ")");
            }
            current_id.clear();
        }
    }
    return targets;
}

} // namespace emu_manager::modules::android
