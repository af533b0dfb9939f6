#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace emu_manager::utils {

std::string trim(std::string_view text);
std::string to_lower(std::string_view text);

// Splits on '\n', dropping a trailing '\r' from each line. Empty lines are kept.
std::vector<std::string> split_lines(std::string_view text);
std::vector<std::string> split_whitespace(std::string_view text);
std::vector<std::string> split(std::string_view text, char delimiter);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

bool contains(std::string_view haystack, std::string_view needle);
bool contains_icase(std::string_view haystack, std::string_view needle);

// Last path component: "/opt/sdk/emulator/emulator" -> "emulator"
std::string basename(std::string_view path);

// Parses a non-negative decimal integer, rejecting trailing garbage.
std::optional<uint32_t> parse_uint(std::string_view text);

// Leading decimal digits only: "34-ext10" -> 34
std::optional<uint32_t> parse_leading_uint(std::string_view text);

std::string truncate_with_ellipsis(std::string_view text, size_t max_length);

} // namespace emu_manager::utils
