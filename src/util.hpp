#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <optional>

namespace fanout {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Parse a non-negative decimal integer; nullopt on anything else
std::optional<size_t> parse_size(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace fanout
