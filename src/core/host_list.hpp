#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

// Parse a host list: one target per line, '#' starts a comment,
// surrounding whitespace and blank lines are dropped.
// Order and duplicates are preserved.
std::vector<std::string> parse_host_list(const std::string& text);

// Read and parse a host file.
Result<std::vector<std::string>> load_host_file(const std::filesystem::path& path);

// Split a comma-separated host argument ("web1,web2"), dropping empty items.
std::vector<std::string> split_host_arg(const std::string& arg);
