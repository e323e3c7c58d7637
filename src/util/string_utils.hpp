#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(std::string str);
bool contains_icase(const std::string& haystack, const std::string& needle);

// Decode bytes as UTF-8, replacing each maximal invalid subsequence with
// U+FFFD. Valid input comes back unchanged.
std::string sanitize_utf8(const std::string& bytes);
}
