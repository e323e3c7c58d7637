#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace StringUtils {

static const char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD";  // U+FFFD

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string sanitize_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        // (rules out overlongs, surrogates and code points > U+10FFFF).
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            out += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            auto b = static_cast<unsigned char>(bytes[i + j]);
            unsigned char min = (j == 1) ? lo : 0x80;
            unsigned char max = (j == 1) ? hi : 0xBF;
            if (b < min || b > max) break;
        }

        if (j == len) {
            out.append(bytes, i, len);
        } else {
            out += REPLACEMENT_CHAR;  // one replacement per maximal subpart
        }
        i += j;
    }
    return out;
}

} // namespace StringUtils
