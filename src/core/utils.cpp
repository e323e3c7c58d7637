#include "utils.hpp"
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        return used == s.size() ? value : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}
