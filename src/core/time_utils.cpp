#include "time_utils.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

std::string format_duration(std::chrono::milliseconds elapsed) {
    long long ms = elapsed.count();
    if (ms < 0) ms = 0;

    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }
    if (ms < 60 * 1000) {
        return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    }

    long long seconds = ms / 1000;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    }
    return fmt::format("{}m{}s", mins, secs);
}

std::string format_timeout(const std::optional<std::chrono::milliseconds>& timeout) {
    if (!timeout) return "none";
    return format_duration(*timeout);
}

std::chrono::milliseconds max_timeout() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::duration::max()) / 2;
}

std::optional<std::chrono::milliseconds> clamp_timeout(const std::optional<std::chrono::milliseconds>& timeout) {
    if (timeout && *timeout > max_timeout()) return max_timeout();
    return timeout;
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

Result<std::optional<std::chrono::milliseconds>> parse_timeout(const std::string& text) {
    using Timeout = std::optional<std::chrono::milliseconds>;

    std::string value = StringUtils::to_lower(StringUtils::trim(text));
    if (value.empty() || value == "none" || value == "off") {
        return Result<Timeout>::Ok(std::nullopt);
    }

    double seconds = 0;
    try {
        size_t used = 0;
        seconds = std::stod(value, &used);
        if (used != value.size()) {
            return Result<Timeout>::Err(fmt::format("Invalid timeout '{}'", text));
        }
    } catch (const std::exception&) {
        return Result<Timeout>::Err(fmt::format("Invalid timeout '{}'", text));
    }

    if (!std::isfinite(seconds) || seconds < 0) {
        return Result<Timeout>::Err(fmt::format("Timeout must be a non-negative number of seconds, got '{}'", text));
    }
    if (seconds * 1000.0 >= static_cast<double>(max_timeout().count())) {
        return Result<Timeout>::Ok(max_timeout());
    }
    return Result<Timeout>::Ok(seconds_to_ms(seconds));
}
