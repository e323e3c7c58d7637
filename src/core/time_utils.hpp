#pragma once

#include <string>
#include <chrono>
#include <optional>
#include "types.hpp"

// Format an elapsed duration for display.
// Returns "350ms" under a second, "8.2s" under a minute, then "14m22s", "2h35m".
std::string format_duration(std::chrono::milliseconds elapsed);

// "none" for no timeout, otherwise the duration as format_duration().
std::string format_timeout(const std::optional<std::chrono::milliseconds>& timeout);

// Longest timeout a steady_clock deadline can hold without overflow
// (about 146 years). Longer timeouts are clamped to it.
std::chrono::milliseconds max_timeout();

// Clamp a timeout to max_timeout(). Negative values pass through.
std::optional<std::chrono::milliseconds> clamp_timeout(const std::optional<std::chrono::milliseconds>& timeout);

// Parse a timeout given in seconds ("30", "1.5") or "none"/"off" to disable.
// Negative or non-numeric input is an error; huge values are clamped.
Result<std::optional<std::chrono::milliseconds>> parse_timeout(const std::string& text);

// Convert fractional seconds to milliseconds, rounding to nearest.
std::chrono::milliseconds seconds_to_ms(double seconds);
