#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
// The whole string must be a number; "12abc" yields the fallback.
int safe_stoi(const std::string& s, int fallback = 0);
