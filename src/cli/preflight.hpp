#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Runs all preflight checks against the effective settings.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const BatchDefaults& settings,
                                                 const std::string& config_error = "");

// Individual checks (for granular use)
std::vector<PreflightIssue> check_ssh(const BatchDefaults& settings);
std::vector<PreflightIssue> check_settings(const BatchDefaults& settings);
