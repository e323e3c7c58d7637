#include "preflight.hpp"
#include <ssh/remote_executor.hpp>
#include <fmt/format.h>

std::vector<PreflightIssue> check_ssh(const BatchDefaults& settings) {
    std::vector<PreflightIssue> issues;

    auto version = check_ssh_binary(settings.ssh_bin);
    if (version.is_err()) {
        issues.push_back({version.error,
                          fmt::format("Install OpenSSH or set 'ssh:' in {}",
                                      get_global_config_path().string())});
    }
    return issues;
}

std::vector<PreflightIssue> check_settings(const BatchDefaults& settings) {
    std::vector<PreflightIssue> issues;

    if (settings.max_procs < 1) {
        issues.push_back({fmt::format("max_procs is {}", settings.max_procs),
                          "Set max_procs to 1 or more"});
    }

    if (settings.hosts.empty()) {
        issues.push_back({"No hosts configured",
                          fmt::format("Add hosts: or hostfile: to {}, or pass -H", PROJECT_CONFIG_NAME),
                          true});
    }

    if (settings.timeout && settings.timeout->count() == 0) {
        issues.push_back({"timeout is 0: every host will time out immediately",
                          "Use a positive timeout or 'none'", true});
    }

    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const BatchDefaults& settings,
                                                 const std::string& config_error) {
    std::vector<PreflightIssue> all;

    // A broken config file makes the other checks meaningless
    if (!config_error.empty()) {
        all.push_back({config_error, "Check YAML syntax"});
        return all;
    }

    auto ssh_issues = check_ssh(settings);
    all.insert(all.end(), ssh_issues.begin(), ssh_issues.end());

    auto setting_issues = check_settings(settings);
    all.insert(all.end(), setting_issues.begin(), setting_issues.end());

    return all;
}
