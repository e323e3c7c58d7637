#pragma once

#include <string>
#include <optional>
#include <vector>
#include <chrono>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Batch settings as read from config files (and later overridden by flags)
struct BatchDefaults {
    std::string ssh_bin = DEFAULT_SSH_BIN;
    int max_procs = DEFAULT_MAX_PROCS;
    std::optional<std::chrono::milliseconds> timeout;   // nullopt = no timeout
    int expected_exit_code = DEFAULT_EXPECTED_EXIT_CODE;
    std::vector<std::string> hosts;
};

class Config {
public:
    // Load global config from ~/.sshbatch/config.yaml
    static Result<Config> load_global();

    // Load project config from ./sshbatch.yaml
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load both and combine (project keys override global ones).
    // Missing files are not an error; built-in defaults fill the gaps.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Load a single config file on top of the built-in defaults.
    static Result<Config> load_file(const fs::path& path);

    const BatchDefaults& batch() const { return batch_; }
    const std::vector<fs::path>& sources() const { return sources_; }

public:
    Config() = default;

private:
    Result<void> overlay_file(const fs::path& path);

    BatchDefaults batch_;
    std::vector<fs::path> sources_;   // files that contributed, in load order
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
