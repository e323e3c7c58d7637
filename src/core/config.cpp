#include "config.hpp"
#include "host_list.hpp"
#include "time_utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

// Host keys accept a bare string or a list:
//   hosts: web1
//   hosts: [web1, web2]
static std::vector<std::string> read_host_node(const YAML::Node& node) {
    std::vector<std::string> hosts;
    if (node.IsScalar()) {
        hosts = split_host_arg(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            auto parsed = split_host_arg(item.as<std::string>(""));
            hosts.insert(hosts.end(), parsed.begin(), parsed.end());
        }
    }
    return hosts;
}

// Apply the keys present in `root` on top of `batch`. Relative host files
// resolve against `base_dir` (the directory of the config file).
static Result<void> apply_yaml(const YAML::Node& root, const fs::path& base_dir,
                               BatchDefaults& batch) {
    if (!root || root.IsNull()) {
        return Result<void>::Ok();   // empty file
    }
    if (!root.IsMap()) {
        return Result<void>::Err("top level must be a mapping");
    }

    if (root["ssh"]) {
        batch.ssh_bin = root["ssh"].as<std::string>(DEFAULT_SSH_BIN);
    }

    if (root["max_procs"]) {
        int procs = root["max_procs"].as<int>(DEFAULT_MAX_PROCS);
        if (procs < 1) {
            return Result<void>::Err(fmt::format("max_procs must be at least 1, got {}", procs));
        }
        batch.max_procs = procs;
    }

    if (root["timeout"]) {
        const auto& node = root["timeout"];
        if (node.IsNull()) {
            batch.timeout.reset();
        } else {
            auto parsed = parse_timeout(node.as<std::string>(""));
            if (parsed.is_err()) return Result<void>::Err(parsed.error);
            batch.timeout = parsed.value;
        }
    }

    if (root["expected_exit_code"]) {
        batch.expected_exit_code = root["expected_exit_code"].as<int>(DEFAULT_EXPECTED_EXIT_CODE);
    }

    // A file that names hosts replaces the inherited list.
    if (root["hosts"] || root["hostfile"]) {
        std::vector<std::string> hosts;
        if (root["hosts"]) {
            hosts = read_host_node(root["hosts"]);
        }
        if (root["hostfile"]) {
            fs::path host_path = root["hostfile"].as<std::string>("");
            if (host_path.is_relative()) host_path = base_dir / host_path;
            auto from_file = load_host_file(host_path);
            if (from_file.is_err()) return Result<void>::Err(from_file.error);
            hosts.insert(hosts.end(), from_file.value.begin(), from_file.value.end());
        }
        batch.hosts = std::move(hosts);
    }

    return Result<void>::Ok();
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_NAME;
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# sshbatch configuration
# Project files (./sshbatch.yaml) override these keys.

# Remote-shell executable (must be OpenSSH)
ssh: "/usr/bin/ssh"

# Maximum number of ssh processes running at once
max_procs: 4

# Per-host timeout in seconds, or "none"
timeout: none

# Exit code that counts as success
expected_exit_code: 0

# Targets: inline list and/or a host file (one host per line)
hosts: []
# hostfile: "hosts.txt"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

Result<void> Config::overlay_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto applied = apply_yaml(root, path.parent_path(), batch_);
        if (applied.is_err()) {
            return Result<void>::Err(fmt::format("{}: {}", path.string(), applied.error));
        }
        sources_.push_back(path);
        return Result<void>::Ok();
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    Config config;
    auto applied = config.overlay_file(path);
    if (applied.is_err()) {
        return Result<Config>::Err(applied.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err("Project config not found at " + get_project_config_path(dir).string());
    }
    return load_file(get_project_config_path(dir));
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;

    if (global_config_exists()) {
        auto applied = config.overlay_file(get_global_config_path());
        if (applied.is_err()) return Result<Config>::Err(applied.error);
    }

    if (project_config_exists(project_dir)) {
        auto applied = config.overlay_file(get_project_config_path(project_dir));
        if (applied.is_err()) return Result<Config>::Err(applied.error);
    }

    return Result<Config>::Ok(config);
}
