#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <climits>
#include <fmt/format.h>
#include <core/host_list.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>

static void do_hosts(BaseCLI& cli, const std::string& arg) {
    std::string value = StringUtils::trim(arg);

    if (value.empty()) {
        if (cli.settings.hosts.empty()) {
            std::cout << theme::dim("    (no hosts)") << "\n";
            return;
        }
        std::cout << theme::section(fmt::format("Hosts ({})", cli.settings.hosts.size()));
        for (const auto& h : cli.settings.hosts) {
            std::cout << "    " << h << "\n";
        }
        std::cout << "\n";
        return;
    }

    if (value == "clear") {
        cli.settings.hosts.clear();
        std::cout << theme::ok("Host list cleared.");
        return;
    }

    if (value.rfind("file ", 0) == 0) {
        auto loaded = load_host_file(StringUtils::trim(value.substr(5)));
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return;
        }
        cli.settings.hosts = loaded.value;
    } else {
        cli.settings.hosts = split_host_arg(value);
    }
    std::cout << theme::ok(fmt::format("{} hosts set.", cli.settings.hosts.size()));
}

static void do_procs(BaseCLI& cli, const std::string& arg) {
    std::string value = StringUtils::trim(arg);
    if (value.empty()) {
        std::cout << theme::kv("procs", std::to_string(cli.settings.max_procs));
        return;
    }
    int procs = safe_stoi(value, 0);
    if (procs < 1) {
        std::cout << theme::fail(fmt::format("Invalid process count '{}'", value));
        return;
    }
    cli.settings.max_procs = procs;
    std::cout << theme::ok(fmt::format("Up to {} hosts at once.", procs));
}

static void do_timeout(BaseCLI& cli, const std::string& arg) {
    std::string value = StringUtils::trim(arg);
    if (value.empty()) {
        std::cout << theme::kv("timeout", format_timeout(cli.settings.timeout));
        return;
    }
    auto parsed = parse_timeout(value);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return;
    }
    cli.settings.timeout = parsed.value;
    std::cout << theme::ok("Timeout: " + format_timeout(cli.settings.timeout));
}

static void do_expect(BaseCLI& cli, const std::string& arg) {
    std::string value = StringUtils::trim(arg);
    if (value.empty()) {
        std::cout << theme::kv("expect", std::to_string(cli.settings.expected_exit_code));
        return;
    }
    int code = safe_stoi(value, INT_MIN);
    if (code == INT_MIN) {
        std::cout << theme::fail(fmt::format("Invalid exit code '{}'", value));
        return;
    }
    cli.settings.expected_exit_code = code;
    std::cout << theme::ok(fmt::format("Exit code {} counts as success.", code));
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (cli.config.has_value() && !cli.config->sources().empty()) {
        for (const auto& src : cli.config->sources()) {
            std::cout << theme::kv("Config", src.string());
        }
    } else if (!cli.config_error.empty()) {
        std::cout << theme::fail(cli.config_error);
    } else {
        std::cout << theme::kv("Config", "defaults (no config file)");
    }

    std::cout << theme::kv("ssh", cli.settings.ssh_bin);
    if (cli.runner) {
        std::cout << theme::kv("version", cli.runner->ssh_version());
    }
    std::cout << theme::kv("hosts", std::to_string(cli.settings.hosts.size()));
    std::cout << theme::kv("procs", std::to_string(cli.settings.max_procs));
    std::cout << theme::kv("timeout", format_timeout(cli.settings.timeout));
    std::cout << theme::kv("expect", std::to_string(cli.settings.expected_exit_code));
    std::cout << "\n";
}

void register_settings_commands(BaseCLI& cli) {
    cli.add_command("hosts", do_hosts, "Show or set hosts (a,b,c | file <path> | clear)");
    cli.add_command("procs", do_procs, "Show or set the concurrency ceiling");
    cli.add_command("timeout", do_timeout, "Show or set the per-host timeout (seconds | none)");
    cli.add_command("expect", do_expect, "Show or set the exit code that counts as success");
    cli.add_command("status", do_status, "Show config and current settings");
}
