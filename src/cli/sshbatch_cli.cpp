#include "sshbatch_cli.hpp"
#include "batch_report.hpp"
#include "preflight.hpp"
#include "run_args.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <fmt/format.h>
#include <core/time_utils.hpp>
#include <readline/readline.h>
#include <readline/history.h>

SshBatchCLI::SshBatchCLI() : BaseCLI() {
    register_all_commands();
}

void SshBatchCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Exit sshbatch");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Exit sshbatch");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_batch_commands(*this);
    register_settings_commands(*this);
}

void SshBatchCLI::run_shell() {
    std::cout << theme::banner();
    if (!config_error.empty()) {
        std::cout << theme::fail(config_error);
        std::cout << theme::step("Continuing with built-in defaults.");
    }
    std::cout << theme::dim("    Type 'help' for commands.") << "\n\n";

    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }
}

int SshBatchCLI::run_once(const std::vector<std::string>& args) {
    if (!config_error.empty()) {
        std::cout << theme::fail(config_error);
        return 1;
    }

    auto command = parse_run_args(args, settings);
    if (command.is_err()) {
        std::cout << theme::fail(command.error);
        std::cout << theme::step("Usage: sshbatch run [-H hosts] [-f hostfile] [-p N] [-t SECS] [-e CODE] <command>");
        return 1;
    }

    if (!require_hosts() || !require_runner()) return 1;

    std::cout << theme::info(fmt::format("{} on {} hosts ({} at a time, timeout {})",
                                         theme::bold(command.value), settings.hosts.size(),
                                         settings.max_procs, format_timeout(settings.timeout)));

    const size_t total = settings.hosts.size();
    size_t done = 0;
    auto result = runner->run(command.value, settings.expected_exit_code,
                              [&](const BatchEvent& ev) {
        if (ev.type == BatchEvent::Type::Launched) return;
        ++done;
        std::cout << BatchReport::progress_line(ev, done, total) << std::flush;
    });
    has_results = true;

    BatchReport::print_result(result, true);
    return result.all_succeeded() ? 0 : 1;
}

int SshBatchCLI::run_check() {
    std::cout << theme::section("Preflight");

    auto issues = run_preflight_checks(settings, config_error);
    bool blocking = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            blocking = true;
        }
        if (!issue.fix.empty()) std::cout << theme::step(issue.fix);
    }

    if (issues.empty()) {
        std::cout << theme::ok(fmt::format("{} hosts, {} at a time, timeout {}",
                                           settings.hosts.size(), settings.max_procs,
                                           format_timeout(settings.timeout)));
    }
    std::cout << "\n";
    return blocking ? 1 : 0;
}

int SshBatchCLI::run_init() {
    auto path = get_global_config_path();
    bool existed = global_config_exists();

    auto created = create_default_global_config();
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }

    if (existed) {
        std::cout << theme::info("Config already exists at " + path.string());
    } else {
        std::cout << theme::ok("Wrote " + path.string());
    }
    return 0;
}
