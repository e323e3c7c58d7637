#include "../base_cli.hpp"
#include "../batch_report.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <util/string_utils.hpp>

static void do_run(BaseCLI& cli, const std::string& arg) {
    std::string command = StringUtils::trim(arg);
    if (command.empty()) {
        std::cout << theme::fail("Usage: run <command>");
        return;
    }
    if (!cli.require_hosts() || !cli.require_runner()) return;

    const size_t total = cli.settings.hosts.size();
    size_t done = 0;
    auto progress = [&](const BatchEvent& ev) {
        if (ev.type != BatchEvent::Type::Launched) ++done;
        std::cout << BatchReport::progress_line(ev, done, total) << std::flush;
    };

    auto result = cli.runner->run(command, cli.settings.expected_exit_code, progress);
    cli.has_results = true;
    BatchReport::print_result(result, true);
}

static void do_results(BaseCLI& cli, const std::string& arg) {
    if (!cli.has_results || !cli.runner) {
        std::cout << theme::fail("No batch has run yet.");
        return;
    }
    const auto& last = cli.runner->last_result();
    BatchReport::print_result(last, StringUtils::trim(arg) != "brief");
}

static void do_failures(BaseCLI& cli, const std::string& arg) {
    if (!cli.has_results || !cli.runner) {
        std::cout << theme::fail("No batch has run yet.");
        return;
    }
    const auto& failures = cli.runner->get_failures();
    if (failures.empty()) {
        std::cout << theme::ok("No failures in the last batch.");
        return;
    }
    std::cout << theme::section(fmt::format("Failed ({})", failures.size()));
    BatchReport::print_failures(failures);
    std::cout << "\n";
}

void register_batch_commands(BaseCLI& cli) {
    cli.add_command("run", do_run, "Run a command on every host");
    cli.add_command("results", do_results, "Show the last batch (add 'brief' to hide output)");
    cli.add_command("failures", do_failures, "Show failed hosts from the last batch");
}
