#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        settings = config->batch();
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_runner() {
    if (runner && runner->ssh_bin() != settings.ssh_bin) {
        runner.reset();   // executable changed; validate the new one
    }

    if (!runner) {
        ParallelSSHOptions opts;
        opts.ssh_bin = settings.ssh_bin;
        auto created = ParallelSSH::create(opts);
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
            std::cout << theme::step("Set 'ssh:' in " + get_global_config_path().string());
            return false;
        }
        runner = std::move(created.value);
    }

    runner->set_target_list(settings.hosts);
    auto procs = runner->set_max_procs(settings.max_procs < 1 ? 0 : static_cast<size_t>(settings.max_procs));
    if (procs.is_err()) {
        std::cout << theme::fail(procs.error);
        return false;
    }
    auto timeout = runner->set_timeout(settings.timeout);
    if (timeout.is_err()) {
        std::cout << theme::fail(timeout.error);
        return false;
    }
    return true;
}

bool BaseCLI::require_hosts() {
    if (settings.hosts.empty()) {
        std::cout << theme::fail("No hosts configured.");
        std::cout << theme::step("Use 'hosts a,b,c', 'hosts file <path>', or set hosts: in sshbatch.yaml");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Batch",    {"run", "results", "failures"}},
        {"Settings", {"hosts", "procs", "timeout", "expect", "status"}},
        {"General",  {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "sshbatch" + rl_esc(theme::color::RESET);
    if (!settings.hosts.empty()) {
        prompt += ":" + rl_esc(theme::color::BLUE)
                + fmt::format("{}h/{}p", settings.hosts.size(), settings.max_procs)
                + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
