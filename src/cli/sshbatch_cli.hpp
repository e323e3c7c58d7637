#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_batch_commands(BaseCLI& cli);
void register_settings_commands(BaseCLI& cli);

class SshBatchCLI : public BaseCLI {
public:
    SshBatchCLI();

    // Interactive REPL (readline). Returns when the user quits or hits EOF.
    void run_shell();

    // `sshbatch run [flags] <command...>`: one batch, then exit.
    // Returns the process exit code: 0 if every host succeeded.
    int run_once(const std::vector<std::string>& args);

    // `sshbatch check`: preflight. Returns 0 if no blocking issues.
    int run_check();

    // `sshbatch init`: write the default global config.
    int run_init();

private:
    void register_all_commands();

    bool quit_requested_ = false;
};
