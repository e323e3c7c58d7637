#include <iostream>
#include <vector>
#include <string>
#include "cli/sshbatch_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sshbatch"
              << theme::color::RESET << theme::color::DIM
              << "                   Interactive shell" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshbatch run "
              << theme::color::RESET << theme::color::BROWN << "<command>"
              << theme::color::RESET << theme::color::DIM
              << "    Run a command on every host" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshbatch check"
              << theme::color::RESET << theme::color::DIM
              << "             Validate ssh and config" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshbatch init"
              << theme::color::RESET << theme::color::DIM
              << "              Write ~/.sshbatch/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::section("Run options");
    std::cout << theme::kv("-H", "hosts, comma separated")
              << theme::kv("-f", "host file, one per line")
              << theme::kv("-p", "max hosts at once")
              << theme::kv("-t", "per-host timeout in seconds, or none")
              << theme::kv("-e", "exit code that counts as success")
              << theme::kv("-s", "ssh executable");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    sshbatch --version        Show version\n"
              << "    sshbatch --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "sshbatch"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << SSHBATCH_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help" || cmd == "-h") {
                print_usage();
                return 0;
            }
        }

        SshBatchCLI cli;

        if (argc == 1) {
            cli.run_shell();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "shell") {
            cli.run_shell();
            return 0;
        } else if (cmd == "run") {
            std::vector<std::string> args(argv + 2, argv + argc);
            return cli.run_once(args);
        } else if (cmd == "check") {
            return cli.run_check();
        } else if (cmd == "init") {
            return cli.run_init();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
