#include "run_args.hpp"
#include <core/host_list.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <climits>
#include <set>

Result<std::string> parse_run_args(const std::vector<std::string>& args, BatchDefaults& settings) {
    std::vector<std::string> hosts;
    bool hosts_given = false;
    size_t i = 0;

    auto value_of = [&](const std::string& flag) -> Result<std::string> {
        if (i + 1 >= args.size()) {
            return Result<std::string>::Err(fmt::format("{} requires an argument", flag));
        }
        return Result<std::string>::Ok(args[++i]);
    };

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.empty() || arg[0] != '-') break;

        static const std::set<std::string> known = {
            "-H", "--hosts", "-f", "--hostfile", "-p", "--procs",
            "-t", "--timeout", "-e", "--expect", "-s", "--ssh",
        };
        if (!known.count(arg)) {
            return Result<std::string>::Err("Unknown option " + arg);
        }

        auto value = value_of(arg);
        if (value.is_err()) return value;

        if (arg == "-H" || arg == "--hosts") {
            auto parsed = split_host_arg(value.value);
            hosts.insert(hosts.end(), parsed.begin(), parsed.end());
            hosts_given = true;
        } else if (arg == "-f" || arg == "--hostfile") {
            auto loaded = load_host_file(value.value);
            if (loaded.is_err()) return Result<std::string>::Err(loaded.error);
            hosts.insert(hosts.end(), loaded.value.begin(), loaded.value.end());
            hosts_given = true;
        } else if (arg == "-p" || arg == "--procs") {
            int procs = safe_stoi(value.value, 0);
            if (procs < 1) {
                return Result<std::string>::Err(fmt::format("Invalid process count '{}'", value.value));
            }
            settings.max_procs = procs;
        } else if (arg == "-t" || arg == "--timeout") {
            auto timeout = parse_timeout(value.value);
            if (timeout.is_err()) return Result<std::string>::Err(timeout.error);
            settings.timeout = timeout.value;
        } else if (arg == "-e" || arg == "--expect") {
            int code = safe_stoi(value.value, INT_MIN);
            if (code == INT_MIN) {
                return Result<std::string>::Err(fmt::format("Invalid exit code '{}'", value.value));
            }
            settings.expected_exit_code = code;
        } else {
            settings.ssh_bin = value.value;
        }
    }

    std::string command;
    for (; i < args.size(); ++i) {
        if (!command.empty()) command += " ";
        command += args[i];
    }
    if (command.empty()) {
        return Result<std::string>::Err("Missing command to run");
    }

    if (hosts_given) settings.hosts = std::move(hosts);
    return Result<std::string>::Ok(command);
}
