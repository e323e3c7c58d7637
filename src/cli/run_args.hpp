#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

// Parse `sshbatch run` arguments, overriding `settings` in place:
//   -H, --hosts a,b     replace the host list
//   -f, --hostfile F    replace the host list with (or add) hosts from F
//   -p, --procs N       concurrency ceiling
//   -t, --timeout S     per-host timeout in seconds, or "none"
//   -e, --expect N      exit code that counts as success
//   -s, --ssh PATH      remote-shell executable
//   --                  end of options
// Everything after the options is joined with spaces into the command,
// which is returned.
Result<std::string> parse_run_args(const std::vector<std::string>& args, BatchDefaults& settings);
