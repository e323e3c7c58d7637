#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>

// Check that `ssh_bin -V` identifies an OpenSSH client.
// Returns the reported version line, or an error describing why the
// executable is unusable.
Result<std::string> check_ssh_binary(const std::string& ssh_bin);

// Launches one non-interactive remote-shell process per target:
//   <ssh_bin> -nqo BatchMode=yes <target> <command>
class RemoteExecutor {
public:
    explicit RemoteExecutor(std::string ssh_bin);

    // Arguments passed after the executable for one target.
    std::vector<std::string> build_args(const std::string& target,
                                        const std::string& command) const;

    // Start the process with stdout and stderr captured separately.
    // The handle is invalid if the process could not be started.
    platform::ProcessHandle launch(const std::string& target,
                                   const std::string& command) const;

    const std::string& ssh_bin() const { return ssh_bin_; }

private:
    std::string ssh_bin_;
};
