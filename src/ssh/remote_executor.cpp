#include "remote_executor.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

Result<std::string> check_ssh_binary(const std::string& ssh_bin) {
    std::string version_cmd = fmt::format("{} {}", ssh_bin, SSH_VERSION_FLAG);

    // OpenSSH prints its banner on stderr
    platform::SpawnOptions opts;
    opts.merge_stderr = true;
    auto proc = platform::run_capture(ssh_bin, {SSH_VERSION_FLAG}, opts);

    if (proc.exit_code == -1 && !proc.stderr_data.empty()) {
        return Result<std::string>::Err(fmt::format("Could not run {}: {}",
                                                    version_cmd, proc.stderr_data));
    }
    if (proc.exit_code == EXEC_FAILED_EXIT_CODE) {
        return Result<std::string>::Err(fmt::format("{} returned non-zero exit code ({}): "
                                                    "executable not found or not runnable",
                                                    version_cmd, proc.exit_code));
    }
    if (proc.exit_code != 0) {
        return Result<std::string>::Err(fmt::format("{} returned non-zero exit code ({})",
                                                    version_cmd, proc.exit_code));
    }

    std::string version = StringUtils::trim(StringUtils::sanitize_utf8(proc.stdout_data));
    if (version.empty()) {
        return Result<std::string>::Err(fmt::format("No output from {}", version_cmd));
    }
    if (!StringUtils::contains_icase(version, "openssh")) {
        return Result<std::string>::Err(fmt::format(
            "Expecting OpenSSH implementation:\n {} reported {}.", version_cmd, version));
    }
    return Result<std::string>::Ok(version);
}

RemoteExecutor::RemoteExecutor(std::string ssh_bin)
    : ssh_bin_(std::move(ssh_bin)) {}

std::vector<std::string> RemoteExecutor::build_args(const std::string& target,
                                                    const std::string& command) const {
    return {SSH_BATCH_FLAGS, SSH_BATCH_MODE, target, command};
}

platform::ProcessHandle RemoteExecutor::launch(const std::string& target,
                                               const std::string& command) const {
    return platform::spawn(ssh_bin_, build_args(target, command));
}
