#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/remote_executor.hpp>

class RunSet;

struct ParallelSSHOptions {
    std::string ssh_bin = DEFAULT_SSH_BIN;
    size_t max_procs = DEFAULT_MAX_PROCS;
    std::optional<std::chrono::milliseconds> timeout;   // nullopt = wait forever, clamped to max_timeout()
    std::vector<std::string> targets;
};

// Runs one command on many hosts over ssh, at most max_procs at a time.
//
// Each run() is a synchronous batch: targets are launched in list order as
// capacity frees up, the control thread sleeps on the children's output
// pipes (bounded by POLL_INTERVAL_MS and the nearest timeout deadline), and
// every target ends up in exactly one SuccessRecord or FailureRecord.
// Settings changed through the setters apply from the next run() on.
class ParallelSSH {
public:
    // Validates the options and the ssh executable (must be OpenSSH).
    static Result<std::unique_ptr<ParallelSSH>> create(ParallelSSHOptions options = ParallelSSHOptions());

    ParallelSSH(const ParallelSSH&) = delete;
    ParallelSSH& operator=(const ParallelSSH&) = delete;

    // Execute `command` on every target. A target succeeds iff its ssh
    // process exits with expected_exit_code. Blocks until all targets are
    // classified. on_event, if set, is called on this thread as targets
    // are launched and classified.
    BatchResult run(const std::string& command,
                    int expected_exit_code = DEFAULT_EXPECTED_EXIT_CODE,
                    const BatchEventCallback& on_event = nullptr);

    // Records of the most recently completed batch.
    const std::vector<SuccessRecord>& get_successes() const { return last_.successes; }
    const std::vector<FailureRecord>& get_failures() const { return last_.failures; }
    const BatchResult& last_result() const { return last_; }

    void set_target_list(std::vector<std::string> targets);
    Result<void> set_max_procs(size_t max_procs);
    Result<void> set_timeout(std::optional<std::chrono::milliseconds> timeout);

    const std::vector<std::string>& target_list() const { return targets_; }
    size_t max_procs() const { return max_procs_; }
    const std::optional<std::chrono::milliseconds>& timeout() const { return timeout_; }
    const std::string& ssh_bin() const { return executor_.ssh_bin(); }
    const std::string& ssh_version() const { return ssh_version_; }

private:
    ParallelSSH(ParallelSSHOptions options, std::string ssh_version);

    // Milliseconds the control thread may sleep before the next scan.
    static int wait_slice_ms(const RunSet& running,
                              const std::optional<std::chrono::milliseconds>& timeout);

    RemoteExecutor executor_;
    std::string ssh_version_;
    std::vector<std::string> targets_;
    size_t max_procs_;
    std::optional<std::chrono::milliseconds> timeout_;
    BatchResult last_;
};
