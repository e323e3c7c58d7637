#pragma once

#include <optional>
#include <string>
#include <vector>

namespace platform {

struct SpawnOptions {
    bool capture_output = true;     // pipe stdout/stderr back to the parent
    bool merge_stderr = false;      // send stderr into the stdout pipe
    bool new_process_group = true;  // child leads its own process group
};

struct ProcessOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
};

// Owning handle to a spawned child process and the read ends of its
// output pipes. Move-only. A handle that still owns a live child kills
// and reaps it on destruction.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Why spawning failed. Empty for valid handles.
    const std::string& error() const { return error_; }

    // True if the process has not been reaped yet.
    bool running();

    // Non-blocking reap. Returns the exit status once the child is gone:
    // the exit code for a normal exit, the negated signal number if it
    // was killed by a signal.
    std::optional<int> try_wait();

    // Wait for the process to exit. Returns exit status as try_wait().
    // timeout_ms = -1 means indefinite wait; returns nullopt on timeout.
    std::optional<int> wait(int timeout_ms = -1);

    // Read whatever is currently available on the output pipes without
    // blocking. Returns true while at least one pipe is still open.
    bool drain_output();

    // Descriptors to watch for readability (-1 once closed).
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Hand over the captured output and status. Call after try_wait()
    // reported an exit.
    ProcessOutput take_output();

    // SIGKILL the child (and its process group) and reap it.
    void kill();

    // SIGTERM, a short grace period, then SIGKILL.
    void terminate();

    int native_handle() const { return pid_; }

private:
    void reset();
    void signal_child(int sig);
    bool read_pipe(int& fd, std::string& sink);
    void close_pipes();

    int pid_ = -1;
    bool own_group_ = false;
    std::optional<int> exit_status_;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string stdout_data_;
    std::string stderr_data_;
    std::string error_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
};

// Spawn a child process. stdin is /dev/null.
// On pipe/fork failure the returned handle is invalid and error() says why.
// If exec fails the child exits with 127.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = SpawnOptions());

// Spawn, collect all output until EOF, and reap.
// exit_code is -1 if the process could not be spawned.
ProcessOutput run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const SpawnOptions& options = SpawnOptions());

} // namespace platform
