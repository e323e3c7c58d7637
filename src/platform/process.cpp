#include "process.hpp"
#include "fd_util.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <chrono>

namespace platform {

static constexpr size_t READ_CHUNK = 4096;
static constexpr int WAIT_SLICE_MS = 100;

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    reset();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_),
      own_group_(other.own_group_),
      exit_status_(other.exit_status_),
      stdout_fd_(other.stdout_fd_),
      stderr_fd_(other.stderr_fd_),
      stdout_data_(std::move(other.stdout_data_)),
      stderr_data_(std::move(other.stderr_data_)),
      error_(std::move(other.error_)) {
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
    other.exit_status_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        reset();
        pid_ = other.pid_;
        own_group_ = other.own_group_;
        exit_status_ = other.exit_status_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        stdout_data_ = std::move(other.stdout_data_);
        stderr_data_ = std::move(other.stderr_data_);
        error_ = std::move(other.error_);
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
        other.exit_status_.reset();
    }
    return *this;
}

void ProcessHandle::reset() {
    if (pid_ > 0 && !exit_status_) {
        kill();
    }
    close_pipes();
    pid_ = -1;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0) return false;
    return !try_wait().has_value();
}

std::optional<int> ProcessHandle::try_wait() {
    if (exit_status_) return exit_status_;
    if (pid_ <= 0) return std::nullopt;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, WNOHANG);
    } while (ret < 0 && errno == EINTR);

    if (ret == 0) return std::nullopt;  // still running
    if (ret == pid_) {
        exit_status_ = decode_status(status);
    } else {
        // ECHILD: somebody else reaped it; the status is lost.
        exit_status_ = -1;
    }
    return exit_status_;
}

std::optional<int> ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return std::nullopt;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    while (true) {
        // Keep the pipes flowing so a chatty child can't stall on write.
        drain_output();
        if (auto status = try_wait()) {
            return status;
        }

        int slice = WAIT_SLICE_MS;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) return std::nullopt;
            if (left < slice) slice = static_cast<int>(left);
        }
        wait_readable({stdout_fd_, stderr_fd_}, slice);
    }
}

bool ProcessHandle::read_pipe(int& fd, std::string& sink) {
    if (fd < 0) return false;

    char buf[READ_CHUNK];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(fd);  // EOF
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        close_fd(fd);
        return false;
    }
}

bool ProcessHandle::drain_output() {
    bool out_open = read_pipe(stdout_fd_, stdout_data_);
    bool err_open = read_pipe(stderr_fd_, stderr_data_);
    return out_open || err_open;
}

ProcessOutput ProcessHandle::take_output() {
    drain_output();
    close_pipes();

    ProcessOutput out;
    out.exit_code = exit_status_.value_or(-1);
    out.stdout_data = std::move(stdout_data_);
    out.stderr_data = std::move(stderr_data_);
    stdout_data_.clear();
    stderr_data_.clear();
    return out;
}

void ProcessHandle::close_pipes() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ProcessHandle::signal_child(int sig) {
    if (pid_ <= 0) return;
    if (own_group_ && ::kill(-pid_, sig) == 0) return;
    ::kill(pid_, sig);
}

void ProcessHandle::kill() {
    if (pid_ <= 0 || exit_status_) return;

    signal_child(SIGKILL);
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    exit_status_ = (ret == pid_) ? decode_status(status) : -1;

    // Grandchildren may still hold the write ends; don't wait on them.
    close_pipes();
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || exit_status_) return;

    signal_child(SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        if (try_wait()) return;
        sleep_ms(100);
    }
    kill();
}

// ── spawn ────────────────────────────────────────────────────

static std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Build argv before forking; the child only calls async-signal-safe functions.
    std::vector<const char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (options.capture_output) {
        if (pipe2(out_pipe, O_CLOEXEC) != 0) {
            handle.error_ = errno_message("pipe");
            return handle;
        }
        if (!options.merge_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) {
            handle.error_ = errno_message("pipe");
            close_fd(out_pipe[0]);
            close_fd(out_pipe[1]);
            return handle;
        }
    }

    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        handle.error_ = errno_message("fork");
        close_fd(devnull);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        if (options.new_process_group) setpgid(0, 0);

        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        } else {
            close(STDIN_FILENO);
        }

        if (options.capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(options.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent. Either this or the child's own setpgid wins the race.
    if (options.new_process_group) setpgid(pid, pid);

    close_fd(devnull);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if (out_pipe[0] >= 0) set_nonblocking(out_pipe[0]);
    if (err_pipe[0] >= 0) set_nonblocking(err_pipe[0]);

    handle.pid_ = pid;
    handle.own_group_ = options.new_process_group;
    handle.stdout_fd_ = out_pipe[0];
    handle.stderr_fd_ = err_pipe[0];
    return handle;
}

ProcessOutput run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const SpawnOptions& options) {
    ProcessHandle handle = spawn(program, args, options);
    if (!handle.valid()) {
        ProcessOutput out;
        out.exit_code = -1;
        out.stderr_data = handle.error();
        return out;
    }

    handle.wait(-1);
    // Collect what the child wrote right before exiting.
    while (handle.drain_output()) {
        if (wait_readable({handle.stdout_fd(), handle.stderr_fd()}, WAIT_SLICE_MS) == 0) break;
    }
    return handle.take_output();
}

} // namespace platform
