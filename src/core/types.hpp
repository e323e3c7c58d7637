#pragma once

#include <string>
#include <optional>
#include <vector>
#include <chrono>
#include <functional>
#include <cstddef>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Batch records ───────────────────────────────────────────

enum class FailureKind {
    UnexpectedExitCode,   // process exited, but not with the expected code
    Timeout,              // killed after exceeding the per-target timeout
    LaunchError,          // the remote-shell process could not be started
};

inline const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::UnexpectedExitCode: return "unexpected exit code";
        case FailureKind::Timeout:            return "timeout";
        case FailureKind::LaunchError:        return "launch error";
    }
    return "unknown";
}

struct SuccessRecord {
    std::string target;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

struct FailureRecord {
    std::string target;
    FailureKind kind = FailureKind::UnexpectedExitCode;
    std::optional<int> exit_code;    // only set for UnexpectedExitCode
    std::string stdout_text;
    std::string stderr_text;
    std::string detail;              // launch error message
};

struct BatchResult {
    std::vector<SuccessRecord> successes;
    std::vector<FailureRecord> failures;
    std::chrono::milliseconds elapsed{0};

    size_t total() const { return successes.size() + failures.size(); }
    bool all_succeeded() const { return failures.empty(); }
};

// Progress notifications from a running batch (delivered on the calling thread)
struct BatchEvent {
    enum class Type { Launched, Succeeded, Failed };

    Type type;
    std::string target;
    size_t running = 0;              // Run Set size after the event
    const FailureRecord* failure = nullptr;   // set for Failed
};

using BatchEventCallback = std::function<void(const BatchEvent&)>;
