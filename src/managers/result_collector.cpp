#include "result_collector.hpp"
#include <util/string_utils.hpp>

void ResultCollector::reset() {
    successes_.clear();
    failures_.clear();
}

void ResultCollector::add_success(SuccessRecord record) {
    successes_.push_back(std::move(record));
}

void ResultCollector::add_failure(FailureRecord record) {
    failures_.push_back(std::move(record));
}

bool ResultCollector::record_exit(const std::string& target, platform::ProcessOutput output,
                                  int expected_exit_code) {
    std::string out = StringUtils::sanitize_utf8(output.stdout_data);
    std::string err = StringUtils::sanitize_utf8(output.stderr_data);

    if (output.exit_code == expected_exit_code) {
        SuccessRecord r;
        r.target = target;
        r.stdout_text = std::move(out);
        r.stderr_text = std::move(err);
        r.exit_code = output.exit_code;
        add_success(std::move(r));
        return true;
    }

    FailureRecord r;
    r.target = target;
    r.kind = FailureKind::UnexpectedExitCode;
    r.exit_code = output.exit_code;
    r.stdout_text = std::move(out);
    r.stderr_text = std::move(err);
    add_failure(std::move(r));
    return false;
}

void ResultCollector::record_timeout(const std::string& target) {
    FailureRecord r;
    r.target = target;
    r.kind = FailureKind::Timeout;
    add_failure(std::move(r));
}

void ResultCollector::record_launch_error(const std::string& target, const std::string& detail) {
    FailureRecord r;
    r.target = target;
    r.kind = FailureKind::LaunchError;
    r.detail = detail;
    add_failure(std::move(r));
}

BatchResult ResultCollector::take() {
    BatchResult result;
    result.successes = std::move(successes_);
    result.failures = std::move(failures_);
    reset();
    return result;
}
