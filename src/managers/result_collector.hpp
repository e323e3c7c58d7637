#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>

// Append-only sink for one batch's classifications, in completion order.
class ResultCollector {
public:
    // Drop everything from a previous batch.
    void reset();

    void add_success(SuccessRecord record);
    void add_failure(FailureRecord record);

    // Classify a finished process: success iff the exit code equals
    // expected_exit_code. Captured bytes are decoded as lossy UTF-8.
    // Returns true for a success.
    bool record_exit(const std::string& target, platform::ProcessOutput output,
                     int expected_exit_code);

    void record_timeout(const std::string& target);
    void record_launch_error(const std::string& target, const std::string& detail);

    const std::vector<SuccessRecord>& successes() const { return successes_; }
    const std::vector<FailureRecord>& failures() const { return failures_; }
    size_t count() const { return successes_.size() + failures_.size(); }

    // Move the accumulated records out, leaving the collector empty.
    BatchResult take();

private:
    std::vector<SuccessRecord> successes_;
    std::vector<FailureRecord> failures_;
};
