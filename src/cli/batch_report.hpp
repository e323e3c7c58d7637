#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Terminal rendering of batch progress and results.
namespace BatchReport {

// One-line reason for a failure: "timeout", "unexpected exit code 3",
// "launch error: fork: Resource temporarily unavailable".
std::string describe_failure(const FailureRecord& failure);

// Indent the first `max_lines` lines of `text` for display under a host
// line; appends a "(N more lines)" marker when truncated.
std::string output_preview(const std::string& text, int max_lines);

// Dim progress line for a launch/finish event. `done` counts classified targets.
std::string progress_line(const BatchEvent& event, size_t done, size_t total);

void print_successes(const std::vector<SuccessRecord>& successes, bool show_output);
void print_failures(const std::vector<FailureRecord>& failures);

// Full report: successes, failures and a summary line.
void print_result(const BatchResult& result, bool show_output);

} // namespace BatchReport
