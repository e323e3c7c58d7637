#include "batch_report.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <iostream>
#include <sstream>
#include <fmt/format.h>

namespace BatchReport {

std::string describe_failure(const FailureRecord& failure) {
    switch (failure.kind) {
        case FailureKind::UnexpectedExitCode:
            return fmt::format("{} {}", failure_kind_name(failure.kind), failure.exit_code.value_or(-1));
        case FailureKind::Timeout:
            return failure_kind_name(failure.kind);
        case FailureKind::LaunchError:
            if (failure.detail.empty()) return failure_kind_name(failure.kind);
            return fmt::format("{}: {}", failure_kind_name(failure.kind), failure.detail);
    }
    return failure_kind_name(failure.kind);
}

std::string output_preview(const std::string& text, int max_lines) {
    std::istringstream in(text);
    std::string line;
    std::string out;
    int shown = 0;
    int hidden = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (shown < max_lines) {
            out += "      " + line + "\n";
            ++shown;
        } else {
            ++hidden;
        }
    }
    if (hidden > 0) {
        out += fmt::format("      ({} more lines)\n", hidden);
    }
    return out;
}

std::string progress_line(const BatchEvent& event, size_t done, size_t total) {
    switch (event.type) {
        case BatchEvent::Type::Launched:
            return theme::log(fmt::format("started {} ({} running)", event.target, event.running));
        case BatchEvent::Type::Succeeded:
            return theme::log(fmt::format("[{}/{}] {} ok", done, total, event.target));
        case BatchEvent::Type::Failed:
            return theme::log(fmt::format("[{}/{}] {} {}", done, total, event.target,
                                          event.failure ? describe_failure(*event.failure) : "failed"));
    }
    return "";
}

void print_successes(const std::vector<SuccessRecord>& successes, bool show_output) {
    for (const auto& s : successes) {
        std::cout << theme::ok(theme::bold(s.target));
        if (!show_output) continue;
        if (!s.stdout_text.empty()) {
            std::cout << output_preview(s.stdout_text, OUTPUT_PREVIEW_LINES);
        }
        if (!s.stderr_text.empty()) {
            std::cout << theme::dim(output_preview(s.stderr_text, OUTPUT_PREVIEW_LINES));
        }
    }
}

void print_failures(const std::vector<FailureRecord>& failures) {
    for (const auto& f : failures) {
        std::cout << theme::fail(theme::bold(f.target) + "  " + theme::red(describe_failure(f)));
        if (!f.stderr_text.empty()) {
            std::cout << theme::dim(output_preview(f.stderr_text, OUTPUT_PREVIEW_LINES));
        }
    }
}

void print_result(const BatchResult& result, bool show_output) {
    if (!result.successes.empty()) {
        std::cout << theme::section(fmt::format("Succeeded ({})", result.successes.size()));
        print_successes(result.successes, show_output);
    }
    if (!result.failures.empty()) {
        std::cout << theme::section(fmt::format("Failed ({})", result.failures.size()));
        print_failures(result.failures);
    }

    std::cout << theme::divider();
    std::string summary = fmt::format("{} hosts in {}: {} ok, {} failed",
                                      result.total(), format_duration(result.elapsed),
                                      result.successes.size(), result.failures.size());
    if (result.all_succeeded()) {
        std::cout << theme::ok(summary);
    } else {
        std::cout << theme::fail(summary);
    }
    std::cout << "\n";
}

} // namespace BatchReport
