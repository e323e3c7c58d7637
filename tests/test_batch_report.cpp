#include <gtest/gtest.h>
#include <cli/batch_report.hpp>

TEST(BatchReport, DescribeFailure) {
    FailureRecord exit_fail;
    exit_fail.kind = FailureKind::UnexpectedExitCode;
    exit_fail.exit_code = 3;
    EXPECT_EQ(BatchReport::describe_failure(exit_fail), "unexpected exit code 3");

    FailureRecord timed_out;
    timed_out.kind = FailureKind::Timeout;
    EXPECT_EQ(BatchReport::describe_failure(timed_out), "timeout");

    FailureRecord launch;
    launch.kind = FailureKind::LaunchError;
    launch.detail = "fork: Resource temporarily unavailable";
    EXPECT_EQ(BatchReport::describe_failure(launch),
              "launch error: fork: Resource temporarily unavailable");
}

TEST(BatchReport, OutputPreviewIndents) {
    EXPECT_EQ(BatchReport::output_preview("one\r\ntwo\n", 5), "      one\n      two\n");
    EXPECT_EQ(BatchReport::output_preview("", 5), "");
}

TEST(BatchReport, OutputPreviewTruncates) {
    std::string preview = BatchReport::output_preview("1\n2\n3\n4\n", 2);
    EXPECT_EQ(preview, "      1\n      2\n      (2 more lines)\n");
}

TEST(BatchReport, ProgressLineMentionsTarget) {
    FailureRecord failure;
    failure.kind = FailureKind::Timeout;
    BatchEvent ev{BatchEvent::Type::Failed, "web3", 1, &failure};

    std::string line = BatchReport::progress_line(ev, 2, 5);
    EXPECT_NE(line.find("[2/5] web3 timeout"), std::string::npos);

    BatchEvent started{BatchEvent::Type::Launched, "web4", 2, nullptr};
    EXPECT_NE(BatchReport::progress_line(started, 2, 5).find("started web4 (2 running)"),
              std::string::npos);
}
