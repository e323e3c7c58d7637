#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <chrono>
#include <csignal>

using namespace platform;

TEST(Process, CapturesExitCodeAndStreams) {
    auto out = run_capture("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_EQ(out.stdout_data, "out\n");
    EXPECT_EQ(out.stderr_data, "err\n");
}

TEST(Process, MergeStderr) {
    SpawnOptions opts;
    opts.merge_stderr = true;
    auto out = run_capture("/bin/sh", {"-c", "echo banner >&2"}, opts);
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.stdout_data, "banner\n");
    EXPECT_TRUE(out.stderr_data.empty());
}

TEST(Process, StdinIsDevNull) {
    // `cat` would block forever on an inherited terminal
    auto out = run_capture("/bin/cat", {});
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_TRUE(out.stdout_data.empty());
}

TEST(Process, ExecFailureExits127) {
    auto out = run_capture("/nonexistent/sshbatch-no-such-binary", {});
    EXPECT_EQ(out.exit_code, 127);
}

TEST(Process, LargeOutputDoesNotDeadlock) {
    // Several pipe buffers worth on both streams
    auto out = run_capture("/bin/sh", {"-c",
        "i=0; while [ $i -lt 4000 ]; do "
        "echo 0123456789012345678901234567890123456789; "
        "echo 0123456789012345678901234567890123456789 >&2; "
        "i=$((i+1)); done"});
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.stdout_data.size(), 4000u * 41u);
    EXPECT_EQ(out.stderr_data.size(), 4000u * 41u);
}

TEST(Process, TryWaitWhileRunning) {
    auto proc = spawn("/bin/sh", {"-c", "sleep 5"});
    ASSERT_TRUE(proc.valid()) << proc.error();
    EXPECT_FALSE(proc.try_wait().has_value());
    EXPECT_TRUE(proc.running());
    proc.kill();
    EXPECT_FALSE(proc.running());
}

TEST(Process, KillReportsSignal) {
    auto proc = spawn("/bin/sh", {"-c", "sleep 5"});
    ASSERT_TRUE(proc.valid());
    proc.kill();
    auto status = proc.try_wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, -SIGKILL);
    EXPECT_EQ(proc.stdout_fd(), -1);
    EXPECT_EQ(proc.stderr_fd(), -1);
}

TEST(Process, KillReachesGrandchildren) {
    // The backgrounded sleep keeps the pipe open unless the group dies too
    auto start = std::chrono::steady_clock::now();
    auto proc = spawn("/bin/sh", {"-c", "sleep 30 & wait"});
    ASSERT_TRUE(proc.valid());
    proc.kill();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(Process, WaitTimesOut) {
    auto proc = spawn("/bin/sh", {"-c", "sleep 5"});
    ASSERT_TRUE(proc.valid());
    EXPECT_FALSE(proc.wait(100).has_value());
    proc.kill();
}

TEST(Process, WaitCollectsOutput) {
    auto proc = spawn("/bin/sh", {"-c", "printf hello"});
    ASSERT_TRUE(proc.valid());
    auto status = proc.wait(5000);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, 0);
    auto out = proc.take_output();
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.stdout_data, "hello");
}

TEST(Process, MovedFromHandleIsInvalid) {
    auto a = spawn("/bin/true", {});
    ASSERT_TRUE(a.valid());
    ProcessHandle b = std::move(a);
    EXPECT_FALSE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_EQ(b.wait(5000).value_or(-1), 0);
}

TEST(Process, TerminateStopsCooperativeChild) {
    auto proc = spawn("/bin/sh", {"-c", "sleep 5"});
    ASSERT_TRUE(proc.valid());
    proc.terminate();
    auto status = proc.try_wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, -SIGTERM);
}
