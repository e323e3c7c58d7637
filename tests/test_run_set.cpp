#include <gtest/gtest.h>
#include <managers/run_set.hpp>
#include <core/time_utils.hpp>
#include <stdexcept>

using std::chrono::milliseconds;

static RunningEntry make_entry(const std::string& target, SteadyClock::time_point started) {
    RunningEntry e;
    e.target = target;
    e.started = started;
    return e;
}

TEST(RunSet, RespectsCapacity) {
    RunSet set(2);
    auto now = SteadyClock::now();
    auto a = make_entry("a", now);
    auto b = make_entry("b", now);
    auto c = make_entry("c", now);

    set.add(std::move(a));
    EXPECT_TRUE(set.has_capacity());
    set.add(std::move(b));
    EXPECT_FALSE(set.has_capacity());
    EXPECT_THROW(set.add(std::move(c)), std::logic_error);
    EXPECT_EQ(c.target, "c");
    EXPECT_EQ(set.size(), 2u);
}

TEST(RunSet, NextDeadlineIsEarliestStart) {
    RunSet set(3);
    EXPECT_FALSE(set.next_deadline(milliseconds(100)).has_value());

    auto now = SteadyClock::now();
    auto late = make_entry("late", now);
    auto early = make_entry("early", now - milliseconds(500));
    set.add(std::move(late));
    set.add(std::move(early));

    auto deadline = set.next_deadline(milliseconds(1000));
    ASSERT_TRUE(deadline.has_value());
    EXPECT_EQ(*deadline, now + milliseconds(500));
}

TEST(RunSet, RemoveIf) {
    RunSet set(4);
    auto now = SteadyClock::now();
    for (const char* t : {"a", "b", "c"}) {
        auto e = make_entry(t, now);
        set.add(std::move(e));
    }

    size_t removed = set.remove_if([](RunningEntry& e) { return e.target != "b"; });
    EXPECT_EQ(removed, 2u);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.entries()[0].target, "b");
}

TEST(RunSet, PollFdsSkipsClosedPipes) {
    RunSet set(2);
    auto e = make_entry("idle", SteadyClock::now());
    set.add(std::move(e));
    EXPECT_TRUE(set.poll_fds().empty());

    RunningEntry live = make_entry("live", SteadyClock::now());
    live.process = platform::spawn("/bin/sh", {"-c", "sleep 5"});
    ASSERT_TRUE(live.process.valid());
    set.add(std::move(live));
    EXPECT_EQ(set.poll_fds().size(), 2u);
}

TEST(RunSet, LongestTimeoutDeadlineStaysInFuture) {
    RunSet set(1);
    auto now = SteadyClock::now();
    set.add(make_entry("a", now));

    auto deadline = set.next_deadline(max_timeout());
    ASSERT_TRUE(deadline.has_value());
    EXPECT_GT(*deadline, now);
}
