#include <gtest/gtest.h>
#include <managers/launch_queue.hpp>
#include <stdexcept>

TEST(LaunchQueue, PopsInInputOrder) {
    LaunchQueue queue({"c", "a", "b", "a"});
    EXPECT_EQ(queue.size(), 4u);
    EXPECT_EQ(queue.pop(), "c");
    EXPECT_EQ(queue.pop(), "a");
    EXPECT_EQ(queue.pop(), "b");
    EXPECT_EQ(queue.pop(), "a");
    EXPECT_TRUE(queue.empty());
}

TEST(LaunchQueue, PushAppends) {
    LaunchQueue queue;
    EXPECT_TRUE(queue.empty());
    queue.push("x");
    queue.push("y");
    EXPECT_EQ(queue.pop(), "x");
    EXPECT_EQ(queue.size(), 1u);
}

TEST(LaunchQueue, PopOnEmptyThrows) {
    LaunchQueue queue;
    EXPECT_THROW(queue.pop(), std::logic_error);
}
