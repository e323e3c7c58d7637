#include <gtest/gtest.h>
#include <core/host_list.hpp>
#include "fake_ssh.hpp"

TEST(HostList, ParseSkipsCommentsAndBlanks) {
    auto hosts = parse_host_list(
        "# production\n"
        "web1\n"
        "\n"
        "  web2   # primary db\n"
        "\t10.0.0.7\r\n");
    ASSERT_EQ(hosts.size(), 3u);
    EXPECT_EQ(hosts[0], "web1");
    EXPECT_EQ(hosts[1], "web2");
    EXPECT_EQ(hosts[2], "10.0.0.7");
}

TEST(HostList, ParseKeepsOrderAndDuplicates) {
    auto hosts = parse_host_list("b\na\nb\n");
    ASSERT_EQ(hosts.size(), 3u);
    EXPECT_EQ(hosts[0], "b");
    EXPECT_EQ(hosts[1], "a");
    EXPECT_EQ(hosts[2], "b");
}

TEST(HostList, SplitHostArg) {
    auto hosts = split_host_arg("web1, web2,,user@web3 ");
    ASSERT_EQ(hosts.size(), 3u);
    EXPECT_EQ(hosts[2], "user@web3");
    EXPECT_TRUE(split_host_arg("").empty());
}

TEST(HostList, LoadHostFile) {
    auto dir = make_test_dir("hostlist");
    std::ofstream(dir / "hosts.txt") << "alpha\nbeta\n";

    auto loaded = load_host_file(dir / "hosts.txt");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.size(), 2u);

    auto missing = load_host_file(dir / "nope.txt");
    EXPECT_TRUE(missing.is_err());

    fs::remove_all(dir);
}
