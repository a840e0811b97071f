#include "errors.hpp"
#include "run_config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <limits>

TEST(ParseBaseUrlTest, AcceptsHostAndPort) {
    ParsedUrl u = parse_base_url("http://localhost:3000");
    EXPECT_EQ(u.scheme, "http");
    EXPECT_EQ(u.host, "localhost");
    EXPECT_EQ(u.port, 3000);

    EXPECT_EQ(parse_base_url("https://example.com").port, 443);
    EXPECT_EQ(parse_base_url("http://example.com/").port, 80);
}

TEST(ParseBaseUrlTest, RejectsBadTargets) {
    EXPECT_THROW(parse_base_url("localhost:3000"), ConfigurationError);
    EXPECT_THROW(parse_base_url("ftp://host"), ConfigurationError);
    EXPECT_THROW(parse_base_url("http://"), ConfigurationError);
    EXPECT_THROW(parse_base_url("http://host:0"), ConfigurationError);
    EXPECT_THROW(parse_base_url("http://host:70000"), ConfigurationError);
    EXPECT_THROW(parse_base_url("http://host:abc"), ConfigurationError);
    EXPECT_THROW(parse_base_url("http://host/api"), ConfigurationError);
}

TEST(StopModeTest, ParsesKnownModes) {
    EXPECT_EQ(parse_stop_mode("graceful"), StopMode::Graceful);
    EXPECT_EQ(parse_stop_mode("immediate"), StopMode::Immediate);
    EXPECT_THROW(parse_stop_mode("now"), ConfigurationError);
}

TEST(DistributeUsersTest, ExplicitAndImplicitCounts) {
    auto pops = distribute_users("chat:80,burst,heavy", 100, 10.0);
    ASSERT_EQ(pops.size(), 3u);
    EXPECT_EQ(pops[0].profile, "chat");
    EXPECT_EQ(pops[0].users, 80);
    EXPECT_EQ(pops[1].users, 10);
    EXPECT_EQ(pops[2].users, 10);
    EXPECT_DOUBLE_EQ(pops[0].spawn_rate, 8.0);
    EXPECT_DOUBLE_EQ(pops[1].spawn_rate, 1.0);
}

TEST(DistributeUsersTest, RemainderGoesToFirstImplicitEntries) {
    auto pops = distribute_users("a,b,c", 10, 5.0);
    ASSERT_EQ(pops.size(), 3u);
    EXPECT_EQ(pops[0].users, 4);
    EXPECT_EQ(pops[1].users, 3);
    EXPECT_EQ(pops[2].users, 3);
}

TEST(DistributeUsersTest, RejectsBadLists) {
    EXPECT_THROW(distribute_users("", 10, 1.0), ConfigurationError);
    EXPECT_THROW(distribute_users("chat:20", 10, 1.0), ConfigurationError);
    EXPECT_THROW(distribute_users("chat:x", 10, 1.0), ConfigurationError);
    EXPECT_THROW(distribute_users(":5", 10, 1.0), ConfigurationError);
    EXPECT_THROW(distribute_users("chat", 10, 0.0), ConfigurationError);
    EXPECT_THROW(distribute_users("chat", -1, 1.0), ConfigurationError);
}

TEST(DistributeUsersTest, RejectsNonFiniteSpawnRate) {
    EXPECT_THROW(distribute_users("chat", 10, std::numeric_limits<double>::infinity()), ConfigurationError);
    EXPECT_THROW(distribute_users("chat", 10, std::numeric_limits<double>::quiet_NaN()), ConfigurationError);
}

TEST(DistributeUsersTest, HugeExplicitCountsDoNotWrapAround) {
    const int total = std::numeric_limits<int>::max();
    EXPECT_THROW(distribute_users("a:2000000000,b:2000000000", total, 1.0), ConfigurationError);

    auto pops = distribute_users("a:2000000000,b", total, 1.0);
    ASSERT_EQ(pops.size(), 2u);
    EXPECT_EQ(pops[1].users, total - 2000000000);
}

TEST(ParseStagesTest, ReadsSecondsAndTargets) {
    auto stages = parse_stages("30:10,1.5:50,,60:0");
    ASSERT_EQ(stages.size(), 3u);
    EXPECT_EQ(stages[0].duration, std::chrono::milliseconds(30000));
    EXPECT_EQ(stages[0].target, 10);
    EXPECT_EQ(stages[1].duration, std::chrono::milliseconds(1500));
    EXPECT_EQ(stages[1].target, 50);
    EXPECT_EQ(stages[2].target, 0);
    EXPECT_EQ(total_duration(stages), std::chrono::milliseconds(91500));
}

TEST(ParseStagesTest, RejectsMalformedStages) {
    EXPECT_THROW(parse_stages(""), ConfigurationError);
    EXPECT_THROW(parse_stages("30"), ConfigurationError);
    EXPECT_THROW(parse_stages("30:x"), ConfigurationError);
    EXPECT_THROW(parse_stages("30s:10"), ConfigurationError);
    EXPECT_THROW(parse_stages("0:10"), ConfigurationError);
    EXPECT_THROW(parse_stages("-5:10"), ConfigurationError);
    EXPECT_THROW(parse_stages("inf:10"), ConfigurationError);
    EXPECT_THROW(parse_stages("10:-1"), ConfigurationError);
}

TEST(SplitPopulationTest, SharesFollowWeights) {
    EXPECT_EQ(split_population(10, {3, 1}), (std::vector<int>{8, 2}));
    EXPECT_EQ(split_population(100, {80, 10, 10}), (std::vector<int>{80, 10, 10}));
    EXPECT_EQ(split_population(3, {0, 1}), (std::vector<int>{0, 3}));
}

TEST(SplitPopulationTest, ZeroWeightsSplitEvenly) {
    EXPECT_EQ(split_population(5, {0, 0}), (std::vector<int>{3, 2}));
    EXPECT_EQ(split_population(0, {4, 2}), (std::vector<int>{0, 0}));
    EXPECT_TRUE(split_population(5, {}).empty());
}

TEST(SplitTagsTest, IgnoresEmptyItems) {
    auto tags = split_tags("chat,,monitoring,");
    EXPECT_EQ(tags, (std::set<std::string>{"chat", "monitoring"}));
}
