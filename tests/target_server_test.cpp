#include "test_support.hpp"

#include <gtest/gtest.h>

#include <httplib.h>

TEST(TargetServerTest, ServesEveryProfileRoute) {
    LocalTarget target;
    httplib::Client cli("127.0.0.1", target.port());

    auto home = cli.Get(endpoints::kHomepage);
    ASSERT_TRUE(home);
    EXPECT_EQ(home->status, 200);

    auto chat = cli.Post(endpoints::kChat, single_prompt_payload("hi", ""), "application/json");
    ASSERT_TRUE(chat);
    EXPECT_EQ(chat->status, 200);

    for (const char* tool : endpoints::kTools) {
        auto res = cli.Post(tool, text_payload("sample"), "application/json");
        ASSERT_TRUE(res) << tool;
        EXPECT_EQ(res->status, 200) << tool;
    }

    auto translate = cli.Post(endpoints::kTranslate, text_payload("hello"), "application/json");
    ASSERT_TRUE(translate);
    EXPECT_EQ(translate->status, 200);

    auto health = cli.Get(endpoints::kMonitoringHealth);
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);

    auto missing = cli.Get("/api/nothing-here");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
}

TEST(TargetServerTest, RejectsMalformedBodies) {
    LocalTarget target;
    httplib::Client cli("127.0.0.1", target.port());

    auto chat = cli.Post(endpoints::kChat, "{}", "application/json");
    ASSERT_TRUE(chat);
    EXPECT_EQ(chat->status, 400);

    auto tool = cli.Post(endpoints::kSummarize, "{}", "application/json");
    ASSERT_TRUE(tool);
    EXPECT_EQ(tool->status, 400);
}

TEST(TargetServerTest, ThrottlesAboveTheRateLimit) {
    LocalTarget target(4, 5);
    httplib::Client cli("127.0.0.1", target.port());

    int ok = 0, limited = 0;
    for (int i = 0; i < 10; ++i) {
        auto res = cli.Get(endpoints::kHealth);
        ASSERT_TRUE(res);
        if (res->status == 200) ++ok;
        if (res->status == 429) ++limited;
    }
    EXPECT_GE(ok, 5);
    EXPECT_GE(limited, 1);
    EXPECT_EQ(ok + limited, 10);
    EXPECT_EQ(target.server().rateLimited.load(), limited);
}

TEST(TargetServerTest, MetricsCountRequests) {
    LocalTarget target;
    httplib::Client cli("127.0.0.1", target.port());
    ASSERT_TRUE(cli.Get(endpoints::kHealth));
    ASSERT_TRUE(cli.Get(endpoints::kHealth));

    auto metrics = cli.Get("/api/monitoring/metrics?format=json");
    ASSERT_TRUE(metrics);
    EXPECT_EQ(metrics->status, 200);
    EXPECT_NE(metrics->body.find("\"totalRequests\": 3"), std::string::npos);
    EXPECT_NE(metrics->body.find("\"rateLimited\": 0"), std::string::npos);
}

TEST(FixedWindowLimiterTest, ZeroLimitAdmitsEverything) {
    FixedWindowLimiter limiter(0);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_TRUE(limiter.TryAcquire());
    }
}

TEST(FixedWindowLimiterTest, CapsOneWindow) {
    FixedWindowLimiter limiter(3);
    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_TRUE(limiter.TryAcquire());
    EXPECT_FALSE(limiter.TryAcquire());
}
