#include "errors.hpp"
#include "profiles/profile_registry.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

TEST(BehaviorProfileTest, BuiltinsAreValid) {
    ProfileRegistry registry = ProfileRegistry::with_builtins();
    const std::vector<std::string> expected = {"burst", "chat", "heavy", "premium", "site", "stress"};
    EXPECT_EQ(registry.names(), expected);
    for (const auto& name : registry.names()) {
        ProfilePtr p = registry.create(name);
        ASSERT_TRUE(p);
        EXPECT_EQ(p->name, name);
        EXPECT_NO_THROW(p->validate(TagFilter{})) << name;
    }
}

TEST(BehaviorProfileTest, UnknownProfileNameIsRejected) {
    ProfileRegistry registry = ProfileRegistry::with_builtins();
    EXPECT_THROW(registry.create("nobody"), ConfigurationError);
}

TEST(BehaviorProfileTest, RejectsUnrunnableProfiles) {
    BehaviorProfile empty;
    empty.name = "empty";
    EXPECT_THROW(empty.validate(TagFilter{}), ConfigurationError);

    auto zero = health_profile();
    zero->tasks[0].weight = 0;
    EXPECT_THROW(zero->validate(TagFilter{}), ConfigurationError);

    auto bad_wait = health_profile();
    bad_wait->wait = WaitRange{5.0, 1.0};
    EXPECT_THROW(bad_wait->validate(TagFilter{}), ConfigurationError);

    auto negative_wait = health_profile();
    negative_wait->wait = WaitRange{-1.0, 1.0};
    EXPECT_THROW(negative_wait->validate(TagFilter{}), ConfigurationError);
}

TEST(BehaviorProfileTest, TagFilterMustLeaveATask) {
    auto p = std::make_shared<BehaviorProfile>();
    p->name = "tagged";
    p->add_task("metrics", 1, std::make_shared<GetTask>("metrics", endpoints::kMonitoringMetrics),
                {"monitoring"});

    TagFilter chat_only;
    chat_only.include = {"chat"};
    EXPECT_THROW(p->validate(chat_only), ConfigurationError);

    TagFilter monitoring;
    monitoring.include = {"monitoring"};
    EXPECT_NO_THROW(p->validate(monitoring));
}

TEST(BehaviorProfileTest, ConversationCarriesHistory) {
    ConversationTask task;
    SessionState session;
    std::mt19937 gen(5);

    RequestSpec first = task.build(session, gen);
    EXPECT_EQ(first.method, "POST");
    EXPECT_EQ(first.path, endpoints::kChat);
    EXPECT_EQ(session.transcript.size(), 2u);
    EXPECT_NE(first.body.find(prompts::kFollowUp), std::string::npos);

    task.build(session, gen);
    EXPECT_EQ(session.transcript.size(), 2u);
}

TEST(BehaviorProfileTest, BurstProfileToleratesRateLimit) {
    ProfilePtr burst = ProfileRegistry::with_builtins().create("burst");
    ASSERT_FALSE(burst->tasks.empty());

    RequestOutcome limited;
    limited.status = 429;
    ResponseClassifier classifier;
    EXPECT_EQ(classifier.classify(limited, burst->tasks[0].task->policy()).verdict, Verdict::Success);
}
