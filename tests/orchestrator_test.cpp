#include "console_reporter.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <limits>
#include <map>
#include <sstream>
#include <thread>

using namespace std::chrono_literals;

namespace {

class RecordingListener : public ILifecycleListener {
public:
    int starts = 0;
    int stops = 0;
    std::string host;
    long long final_count = -1;

    void on_test_start(const std::string& target_host,
                       std::chrono::system_clock::time_point /*timestamp*/) override {
        ++starts;
        host = target_host;
    }

    void on_test_stop(const StatsSnapshot& final_snapshot) override {
        ++stops;
        final_count = final_snapshot.total.count;
    }
};

RunConfig timed_run(std::chrono::milliseconds duration) {
    RunConfig config;
    config.duration = duration;
    config.seed = 1234;
    return config;
}

}  // namespace

TEST(OrchestratorTest, ZeroDurationRunRecordsNothing) {
    auto slow_start = health_profile("slow_start");
    slow_start->on_start = [](SessionState&, std::mt19937&) {
        std::this_thread::sleep_for(200ms);
    };

    Orchestrator orch(timed_run(0ms));
    orch.start({ProfileLoad{slow_start, 1, 10.0}}, TargetDescriptor{"http://127.0.0.1:1"});
    StatsSnapshot snap = orch.wait_for_completion();

    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
    EXPECT_EQ(snap.total.count, 0);
    EXPECT_EQ(orch.current_users(), 0);
}

TEST(OrchestratorTest, ZeroUsersRunsAndStops) {
    Orchestrator orch(timed_run(100ms));
    orch.start({ProfileLoad{health_profile(), 0, 1.0}}, TargetDescriptor{"http://127.0.0.1:1"});
    EXPECT_EQ(orch.phase(), RunPhase::Running);

    StatsSnapshot snap = orch.wait_for_completion();
    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
    EXPECT_EQ(snap.total.count, 0);
}

TEST(OrchestratorTest, SteadyLoadAgainstHealthyTarget) {
    LocalTarget target(16);
    Orchestrator orch(timed_run(2000ms));

    orch.start({ProfileLoad{health_profile(), 10, 10.0}}, TargetDescriptor{target.base_url()});
    EXPECT_EQ(orch.current_users(), 10);
    EXPECT_EQ(orch.run_state().total_users_target, 10);

    StatsSnapshot snap = orch.wait_for_completion();
    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
    EXPECT_GE(snap.total.count, 10);
    EXPECT_EQ(snap.total.failure_count, 0);
    EXPECT_EQ(snap.categories.count("/api/health"), 1u);
    EXPECT_EQ(orch.current_users(), 0);
}

TEST(OrchestratorTest, InvalidConfigurationFailsBeforeStarting) {
    Orchestrator orch(timed_run(100ms));
    const TargetDescriptor good{"http://127.0.0.1:1"};

    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), 1, 1.0}}, TargetDescriptor{"127.0.0.1:1"}),
                 ConfigurationError);
    EXPECT_THROW(orch.start({}, good), ConfigurationError);
    EXPECT_THROW(orch.start({ProfileLoad{nullptr, 1, 1.0}}, good), ConfigurationError);
    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), -1, 1.0}}, good), ConfigurationError);
    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), 5, 0.0}}, good), ConfigurationError);

    TargetDescriptor no_timeout = good;
    no_timeout.default_timeout = 0ms;
    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), 1, 1.0}}, no_timeout), ConfigurationError);

    EXPECT_EQ(orch.phase(), RunPhase::Idle);
    EXPECT_EQ(orch.current_users(), 0);
}

TEST(OrchestratorTest, NonFiniteSpawnRateIsRejected) {
    Orchestrator orch(timed_run(100ms));
    const TargetDescriptor good{"http://127.0.0.1:1"};

    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), 2, std::numeric_limits<double>::infinity()}}, good),
                 ConfigurationError);
    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), 2, std::numeric_limits<double>::quiet_NaN()}}, good),
                 ConfigurationError);
    EXPECT_EQ(orch.phase(), RunPhase::Idle);
}

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
TEST(OrchestratorTest, HttpsTargetWithoutTlsIsRejected) {
    Orchestrator orch(timed_run(100ms));
    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), 1, 1.0}}, TargetDescriptor{"https://127.0.0.1:8443"}),
                 ConfigurationError);
    EXPECT_EQ(orch.phase(), RunPhase::Idle);
    EXPECT_EQ(orch.current_users(), 0);
}
#endif

TEST(OrchestratorTest, TagFilterWithNoMatchIsRejected) {
    RunConfig config = timed_run(100ms);
    config.tags.include = {"chat"};
    auto monitoring = std::make_shared<BehaviorProfile>();
    monitoring->name = "monitoring";
    monitoring->add_task("metrics", 1,
                         std::make_shared<GetTask>("metrics", endpoints::kMonitoringMetrics),
                         {"monitoring"});

    Orchestrator orch(config);
    EXPECT_THROW(orch.start({ProfileLoad{monitoring, 1, 1.0}}, TargetDescriptor{"http://127.0.0.1:1"}),
                 ConfigurationError);
    EXPECT_EQ(orch.phase(), RunPhase::Idle);
}

TEST(OrchestratorTest, ListenersSeeStartAndStopOnce) {
    LocalTarget target;
    auto listener = std::make_shared<RecordingListener>();
    std::ostringstream console;

    Orchestrator orch(timed_run(300ms));
    orch.add_listener(listener);
    orch.add_listener(std::make_shared<ConsoleReporter>(console));

    orch.start({ProfileLoad{health_profile(), 2, 50.0}}, TargetDescriptor{target.base_url()});
    EXPECT_EQ(listener->starts, 1);
    EXPECT_EQ(listener->host, target.base_url());

    StatsSnapshot snap = orch.wait_for_completion();
    orch.stop();   // second stop is a no-op

    EXPECT_EQ(listener->stops, 1);
    EXPECT_EQ(listener->final_count, snap.total.count);
    EXPECT_NE(console.str().find("Load test starting..."), std::string::npos);
    EXPECT_NE(console.str().find("Load test completed!"), std::string::npos);
    EXPECT_NE(console.str().find(StatsAggregator::kTotalCategory), std::string::npos);
}

TEST(OrchestratorTest, ImmediateStopCancelsInFlightRequests) {
    LocalTarget target(8, 0, 1500);
    RunConfig config;
    config.stop_mode = StopMode::Immediate;

    Orchestrator orch(config);
    orch.start({ProfileLoad{health_profile(), 2, 100.0}}, TargetDescriptor{target.base_url()});
    std::this_thread::sleep_for(300ms);

    auto before = std::chrono::steady_clock::now();
    StatsSnapshot snap = orch.stop();
    auto took = std::chrono::steady_clock::now() - before;

    EXPECT_LT(took, 1000ms);
    EXPECT_EQ(snap.total.cancelled_count, 2);
    EXPECT_EQ(snap.total.failure_count, 0);
    EXPECT_EQ(orch.current_users(), 0);
}

TEST(OrchestratorTest, GracefulStopAbortsStragglersAfterTimeout) {
    LocalTarget target(8, 0, 1500);
    RunConfig config;
    config.stop_mode = StopMode::Graceful;
    config.stop_timeout = 100ms;

    Orchestrator orch(config);
    orch.start({ProfileLoad{health_profile(), 1, 100.0}}, TargetDescriptor{target.base_url()});
    std::this_thread::sleep_for(200ms);

    auto before = std::chrono::steady_clock::now();
    StatsSnapshot snap = orch.stop();
    auto took = std::chrono::steady_clock::now() - before;

    EXPECT_LT(took, 1000ms);
    EXPECT_EQ(snap.total.cancelled_count, 1);
    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
}

TEST(OrchestratorTest, IterationCapEndsTheRun) {
    LocalTarget target;
    RunConfig config;
    config.max_iterations = 3;

    Orchestrator orch(config);
    orch.start({ProfileLoad{health_profile(), 4, 100.0}}, TargetDescriptor{target.base_url()});
    StatsSnapshot snap = orch.wait_for_completion();

    EXPECT_EQ(snap.total.count, 12);
    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
}

TEST(OrchestratorTest, RequestStopEndsAnOpenEndedRun) {
    LocalTarget target;
    Orchestrator orch(RunConfig{});
    orch.start({ProfileLoad{health_profile(), 2, 100.0}}, TargetDescriptor{target.base_url()});

    std::thread stopper([&orch] {
        std::this_thread::sleep_for(200ms);
        orch.request_stop();
    });
    StatsSnapshot snap = orch.wait_for_completion();
    stopper.join();

    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
    EXPECT_GT(snap.total.count, 0);
}

TEST(OrchestratorTest, RestartBeginsWithEmptyStats) {
    LocalTarget target;
    RunConfig config;
    config.max_iterations = 2;
    Orchestrator orch(config);

    orch.start({ProfileLoad{health_profile(), 1, 10.0}}, TargetDescriptor{target.base_url()});
    EXPECT_EQ(orch.wait_for_completion().total.count, 2);

    orch.start({ProfileLoad{health_profile(), 1, 10.0}}, TargetDescriptor{target.base_url()});
    EXPECT_EQ(orch.wait_for_completion().total.count, 2);
}

TEST(OrchestratorTest, SecondStartWhileRunningIsRejected) {
    LocalTarget target;
    Orchestrator orch(RunConfig{});
    orch.start({ProfileLoad{health_profile(), 1, 10.0}}, TargetDescriptor{target.base_url()});

    EXPECT_THROW(orch.start({ProfileLoad{health_profile(), 1, 10.0}}, TargetDescriptor{target.base_url()}),
                 std::logic_error);
    orch.stop();
}

TEST(OrchestratorTest, StagesMoveThePopulationUpAndDown) {
    LocalTarget target(16);
    RunConfig config;
    config.stages = {Stage{400ms, 4}, Stage{400ms, 2}, Stage{400ms, 3}};
    const auto began = std::chrono::steady_clock::now();

    Orchestrator orch(config);
    orch.start({ProfileLoad{health_profile("staged", WaitRange{0.05, 0.05}), 1, 100.0}},
               TargetDescriptor{target.base_url()});
    EXPECT_EQ(orch.current_users(), 4);

    auto run = std::async(std::launch::async, [&orch] { return orch.wait_for_completion(); });

    std::this_thread::sleep_until(began + 250ms);
    EXPECT_EQ(orch.current_users(), 4);
    std::this_thread::sleep_until(began + 650ms);
    EXPECT_EQ(orch.current_users(), 2);
    std::this_thread::sleep_until(began + 1050ms);
    EXPECT_EQ(orch.current_users(), 3);

    StatsSnapshot snap = run.get();
    const auto took = std::chrono::steady_clock::now() - began;
    EXPECT_GE(took, 1150ms);
    EXPECT_LT(took, 2500ms);
    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
    EXPECT_GT(snap.total.count, 0);
    EXPECT_EQ(orch.current_users(), 0);
}

TEST(OrchestratorTest, StageTargetsAreSplitByProfileWeight) {
    LocalTarget target;
    RunConfig config;
    config.stages = {Stage{300ms, 6}};

    Orchestrator orch(config);
    orch.start({ProfileLoad{health_profile("reader", WaitRange{0.05, 0.05}), 2, 100.0},
                ProfileLoad{health_profile("writer", WaitRange{0.05, 0.05}), 1, 100.0}},
               TargetDescriptor{target.base_url()});

    const std::map<std::string, int> expected = {{"reader", 4}, {"writer", 2}};
    EXPECT_EQ(orch.users_by_profile(), expected);
    EXPECT_EQ(orch.run_state().total_users_target, 6);
    orch.wait_for_completion();
    EXPECT_EQ(orch.phase(), RunPhase::Stopped);
}
