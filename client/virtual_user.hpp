#pragma once

#include "behavior_profile.hpp"
#include "request_executor.hpp"
#include "response_classifier.hpp"
#include "run_config.hpp"
#include "stats_aggregator.hpp"
#include "stop_signal.hpp"
#include "task_selector.hpp"
#include "wait_time.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <random>

enum class UserState {
    Starting,
    Running,
    Stopping,
    Stopped
};

const char* to_string(UserState state);

/**
 * @brief One simulated client running a behavior profile.
 *
 * run() is the body of the user's own thread; the session state and the
 * generators are touched by that thread only. The other public members may be
 * called from any thread.
 */
class VirtualUser {
public:
    using FinishedCallback = std::function<void(const VirtualUser&)>;

    VirtualUser(int id,
                ProfilePtr profile,
                const TargetDescriptor& target,
                StatsAggregator& stats,
                const TagFilter& tags,
                uint32_t seed,
                long long max_iterations = 0,
                FinishedCallback on_finished = nullptr);

    VirtualUser(const VirtualUser&) = delete;
    VirtualUser& operator=(const VirtualUser&) = delete;

    /**
     * @brief Starting -> Running -> Stopping -> Stopped. Returns once Stopped.
     */
    void run();

    /**
     * @brief Asks the loop to stop. A pending wait ends at once; under
     * StopMode::Immediate the in-flight request is aborted as well.
     */
    void request_stop(StopMode mode);

    // Aborts the in-flight request; it is recorded as cancelled.
    void abort_in_flight();

    int id() const { return id_; }
    UserState state() const { return state_.load(); }
    long long iterations() const { return iterations_.load(); }
    bool start_failed() const { return start_failed_.load(); }
    const BehaviorProfile& profile() const { return *profile_; }

    // Only meaningful once the user is Stopped.
    const SessionState& session() const { return session_; }

private:
    void run_loop();
    void run_task(const TaskDescriptor& task);
    void finish();

    const int id_;
    ProfilePtr profile_;
    StatsAggregator& stats_;
    RequestExecutor executor_;
    ResponseClassifier classifier_;
    TaskSelector selector_;
    std::mt19937 gen_;
    WaitTimeProvider wait_;
    const long long max_iterations_;
    FinishedCallback on_finished_;

    SessionState session_;
    StopSignal stop_;
    std::atomic<UserState> state_{UserState::Starting};
    std::atomic<long long> iterations_{0};
    std::atomic<bool> start_failed_{false};
};
