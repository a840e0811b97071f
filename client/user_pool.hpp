#pragma once

#include "behavior_profile.hpp"
#include "run_config.hpp"
#include "run_state.hpp"
#include "stats_aggregator.hpp"
#include "stop_signal.hpp"
#include "virtual_user.hpp"

#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct RampResult {
    std::string profile;
    int target = 0;
    int reached = 0;
    int spawn_failures = 0;
    bool cancelled = false;
    std::string fatal_error;   // a spawn hit a ConfigurationError; nothing retried

    bool complete() const { return reached >= target; }
};

/**
 * @brief The population of one profile: ramps it up or down at a spawn rate
 * and tears it down on stop.
 *
 * ramp(), wait_ramped() and stop() belong to the controlling thread;
 * cancel_ramp() and the counters may be used from anywhere.
 */
class UserPool {
public:
    static constexpr int kMaxSpawnAttempts = 3;
    static constexpr std::chrono::milliseconds kAbortRetryInterval{100};

    UserPool(ProfilePtr profile,
             const TargetDescriptor& target,
             StatsAggregator& stats,
             RunState& run,
             const RunConfig& config);
    virtual ~UserPool();

    UserPool(const UserPool&) = delete;
    UserPool& operator=(const UserPool&) = delete;

    /**
     * @brief Starts moving the population toward target_count on a ramp
     * thread, one user every 1/spawn_rate seconds. A lower target stops the
     * newest users. Replaces a ramp still in progress.
     * @throws ConfigurationError on a negative target or a rate that is not
     * a positive finite number.
     */
    void ramp(int target_count, double spawn_rate);

    /**
     * @brief Blocks until the current ramp has finished.
     */
    RampResult wait_ramped();

    void cancel_ramp();

    /**
     * @brief Signals every user, waits up to grace for them to stop, aborts
     * the in-flight requests of the rest (recorded as cancelled), then joins
     * all user threads.
     */
    void stop(StopMode mode, std::chrono::milliseconds grace);

    const std::string& profile_name() const { return profile_->name; }
    int user_count() const;     // users owned, whatever their state
    int active_users() const;   // users not yet Stopped

protected:
    /**
     * @brief Builds the user for the next slot. Runs on the ramp thread.
     * Exceptions count as a failed spawn attempt, except ConfigurationError,
     * which ends the ramp.
     */
    virtual std::unique_ptr<VirtualUser> create_user(int id, uint32_t seed);

    /**
     * @brief Stops the caller's pool before a subclass is torn down.
     * Subclasses overriding create_user() call it from their destructor.
     */
    void shutdown() { stop(StopMode::Immediate, std::chrono::milliseconds(0)); }

private:
    struct Slot {
        std::unique_ptr<VirtualUser> user;
        std::thread thread;
    };

    void ramp_loop(int target_count, double spawn_rate, std::shared_ptr<StopSignal> cancel);
    bool spawn_with_retries(StopSignal& cancel, RampResult& result);
    void spawn_one();
    void retire_newest(int count);
    // Signals the users, waits up to grace, then keeps aborting stragglers
    // until every one has stopped. Never holds mutex_ while calling into a user.
    void stop_users(const std::vector<VirtualUser*>& users, StopMode mode,
                    std::chrono::milliseconds grace);
    void on_user_finished();
    void join_ramp();

    ProfilePtr profile_;
    TargetDescriptor target_;
    StatsAggregator& stats_;
    RunState& run_;
    RunConfig config_;

    mutable std::mutex mutex_;   // protects users_
    std::condition_variable users_cv_;
    std::vector<Slot> users_;

    std::mutex ramp_mutex_;
    std::condition_variable ramp_cv_;
    std::shared_ptr<StopSignal> ramp_cancel_;
    bool ramp_done_ = true;
    RampResult ramp_result_;
    std::thread ramp_thread_;
};
