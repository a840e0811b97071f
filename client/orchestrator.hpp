#pragma once

#include "behavior_profile.hpp"
#include "run_config.hpp"
#include "run_state.hpp"
#include "stats_aggregator.hpp"
#include "user_pool.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Receives run lifecycle events. Called synchronously from
 * Orchestrator::start / stop before they return.
 */
class ILifecycleListener {
public:
    virtual ~ILifecycleListener() = default;

    virtual void on_test_start(const std::string& target_host,
                               std::chrono::system_clock::time_point timestamp) = 0;

    virtual void on_test_stop(const StatsSnapshot& final_snapshot) = 0;
};

/**
 * @brief A profile and the population it should reach.
 */
struct ProfileLoad {
    ProfilePtr profile;
    int users = 0;
    double spawn_rate = 1.0;
};

/**
 * @brief Owns one test execution: the RunState, the StatsAggregator and a
 * UserPool per profile.
 *
 * Phases: Idle -> Ramping -> Running -> Stopping -> Stopped. A stopped
 * orchestrator can be started again; every run begins with empty stats.
 */
class Orchestrator {
public:
    using ProgressCallback = std::function<void(const StatsSnapshot&)>;

    explicit Orchestrator(RunConfig config);
    virtual ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void add_listener(std::shared_ptr<ILifecycleListener> listener);

    /**
     * @brief Validates, resets the stats, ramps every profile and returns
     * once all populations are reached (phase Running).
     * With stages configured, the first stage's target replaces the load
     * user counts, which then only weight the split between profiles.
     * @throws ConfigurationError before anything starts on invalid input,
     * or once the run is stopped again if users cannot be created at all.
     * @throws PartialRampError if a pool fell short; the run keeps going.
     * @throws std::logic_error if a run is already active.
     */
    void start(const std::vector<ProfileLoad>& loads, const TargetDescriptor& target);

    /**
     * @brief Stops every pool and returns the final snapshot. Returns the
     * last final snapshot when no run is active.
     */
    StatsSnapshot stop();

    /**
     * @brief Makes wait_for_completion() return and cuts a ramp short.
     * Safe from any thread.
     */
    void request_stop();

    /**
     * @brief Blocks until the duration cap, a stop request, or every user
     * reaching its iteration cap, then runs stop(). Moves the population to
     * each stage's target as its start time comes; the run ends with the
     * last stage unless a shorter duration is set.
     * @param progress Called every `interval` while waiting, if set.
     */
    StatsSnapshot wait_for_completion(std::chrono::milliseconds interval = std::chrono::milliseconds(0),
                                      const ProgressCallback& progress = nullptr);

    RunPhase phase() const { return run_.phase.load(); }
    int current_users() const { return run_.current_user_count.load(); }
    const RunState& run_state() const { return run_; }
    StatsSnapshot snapshot() const { return stats_.snapshot(); }
    const StatsAggregator& stats() const { return stats_; }

    // Users owned by each profile's pool.
    std::map<std::string, int> users_by_profile() const;

protected:
    /**
     * @brief Builds the pool for one profile of a run about to start.
     */
    virtual std::unique_ptr<UserPool> create_pool(ProfilePtr profile, const TargetDescriptor& target,
                                                  StatsAggregator& stats, RunState& run,
                                                  const RunConfig& config);

private:
    void validate(const std::vector<ProfileLoad>& loads, const TargetDescriptor& target) const;
    bool iterations_exhausted() const;
    void apply_stage(size_t index);

    RunConfig config_;
    RunState run_;
    StatsAggregator stats_;

    std::mutex lifecycle_mutex_;   // serializes start and stop
    mutable std::mutex pools_mutex_;
    std::vector<std::unique_ptr<UserPool>> pools_;
    std::vector<int> pool_weights_;      // load user counts, for splitting stage targets
    std::vector<double> pool_rates_;
    std::vector<std::shared_ptr<ILifecycleListener>> listeners_;
    StatsSnapshot final_snapshot_;
};
