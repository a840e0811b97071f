#include "orchestrator.hpp"
#include "errors.hpp"
#include "request_executor.hpp"
#include "utils.h"

#include <cmath>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

const char* to_string(RunPhase phase) {
    switch (phase) {
        case RunPhase::Idle:     return "idle";
        case RunPhase::Ramping:  return "ramping";
        case RunPhase::Running:  return "running";
        case RunPhase::Stopping: return "stopping";
        case RunPhase::Stopped:  return "stopped";
    }
    return "idle";
}

Orchestrator::Orchestrator(RunConfig config)
    : config_(std::move(config))
{
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::add_listener(std::shared_ptr<ILifecycleListener> listener) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    listeners_.push_back(std::move(listener));
}

void Orchestrator::validate(const std::vector<ProfileLoad>& loads, const TargetDescriptor& target) const {
    if (target.default_timeout.count() <= 0) {
        throw ConfigurationError("default request timeout must be positive");
    }
    {
        // Same checks every user's executor makes, done once before any starts.
        RequestExecutor client_check(target);
    }
    for (const auto& stage : config_.stages) {
        if (stage.duration.count() <= 0 || stage.target < 0) {
            throw ConfigurationError("stages need a positive duration and a non-negative target");
        }
    }
    if (loads.empty()) {
        throw ConfigurationError("no profiles to run");
    }
    for (const auto& load : loads) {
        if (!load.profile) {
            throw ConfigurationError("null profile");
        }
        load.profile->validate(config_.tags);
        if (load.users < 0) {
            throw ConfigurationError("profile '" + load.profile->name + "': negative user count");
        }
        const bool spawns = load.users > 0 || !config_.stages.empty();
        if (spawns && (!std::isfinite(load.spawn_rate) || load.spawn_rate <= 0.0)) {
            throw ConfigurationError("profile '" + load.profile->name + "': spawn rate must be a positive number");
        }
    }
}

void Orchestrator::start(const std::vector<ProfileLoad>& loads, const TargetDescriptor& target) {
    std::vector<UserPool*> pools;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        const RunPhase current = run_.phase.load();
        if (current != RunPhase::Idle && current != RunPhase::Stopped) {
            throw std::logic_error(std::string("a run is already ") + to_string(current));
        }

        validate(loads, target);

        {
            std::lock_guard<std::mutex> pools_lock(pools_mutex_);
            pools_.clear();
        }
        stats_.reset();
        {
            std::lock_guard<std::mutex> run_lock(run_.mutex);
            run_.stop_requested = false;
        }

        std::vector<int> weights;
        std::vector<double> rates;
        for (const auto& load : loads) {
            weights.push_back(load.users);
            rates.push_back(load.spawn_rate);
        }
        const std::vector<int> targets = config_.stages.empty()
            ? weights
            : split_population(config_.stages.front().target, weights);

        int total_users = 0;
        for (int t : targets) total_users += t;

        run_.started_at = std::chrono::system_clock::now();
        run_.started_steady = std::chrono::steady_clock::now();
        run_.target_host = target.base_url;
        run_.total_users_target = total_users;
        run_.current_user_count.store(0);
        run_.next_user_id.store(0);
        final_snapshot_ = StatsSnapshot{};
        run_.phase.store(RunPhase::Ramping);

        for (const auto& listener : listeners_) {
            try {
                listener->on_test_start(run_.target_host, run_.started_at);
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> log_lock(log_mutex());
                std::cerr << "[Orchestrator] test-start listener failed: " << e.what() << "\n";
            }
        }

        std::lock_guard<std::mutex> pools_lock(pools_mutex_);
        pool_weights_ = weights;
        pool_rates_ = rates;
        for (size_t i = 0; i < loads.size(); ++i) {
            pools_.push_back(create_pool(loads[i].profile, target, stats_, run_, config_));
            pools_.back()->ramp(targets[i], rates[i]);
            pools.push_back(pools_.back().get());
        }
    }

    // Not under the lifecycle lock, so stop() can cut the ramp short.
    std::vector<RampResult> results;
    for (auto* pool : pools) {
        results.push_back(pool->wait_ramped());
    }

    for (const auto& r : results) {
        if (!r.fatal_error.empty()) {
            stop();
            throw ConfigurationError("profile '" + r.profile + "': " + r.fatal_error);
        }
    }

    if (!run_.transition(RunPhase::Ramping, RunPhase::Running)) {
        return;   // stopped while ramping
    }

    std::ostringstream shortfall;
    for (const auto& r : results) {
        if (!r.complete() && !r.cancelled) {
            shortfall << " " << r.profile << " reached " << r.reached << "/" << r.target
                      << " (" << r.spawn_failures << " failed spawns);";
        }
    }
    if (!shortfall.str().empty()) {
        throw PartialRampError("user pools below target:" + shortfall.str());
    }
}

StatsSnapshot Orchestrator::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!run_.transition(RunPhase::Ramping, RunPhase::Stopping)
        && !run_.transition(RunPhase::Running, RunPhase::Stopping)) {
        return final_snapshot_;
    }

    {
        std::lock_guard<std::mutex> run_lock(run_.mutex);
        run_.stop_requested = true;
    }
    run_.changed.notify_all();

    std::vector<UserPool*> pools;
    {
        std::lock_guard<std::mutex> pools_lock(pools_mutex_);
        for (auto& pool : pools_) pools.push_back(pool.get());
    }
    for (auto* pool : pools) {
        pool->cancel_ramp();
    }
    for (auto* pool : pools) {
        pool->stop(config_.stop_mode, config_.stop_timeout);
    }

    run_.phase.store(RunPhase::Stopped);
    final_snapshot_ = stats_.snapshot();

    for (const auto& listener : listeners_) {
        try {
            listener->on_test_stop(final_snapshot_);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> log_lock(log_mutex());
            std::cerr << "[Orchestrator] test-stop listener failed: " << e.what() << "\n";
        }
    }
    run_.notify();
    return final_snapshot_;
}

void Orchestrator::request_stop() {
    {
        std::lock_guard<std::mutex> run_lock(run_.mutex);
        run_.stop_requested = true;
    }
    run_.changed.notify_all();

    std::lock_guard<std::mutex> pools_lock(pools_mutex_);
    for (auto& pool : pools_) {
        pool->cancel_ramp();
    }
}

std::unique_ptr<UserPool> Orchestrator::create_pool(ProfilePtr profile, const TargetDescriptor& target,
                                                    StatsAggregator& stats, RunState& run,
                                                    const RunConfig& config) {
    return std::make_unique<UserPool>(std::move(profile), target, stats, run, config);
}

std::map<std::string, int> Orchestrator::users_by_profile() const {
    std::map<std::string, int> counts;
    std::lock_guard<std::mutex> lock(pools_mutex_);
    for (const auto& pool : pools_) {
        counts[pool->profile_name()] += pool->user_count();
    }
    return counts;
}

void Orchestrator::apply_stage(size_t index) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    const RunPhase current = run_.phase.load();
    if (current != RunPhase::Ramping && current != RunPhase::Running) {
        return;
    }

    const Stage& stage = config_.stages[index];
    {
        std::lock_guard<std::mutex> log_lock(log_mutex());
        std::cout << "[Orchestrator] stage " << index + 1 << "/" << config_.stages.size()
                  << ": moving to " << stage.target << " users\n";
    }

    std::lock_guard<std::mutex> pools_lock(pools_mutex_);
    const std::vector<int> targets = split_population(stage.target, pool_weights_);
    run_.total_users_target = stage.target;
    for (size_t i = 0; i < pools_.size(); ++i) {
        pools_[i]->ramp(targets[i], pool_rates_[i]);
    }
}

// Only a fixed population ends early; a staged run may pass through zero users.
bool Orchestrator::iterations_exhausted() const {
    return config_.stages.empty()
        && run_.phase.load() == RunPhase::Running
        && run_.total_users_target > 0
        && run_.current_user_count.load() == 0;
}

StatsSnapshot Orchestrator::wait_for_completion(std::chrono::milliseconds interval,
                                                const ProgressCallback& progress) {
    using Clock = std::chrono::steady_clock;
    const bool ticking = progress && interval.count() > 0;

    std::optional<Clock::time_point> deadline;
    if (config_.duration) {
        deadline = run_.started_steady + *config_.duration;
    } else if (!config_.stages.empty()) {
        deadline = run_.started_steady + total_duration(config_.stages);
    }
    Clock::time_point next_tick = Clock::now() + interval;

    // Start time of every stage after the first, which start() applied.
    std::vector<Clock::time_point> stage_starts;
    Clock::time_point stage_start = run_.started_steady;
    for (size_t i = 0; i + 1 < config_.stages.size(); ++i) {
        stage_start += config_.stages[i].duration;
        stage_starts.push_back(stage_start);
    }
    size_t next_stage = 0;

    std::unique_lock<std::mutex> lock(run_.mutex);
    while (!run_.stop_requested) {
        const RunPhase current = run_.phase.load();
        if (current == RunPhase::Idle || current == RunPhase::Stopped) break;
        if (iterations_exhausted()) break;

        const auto now = Clock::now();
        if (deadline && now >= *deadline) break;

        if (next_stage < stage_starts.size() && now >= stage_starts[next_stage]) {
            lock.unlock();
            apply_stage(next_stage + 1);
            lock.lock();
            ++next_stage;
            continue;
        }

        if (ticking && now >= next_tick) {
            lock.unlock();
            progress(stats_.snapshot());
            lock.lock();
            next_tick += interval;
            continue;
        }

        std::optional<Clock::time_point> wake = deadline;
        if (ticking && (!wake || next_tick < *wake)) wake = next_tick;
        if (next_stage < stage_starts.size() && (!wake || stage_starts[next_stage] < *wake)) {
            wake = stage_starts[next_stage];
        }

        if (wake) {
            run_.changed.wait_until(lock, *wake);
        } else {
            run_.changed.wait(lock);
        }
    }
    lock.unlock();
    return stop();
}
