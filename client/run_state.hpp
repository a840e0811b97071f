#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

enum class RunPhase {
    Idle,
    Ramping,
    Running,
    Stopping,
    Stopped
};

const char* to_string(RunPhase phase);

/**
 * @brief State of one test execution, owned by the Orchestrator and
 * referenced by its user pools.
 */
struct RunState {
    std::atomic<RunPhase> phase{RunPhase::Idle};
    std::chrono::system_clock::time_point started_at;
    std::chrono::steady_clock::time_point started_steady;
    std::string target_host;
    int total_users_target = 0;
    std::atomic<int> current_user_count{0};
    std::atomic<int> next_user_id{0};

    // Signalled whenever users finish or a stop is requested.
    std::mutex mutex;
    std::condition_variable changed;
    bool stop_requested = false;

    /**
     * @brief Moves from `from` to `to` atomically. False if the phase was
     * something else.
     */
    bool transition(RunPhase from, RunPhase to) {
        return phase.compare_exchange_strong(from, to);
    }

    void notify() {
        { std::lock_guard<std::mutex> lock(mutex); }
        changed.notify_all();
    }
};
