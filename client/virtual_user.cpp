#include "virtual_user.hpp"
#include "errors.hpp"
#include "utils.h"

#include <iostream>

const char* to_string(UserState state) {
    switch (state) {
        case UserState::Starting: return "starting";
        case UserState::Running:  return "running";
        case UserState::Stopping: return "stopping";
        case UserState::Stopped:  return "stopped";
    }
    return "stopped";
}

VirtualUser::VirtualUser(int id,
                         ProfilePtr profile,
                         const TargetDescriptor& target,
                         StatsAggregator& stats,
                         const TagFilter& tags,
                         uint32_t seed,
                         long long max_iterations,
                         FinishedCallback on_finished)
    : id_(id),
      profile_(std::move(profile)),
      stats_(stats),
      executor_(target),
      selector_(profile_->tasks, tags),
      gen_(seed),
      wait_(seed ^ 0x9e3779b9u),
      max_iterations_(max_iterations),
      on_finished_(std::move(on_finished))
{
}

void VirtualUser::run() {
    state_.store(UserState::Starting);
    try {
        if (profile_->on_start) {
            profile_->on_start(session_, gen_);
        }
    } catch (const std::exception& e) {
        start_failed_.store(true);
        {
            std::lock_guard<std::mutex> lock(log_mutex());
            std::cerr << "[User " << id_ << "] on_start of profile '" << profile_->name
                      << "' failed: " << e.what() << "\n";
        }
        finish();
        return;
    }

    if (!stop_.raised()) {
        state_.store(UserState::Running);
        run_loop();
    }

    state_.store(UserState::Stopping);
    try {
        if (profile_->on_stop) {
            profile_->on_stop(session_, gen_);
        }
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << "[User " << id_ << "] on_stop of profile '" << profile_->name
                  << "' failed: " << e.what() << "\n";
    }
    finish();
}

void VirtualUser::run_loop() {
    while (!stop_.raised()) {
        if (max_iterations_ > 0 && iterations_.load() >= max_iterations_) {
            break;
        }

        try {
            run_task(selector_.select(gen_));
        } catch (const NoEligibleTask& e) {
            std::lock_guard<std::mutex> lock(log_mutex());
            std::cerr << "[User " << id_ << "] " << e.what() << ", stopping\n";
            break;
        } catch (const std::exception& e) {
            // A broken request builder must not take the user down.
            std::lock_guard<std::mutex> lock(log_mutex());
            std::cerr << "[User " << id_ << "] task failed: " << e.what() << "\n";
        }
        iterations_++;

        // Graceful stop skips the wait.
        if (stop_.raised()) break;
        if (stop_.wait_for(wait_.next(profile_->wait))) break;
    }
}

void VirtualUser::run_task(const TaskDescriptor& task) {
    for (int attempt = 1; ; ++attempt) {
        RequestSpec spec = task.task->build(session_, gen_);
        if (spec.category.empty()) {
            spec.category = task.name;
        }

        RequestOutcome outcome = executor_.execute(spec);
        Classification verdict = classifier_.classify(outcome, task.task->policy());
        stats_.record(outcome.category, outcome, verdict);
        task.task->on_result(session_, outcome, verdict);

        if (outcome.cancelled() || stop_.raised() || !task.task->should_retry(verdict, attempt)) {
            return;
        }
    }
}

void VirtualUser::request_stop(StopMode mode) {
    stop_.raise();
    if (mode == StopMode::Immediate) {
        executor_.cancel();
    }
}

void VirtualUser::abort_in_flight() {
    executor_.cancel();
}

void VirtualUser::finish() {
    state_.store(UserState::Stopped);
    if (on_finished_) {
        on_finished_(*this);
    }
}
