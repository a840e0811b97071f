#include "user_pool.hpp"
#include "errors.hpp"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <system_error>

UserPool::UserPool(ProfilePtr profile,
                   const TargetDescriptor& target,
                   StatsAggregator& stats,
                   RunState& run,
                   const RunConfig& config)
    : profile_(std::move(profile)),
      target_(target),
      stats_(stats),
      run_(run),
      config_(config)
{
}

UserPool::~UserPool() {
    stop(StopMode::Immediate, std::chrono::milliseconds(0));
}

void UserPool::ramp(int target_count, double spawn_rate) {
    if (target_count < 0) {
        throw ConfigurationError("profile '" + profile_->name + "': negative user target");
    }
    if (target_count > 0 && (!std::isfinite(spawn_rate) || spawn_rate <= 0.0)) {
        throw ConfigurationError("profile '" + profile_->name + "': spawn rate must be a positive number");
    }

    cancel_ramp();
    join_ramp();

    auto cancel = std::make_shared<StopSignal>();
    {
        std::lock_guard<std::mutex> lock(ramp_mutex_);
        ramp_cancel_ = cancel;
        ramp_done_ = false;
        ramp_result_ = RampResult{profile_->name, target_count, 0, 0, false};
    }
    ramp_thread_ = std::thread(&UserPool::ramp_loop, this, target_count, spawn_rate, cancel);
}

void UserPool::ramp_loop(int target_count, double spawn_rate, std::shared_ptr<StopSignal> cancel) {
    RampResult result{profile_->name, target_count, 0, 0, false};

    int current = user_count();
    if (current > target_count) {
        retire_newest(current - target_count);
    } else {
        const std::chrono::duration<double> interval(1.0 / spawn_rate);
        while (current < target_count) {
            if (cancel->raised()) {
                result.cancelled = true;
                break;
            }
            if (!spawn_with_retries(*cancel, result)) {
                break;
            }
            ++current;
            if (current < target_count && cancel->wait_for(interval)) {
                result.cancelled = true;
                break;
            }
        }
    }
    result.reached = user_count();

    {
        std::lock_guard<std::mutex> lock(ramp_mutex_);
        ramp_result_ = result;
        ramp_done_ = true;
    }
    ramp_cv_.notify_all();
}

bool UserPool::spawn_with_retries(StopSignal& cancel, RampResult& result) {
    for (int attempt = 1; attempt <= kMaxSpawnAttempts; ++attempt) {
        try {
            spawn_one();
            return true;
        } catch (const ConfigurationError& e) {
            result.fatal_error = e.what();
            std::lock_guard<std::mutex> lock(log_mutex());
            std::cerr << "[Pool " << profile_->name << "] cannot create users: " << e.what() << "\n";
            return false;
        } catch (const std::exception& e) {
            result.spawn_failures++;
            std::lock_guard<std::mutex> lock(log_mutex());
            std::cerr << "[Pool " << profile_->name << "] spawn attempt " << attempt << "/"
                      << kMaxSpawnAttempts << " failed: " << e.what() << "\n";
        }
        if (cancel.wait_for(std::chrono::milliseconds(100))) {
            result.cancelled = true;
            return false;
        }
    }
    return false;
}

std::unique_ptr<VirtualUser> UserPool::create_user(int id, uint32_t seed) {
    return std::make_unique<VirtualUser>(id, profile_, target_, stats_, config_.tags, seed,
                                         config_.max_iterations,
                                         [this](const VirtualUser&) { on_user_finished(); });
}

void UserPool::spawn_one() {
    const int id = run_.next_user_id++;
    const uint32_t seed = config_.seed == -1
        ? std::random_device{}()
        : static_cast<uint32_t>(config_.seed) + static_cast<uint32_t>(id);

    std::unique_ptr<VirtualUser> user = create_user(id, seed);
    VirtualUser* raw = user.get();

    std::lock_guard<std::mutex> lock(mutex_);
    users_.push_back(Slot{std::move(user), std::thread()});
    try {
        users_.back().thread = std::thread(&VirtualUser::run, raw);
    } catch (const std::system_error&) {
        users_.pop_back();
        throw;
    }
    run_.current_user_count++;
}

void UserPool::retire_newest(int count) {
    std::vector<Slot> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = std::min<int>(count, static_cast<int>(users_.size()));
        for (int i = 0; i < count; ++i) {
            retired.push_back(std::move(users_.back()));
            users_.pop_back();
        }
    }

    std::vector<VirtualUser*> users;
    for (auto& slot : retired) users.push_back(slot.user.get());
    stop_users(users, config_.stop_mode, config_.stop_timeout);

    for (auto& slot : retired) {
        if (slot.thread.joinable()) slot.thread.join();
    }
}

void UserPool::on_user_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_.current_user_count--;
    }
    users_cv_.notify_all();
    run_.notify();
}

RampResult UserPool::wait_ramped() {
    std::unique_lock<std::mutex> lock(ramp_mutex_);
    ramp_cv_.wait(lock, [this] { return ramp_done_; });
    return ramp_result_;
}

void UserPool::cancel_ramp() {
    std::lock_guard<std::mutex> lock(ramp_mutex_);
    if (ramp_cancel_) ramp_cancel_->raise();
}

void UserPool::join_ramp() {
    if (ramp_thread_.joinable()) ramp_thread_.join();
}

void UserPool::stop_users(const std::vector<VirtualUser*>& users, StopMode mode,
                          std::chrono::milliseconds grace) {
    for (auto* user : users) {
        user->request_stop(mode);
    }

    auto all_stopped = [&users] {
        return std::all_of(users.begin(), users.end(), [](const VirtualUser* u) {
            return u->state() == UserState::Stopped;
        });
    };

    std::unique_lock<std::mutex> lock(mutex_);
    if (users_cv_.wait_for(lock, grace, all_stopped)) {
        return;
    }
    lock.unlock();

    int stragglers = static_cast<int>(std::count_if(users.begin(), users.end(), [](const VirtualUser* u) {
        return u->state() != UserState::Stopped;
    }));
    {
        std::lock_guard<std::mutex> log_lock(log_mutex());
        std::cerr << "[Pool " << profile_->name << "] " << stragglers
                  << " user(s) still busy after the stop timeout, aborting their requests\n";
    }

    // A cancel can land just before a request opens its socket and miss it,
    // so aborts repeat until every user is down.
    for (;;) {
        for (auto* user : users) {
            if (user->state() != UserState::Stopped) {
                user->abort_in_flight();
            }
        }
        lock.lock();
        if (users_cv_.wait_for(lock, kAbortRetryInterval, all_stopped)) {
            return;
        }
        lock.unlock();
    }
}

void UserPool::stop(StopMode mode, std::chrono::milliseconds grace) {
    cancel_ramp();
    join_ramp();

    std::vector<Slot> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.swap(users_);
    }

    std::vector<VirtualUser*> users;
    for (auto& slot : finished) users.push_back(slot.user.get());
    stop_users(users, mode, grace);

    for (auto& slot : finished) {
        if (slot.thread.joinable()) slot.thread.join();
    }
}

int UserPool::user_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(users_.size());
}

int UserPool::active_users() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(users_.begin(), users_.end(), [](const Slot& s) {
        return s.user->state() != UserState::Stopped;
    }));
}
