#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief One-shot stop flag whose waits wake up as soon as it is raised.
 */
class StopSignal {
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool raised_ = false;
public:
    void raise() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            raised_ = true;
        }
        cv_.notify_all();
    }

    bool raised() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return raised_;
    }

    /**
     * @brief Sleeps for up to d. Returns true if the signal was raised.
     */
    template <class Rep, class Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& d) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, d, [this] { return raised_; });
    }
};
