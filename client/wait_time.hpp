#pragma once

#include <chrono>
#include <cstdint>
#include <random>

/**
 * @brief Bounds, in seconds, of the pause a user takes between tasks.
 */
struct WaitRange {
    double min_s = 0.0;
    double max_s = 0.0;
};

/**
 * @brief Produces uniformly distributed pauses.
 *
 * Each virtual user owns one provider with its own generator so that users
 * sharing a profile do not fire in lockstep and never contend on shared
 * random state.
 */
class WaitTimeProvider {
    std::mt19937 gen_;
public:
    explicit WaitTimeProvider(uint32_t seed) : gen_(seed) {}

    std::chrono::duration<double> next(double min_s, double max_s);
    std::chrono::duration<double> next(const WaitRange& range) { return next(range.min_s, range.max_s); }
};
