#include "wait_time.hpp"

std::chrono::duration<double> WaitTimeProvider::next(double min_s, double max_s) {
    if (max_s <= min_s) {
        return std::chrono::duration<double>(min_s);
    }
    std::uniform_real_distribution<double> dist(min_s, max_s);
    return std::chrono::duration<double>(dist(gen_));
}
