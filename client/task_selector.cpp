#include "task_selector.hpp"
#include "errors.hpp"

#include <algorithm>
#include <stdexcept>

bool TagFilter::admits(const std::set<std::string>& tags) const {
    for (const auto& tag : tags) {
        if (exclude.count(tag)) return false;
    }
    if (include.empty() || tags.empty()) return true;
    for (const auto& tag : tags) {
        if (include.count(tag)) return true;
    }
    return false;
}

TaskSelector::TaskSelector(const std::vector<TaskDescriptor>& tasks, const TagFilter& filter) {
    uint64_t running = 0;
    for (const auto& t : tasks) {
        if (t.weight <= 0 || !filter.admits(t.tags)) continue;
        running += static_cast<uint64_t>(t.weight);
        candidates_.push_back(&t);
        cumulative_.push_back(running);
    }
}

const TaskDescriptor& TaskSelector::select(std::mt19937& gen) const {
    if (candidates_.empty()) {
        throw NoEligibleTask("no task matches the active tag filter");
    }
    std::uniform_int_distribution<uint64_t> dist(0, total_weight() - 1);
    return pick(dist(gen));
}

const TaskDescriptor& TaskSelector::pick(uint64_t draw) const {
    if (candidates_.empty()) {
        throw NoEligibleTask("no task matches the active tag filter");
    }
    if (draw >= total_weight()) {
        throw std::out_of_range("draw " + std::to_string(draw) + " outside total weight "
                                + std::to_string(total_weight()));
    }
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), draw);
    return *candidates_[static_cast<size_t>(it - cumulative_.begin())];
}
