#pragma once

#include "task.hpp"

#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Tags a run is restricted to. An empty include set means "all".
 */
struct TagFilter {
    std::set<std::string> include;
    std::set<std::string> exclude;

    bool admits(const std::set<std::string>& tags) const;
};

/**
 * @brief Weighted random choice over the tasks a tag filter admits.
 *
 * Built once per virtual user. The candidate list and cumulative weights are
 * fixed at construction; each selection costs one draw and a binary search.
 */
class TaskSelector {
public:
    TaskSelector(const std::vector<TaskDescriptor>& tasks, const TagFilter& filter);

    /**
     * @brief Picks a task using one uniform draw from gen.
     * @throws NoEligibleTask if the filter admitted no task.
     */
    const TaskDescriptor& select(std::mt19937& gen) const;

    /**
     * @brief Maps a draw in [0, total_weight()) to a task. Deterministic.
     * @throws NoEligibleTask if the filter admitted no task.
     * @throws std::out_of_range if draw is outside the weight range.
     */
    const TaskDescriptor& pick(uint64_t draw) const;

    uint64_t total_weight() const { return cumulative_.empty() ? 0 : cumulative_.back(); }
    size_t eligible_count() const { return candidates_.size(); }
    bool empty() const { return candidates_.empty(); }

private:
    std::vector<const TaskDescriptor*> candidates_;
    std::vector<uint64_t> cumulative_;
};
