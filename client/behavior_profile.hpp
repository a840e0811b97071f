#pragma once

#include "task.hpp"
#include "task_selector.hpp"
#include "wait_time.hpp"

#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

/**
 * @brief A named, weighted set of tasks plus lifecycle hooks and wait bounds.
 *
 * Built by the profile factories in profiles/ and frozen (shared as
 * std::shared_ptr<const BehaviorProfile>) once a run starts.
 */
struct BehaviorProfile {
    using Hook = std::function<void(SessionState&, std::mt19937&)>;

    std::string name;
    std::vector<TaskDescriptor> tasks;
    WaitRange wait;
    Hook on_start;
    Hook on_stop;

    BehaviorProfile& add_task(std::string task_name, int weight, std::shared_ptr<const ITask> task,
                              std::set<std::string> tags = {});

    /**
     * @brief Rejects profiles no user could run.
     * @throws ConfigurationError on an empty task set, a non-positive weight,
     * a bad wait range, or a filter that leaves nothing to select.
     */
    void validate(const TagFilter& filter) const;
};

using ProfilePtr = std::shared_ptr<const BehaviorProfile>;
