#include "behavior_profile.hpp"
#include "errors.hpp"

#include <utility>

BehaviorProfile& BehaviorProfile::add_task(std::string task_name, int weight,
                                           std::shared_ptr<const ITask> task,
                                           std::set<std::string> tags) {
    tasks.push_back(TaskDescriptor{std::move(task_name), weight, std::move(tags), std::move(task)});
    return *this;
}

void BehaviorProfile::validate(const TagFilter& filter) const {
    if (name.empty()) {
        throw ConfigurationError("profile has no name");
    }
    if (tasks.empty()) {
        throw ConfigurationError("profile '" + name + "' has no tasks");
    }
    for (const auto& t : tasks) {
        if (!t.task) {
            throw ConfigurationError("profile '" + name + "': task '" + t.name + "' has no implementation");
        }
        if (t.weight <= 0) {
            throw ConfigurationError("profile '" + name + "': task '" + t.name + "' needs a positive weight");
        }
    }
    if (wait.min_s < 0.0 || wait.max_s < wait.min_s) {
        throw ConfigurationError("profile '" + name + "': invalid wait range");
    }
    if (TaskSelector(tasks, filter).empty()) {
        throw ConfigurationError("profile '" + name + "': no task matches the tag filter");
    }
}
