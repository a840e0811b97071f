#pragma once

#include "task_selector.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Where the requests go and what every request carries by default.
 */
struct TargetDescriptor {
    std::string base_url;   // scheme://host[:port]
    std::chrono::milliseconds default_timeout{30000};
    std::multimap<std::string, std::string> default_headers;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;
};

/**
 * @brief Splits and checks a base URL.
 * @throws ConfigurationError if the scheme is not http/https, the host is
 * empty, the port is not a number in 1..65535, or a path is present.
 */
ParsedUrl parse_base_url(const std::string& url);

enum class StopMode {
    Graceful,   // finish the current request, skip the wait
    Immediate   // abort the in-flight request, record it as cancelled
};

const char* to_string(StopMode mode);
StopMode parse_stop_mode(const std::string& text);

/**
 * @brief Population of one profile within a run.
 */
struct PopulationSpec {
    std::string profile;
    int users = 0;
    double spawn_rate = 1.0;   // users started per second
};

/**
 * @brief One step of a staged run: move toward `target` users when the
 * stage begins, then hold for the rest of `duration`.
 */
struct Stage {
    std::chrono::milliseconds duration{0};
    int target = 0;
};

struct Thresholds {
    std::optional<double> max_fail_ratio;
    std::optional<double> max_p95_ms;
};

struct RunConfig {
    std::optional<std::chrono::milliseconds> duration;
    StopMode stop_mode = StopMode::Graceful;
    std::chrono::milliseconds stop_timeout{10000};
    long long max_iterations = 0;   // per user, 0 = unlimited
    int seed = -1;                  // -1 = seed from std::random_device
    TagFilter tags;
    Thresholds thresholds;
    std::vector<Stage> stages;      // empty = one fixed population
};

/**
 * @brief Turns "chat:80,burst,heavy" into per-profile populations.
 *
 * Profiles listed without a count share the users left over by the explicit
 * counts, the first ones taking the remainder. The spawn rate is split in
 * proportion to each population.
 *
 * @throws ConfigurationError on a malformed list or counts above the total.
 */
std::vector<PopulationSpec> distribute_users(const std::string& profile_list, int total_users,
                                             double total_spawn_rate);

std::set<std::string> split_tags(const std::string& csv);

/**
 * @brief Parses "30:100,60:500,20:0" (seconds:users per stage).
 * @throws ConfigurationError on a malformed entry, a non-positive duration or
 * a negative target.
 */
std::vector<Stage> parse_stages(const std::string& csv);

/**
 * @brief Splits total over the given weights, largest share first rounded
 * down and the remainder handed out in order. All-zero weights split evenly.
 */
std::vector<int> split_population(int total, const std::vector<int>& weights);

// Sum of the stage durations.
std::chrono::milliseconds total_duration(const std::vector<Stage>& stages);
