#pragma once

#include "stats_aggregator.hpp"

#include <string>

struct TestResult {
    std::string target_host;
    int users;
    std::string profiles;      // as given on the command line
    double duration_sec;       // wall time from start to final snapshot
    StatsSnapshot stats;
};
