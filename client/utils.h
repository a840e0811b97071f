#pragma once

#include "TestResults.hpp"
#include "run_config.hpp"
#include "stats_aggregator.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

// Serializes console output from concurrent threads.
std::mutex& log_mutex();

std::string json_escape(const std::string& s);

void append_result_to_file(const TestResult& r, const std::string& path);

/**
 * @brief Writes <prefix>_stats.csv and <prefix>_failures.csv.
 */
void write_csv_reports(const StatsSnapshot& snap, const std::string& prefix);

void print_stats_table(std::ostream& out, const StatsSnapshot& snap);

/**
 * @brief Human-readable descriptions of every threshold the aggregated row breaks.
 */
std::vector<std::string> threshold_violations(const StatsSnapshot& snap, const Thresholds& limits);
