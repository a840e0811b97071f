#pragma once

#include "outcome.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Running numbers for one category. Mutated only by StatsAggregator.
 */
struct StatEntry {
    long long count = 0;
    long long failures = 0;
    long long expected_failures = 0;
    long long cancelled = 0;

    // Latency is tracked for every outcome except cancelled ones.
    long long timed = 0;
    double latency_sum_ms = 0.0;
    double min_latency_ms = 0.0;
    double max_latency_ms = 0.0;
    std::map<long long, long long> histogram;   // rounded ms -> occurrences
    unsigned long long content_length_sum = 0;

    void add(const RequestOutcome& outcome, const Classification& verdict);
    void merge(const StatEntry& other);

    /**
     * @brief Latency at the given fraction (0..1] of timed samples, from the
     * rounded histogram. 0 when nothing was timed.
     */
    double percentile(double fraction) const;
};

/**
 * @brief Histogram bucket for a latency: exact below 100 ms, then two
 * significant digits.
 */
long long round_latency_ms(double latency_ms);

struct StatsRollup {
    std::string category;
    long long count = 0;
    long long failure_count = 0;
    long long expected_failure_count = 0;
    long long cancelled_count = 0;
    double failure_rate = 0.0;
    double avg_latency_ms = 0.0;
    double min_latency_ms = 0.0;
    double max_latency_ms = 0.0;
    double median_latency_ms = 0.0;
    double p95_latency_ms = 0.0;
    double p99_latency_ms = 0.0;
    double avg_content_length = 0.0;
    double throughput_per_sec = 0.0;
};

struct ErrorEntry {
    std::string category;
    std::string reason;
    long long occurrences = 0;
};

struct StatsSnapshot {
    std::map<std::string, StatsRollup> categories;
    StatsRollup total;   // category "Aggregated"
    std::vector<ErrorEntry> errors;
    double elapsed_s = 0.0;
};

/**
 * @brief The single statistics sink of a run, fed by every virtual user.
 *
 * Categories are spread over N shards, each with its own mutex, so writers
 * recording different categories rarely contend. A snapshot locks one shard
 * at a time, only for as long as it takes to copy it.
 */
class StatsAggregator {
public:
    static constexpr const char* kTotalCategory = "Aggregated";

    explicit StatsAggregator(size_t shard_count = 16);

    void record(const std::string& category, const RequestOutcome& outcome,
                const Classification& verdict);

    StatsSnapshot snapshot() const;

    /**
     * @brief Drops every entry and restarts the throughput clock.
     */
    void reset();

    long long total_count() const;

private:
    struct Shard {
        mutable std::mutex mutex_;
        std::unordered_map<std::string, StatEntry> entries_;
        std::map<std::pair<std::string, std::string>, long long> errors_;
    };

    Shard& shard_for(const std::string& category);

    static StatsRollup rollup(const std::string& category, const StatEntry& entry, double elapsed_s);

    std::vector<std::unique_ptr<Shard>> shards_;
    std::hash<std::string> hasher_;
    std::atomic<int64_t> started_ns_;
};
