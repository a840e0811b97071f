#include "stats_aggregator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace {
    int64_t steady_now_ns() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }
}

long long round_latency_ms(double latency_ms) {
    if (latency_ms < 0.0) latency_ms = 0.0;
    if (latency_ms < 100.0) return std::llround(latency_ms);
    if (latency_ms < 1000.0) return std::llround(latency_ms / 10.0) * 10;
    if (latency_ms < 10000.0) return std::llround(latency_ms / 100.0) * 100;
    return std::llround(latency_ms / 1000.0) * 1000;
}

void StatEntry::add(const RequestOutcome& outcome, const Classification& verdict) {
    count++;
    if (outcome.cancelled()) {
        cancelled++;
        return;
    }

    if (verdict.verdict == Verdict::Failure) {
        failures++;
    } else if (verdict.verdict == Verdict::ExpectedFailure) {
        expected_failures++;
    }

    if (timed == 0) {
        min_latency_ms = outcome.latency_ms;
        max_latency_ms = outcome.latency_ms;
    } else {
        min_latency_ms = std::min(min_latency_ms, outcome.latency_ms);
        max_latency_ms = std::max(max_latency_ms, outcome.latency_ms);
    }
    timed++;
    latency_sum_ms += outcome.latency_ms;
    histogram[round_latency_ms(outcome.latency_ms)]++;
    content_length_sum += outcome.body_length;
}

void StatEntry::merge(const StatEntry& other) {
    if (other.timed > 0) {
        if (timed == 0) {
            min_latency_ms = other.min_latency_ms;
            max_latency_ms = other.max_latency_ms;
        } else {
            min_latency_ms = std::min(min_latency_ms, other.min_latency_ms);
            max_latency_ms = std::max(max_latency_ms, other.max_latency_ms);
        }
    }
    count += other.count;
    failures += other.failures;
    expected_failures += other.expected_failures;
    cancelled += other.cancelled;
    timed += other.timed;
    latency_sum_ms += other.latency_sum_ms;
    content_length_sum += other.content_length_sum;
    for (const auto& bucket : other.histogram) {
        histogram[bucket.first] += bucket.second;
    }
}

double StatEntry::percentile(double fraction) const {
    if (timed == 0) return 0.0;
    long long rank = static_cast<long long>(std::ceil(fraction * static_cast<double>(timed)));
    rank = std::max(1LL, std::min(rank, timed));

    long long seen = 0;
    for (const auto& bucket : histogram) {
        seen += bucket.second;
        if (seen >= rank) return static_cast<double>(bucket.first);
    }
    return static_cast<double>(histogram.rbegin()->first);
}

StatsAggregator::StatsAggregator(size_t shard_count)
    : started_ns_(steady_now_ns())
{
    if (shard_count == 0) {
        throw std::invalid_argument("Shard count must be greater than 0");
    }
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.emplace_back(std::make_unique<Shard>());
    }
}

StatsAggregator::Shard& StatsAggregator::shard_for(const std::string& category) {
    return *shards_[hasher_(category) % shards_.size()];
}

void StatsAggregator::record(const std::string& category, const RequestOutcome& outcome,
                             const Classification& verdict) {
    Shard& shard = shard_for(category);
    std::lock_guard<std::mutex> lock(shard.mutex_);
    shard.entries_[category].add(outcome, verdict);
    if (verdict.verdict == Verdict::Failure && !outcome.cancelled()) {
        shard.errors_[{category, verdict.reason}]++;
    }
}

StatsRollup StatsAggregator::rollup(const std::string& category, const StatEntry& entry, double elapsed_s) {
    StatsRollup r;
    r.category = category;
    r.count = entry.count;
    r.failure_count = entry.failures;
    r.expected_failure_count = entry.expected_failures;
    r.cancelled_count = entry.cancelled;
    if (entry.count > 0) {
        r.failure_rate = static_cast<double>(entry.failures) / static_cast<double>(entry.count);
    }
    if (entry.timed > 0) {
        r.avg_latency_ms = entry.latency_sum_ms / static_cast<double>(entry.timed);
        r.min_latency_ms = entry.min_latency_ms;
        r.max_latency_ms = entry.max_latency_ms;
        r.median_latency_ms = entry.percentile(0.50);
        r.p95_latency_ms = entry.percentile(0.95);
        r.p99_latency_ms = entry.percentile(0.99);
        r.avg_content_length = static_cast<double>(entry.content_length_sum) / static_cast<double>(entry.timed);
    }
    if (elapsed_s > 0.0) {
        r.throughput_per_sec = static_cast<double>(entry.count) / elapsed_s;
    }
    return r;
}

StatsSnapshot StatsAggregator::snapshot() const {
    std::map<std::string, StatEntry> copied;
    std::map<std::pair<std::string, std::string>, long long> errors;

    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex_);
        for (const auto& kv : shard->entries_) {
            copied.emplace(kv.first, kv.second);
        }
        for (const auto& kv : shard->errors_) {
            errors[kv.first] += kv.second;
        }
    }

    StatsSnapshot snap;
    snap.elapsed_s = static_cast<double>(steady_now_ns() - started_ns_.load()) / 1e9;

    StatEntry total;
    for (const auto& kv : copied) {
        snap.categories.emplace(kv.first, rollup(kv.first, kv.second, snap.elapsed_s));
        total.merge(kv.second);
    }
    snap.total = rollup(kTotalCategory, total, snap.elapsed_s);

    for (const auto& kv : errors) {
        snap.errors.push_back(ErrorEntry{kv.first.first, kv.first.second, kv.second});
    }
    std::sort(snap.errors.begin(), snap.errors.end(), [](const ErrorEntry& a, const ErrorEntry& b) {
        return a.occurrences > b.occurrences;
    });
    return snap;
}

void StatsAggregator::reset() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex_);
        shard->entries_.clear();
        shard->errors_.clear();
    }
    started_ns_.store(steady_now_ns());
}

long long StatsAggregator::total_count() const {
    long long total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex_);
        for (const auto& kv : shard->entries_) {
            total += kv.second.count;
        }
    }
    return total;
}
