#include "utils.h"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

namespace {
    void write_rollup(std::ostringstream& ss, const StatsRollup& r) {
        ss << "{"
           << "\"name\": \"" << json_escape(r.category) << "\", "
           << "\"requests\": " << r.count << ", "
           << "\"failures\": " << r.failure_count << ", "
           << "\"expected_failures\": " << r.expected_failure_count << ", "
           << "\"cancelled\": " << r.cancelled_count << ", "
           << "\"failure_rate\": " << r.failure_rate << ", "
           << "\"avg_response_ms\": " << r.avg_latency_ms << ", "
           << "\"min_response_ms\": " << r.min_latency_ms << ", "
           << "\"max_response_ms\": " << r.max_latency_ms << ", "
           << "\"median_response_ms\": " << r.median_latency_ms << ", "
           << "\"p95_response_ms\": " << r.p95_latency_ms << ", "
           << "\"p99_response_ms\": " << r.p99_latency_ms << ", "
           << "\"avg_content_length\": " << r.avg_content_length << ", "
           << "\"throughput\": " << r.throughput_per_sec
           << "}";
    }
}

// Append a TestResult as a JSON object to a results file that contains a JSON array.
// If the file doesn't exist, it will be created with a single-element array.
void append_result_to_file(const TestResult& r, const std::string& path) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "{"
       << "\"target\": \"" << json_escape(r.target_host) << "\", "
       << "\"users\": " << r.users << ", "
       << "\"profiles\": \"" << json_escape(r.profiles) << "\", "
       << "\"duration_sec\": " << r.duration_sec << ", "
       << "\"total\": ";
    write_rollup(ss, r.stats.total);
    ss << ", \"categories\": [";
    bool first = true;
    for (const auto& kv : r.stats.categories) {
        if (!first) ss << ", ";
        first = false;
        write_rollup(ss, kv.second);
    }
    ss << "], \"errors\": [";
    first = true;
    for (const auto& e : r.stats.errors) {
        if (!first) ss << ", ";
        first = false;
        ss << "{\"name\": \"" << json_escape(e.category) << "\", "
           << "\"reason\": \"" << json_escape(e.reason) << "\", "
           << "\"occurrences\": " << e.occurrences << "}";
    }
    ss << "]}";

    std::string obj = ss.str();

    // Read existing file (if any)
    std::ifstream in(path);
    if (!in.good()) {
        std::ofstream out(path, std::ios::trunc);
        if (!out) throw std::runtime_error("cannot write " + path);
        out << "[" << obj << "]\n";
        return;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    while (!content.empty() && isspace(static_cast<unsigned char>(content.back()))) content.pop_back();

    size_t first_non_ws = content.find_first_not_of(" \t\n\r");
    size_t last_bracket = content.find_last_of(']');

    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write " + path);

    // Missing, malformed or non-array content is overwritten.
    if (first_non_ws == std::string::npos || content[first_non_ws] != '['
        || last_bracket == std::string::npos) {
        out << "[" << obj << "]\n";
        return;
    }

    bool array_empty = true;
    for (size_t i = first_non_ws + 1; i < last_bracket; ++i) {
        if (!isspace(static_cast<unsigned char>(content[i]))) { array_empty = false; break; }
    }

    if (array_empty) {
        out << "[" << obj << "]\n";
    } else {
        out << content.substr(0, last_bracket) << ",\n" << obj << "]\n";
    }
}

namespace {
    std::string csv_field(const std::string& s) {
        if (s.find_first_of(",\"\n") == std::string::npos) return s;
        std::string out = "\"";
        for (char c : s) {
            if (c == '"') out += '"';
            out += c;
        }
        return out + "\"";
    }

    void write_csv_row(std::ofstream& out, const StatsRollup& r) {
        out << csv_field(r.category) << ","
            << r.count << "," << r.failure_count << ","
            << r.median_latency_ms << "," << r.avg_latency_ms << ","
            << r.min_latency_ms << "," << r.max_latency_ms << ","
            << r.avg_content_length << "," << r.throughput_per_sec << ","
            << r.p95_latency_ms << "," << r.p99_latency_ms << "\n";
    }
}

void write_csv_reports(const StatsSnapshot& snap, const std::string& prefix) {
    std::ofstream stats(prefix + "_stats.csv", std::ios::trunc);
    if (!stats) throw std::runtime_error("cannot write " + prefix + "_stats.csv");
    stats << std::fixed << std::setprecision(2);
    stats << "Name,Request Count,Failure Count,Median Response Time,Average Response Time,"
             "Min Response Time,Max Response Time,Average Content Size,Requests/s,95%,99%\n";
    for (const auto& kv : snap.categories) {
        write_csv_row(stats, kv.second);
    }
    write_csv_row(stats, snap.total);

    std::ofstream failures(prefix + "_failures.csv", std::ios::trunc);
    if (!failures) throw std::runtime_error("cannot write " + prefix + "_failures.csv");
    failures << "Name,Error,Occurrences\n";
    for (const auto& e : snap.errors) {
        failures << csv_field(e.category) << "," << csv_field(e.reason) << "," << e.occurrences << "\n";
    }
}

void print_stats_table(std::ostream& out, const StatsSnapshot& snap) {
    std::ios_base::fmtflags saved = out.flags();
    out << std::fixed << std::setprecision(2);
    out << std::left << std::setw(36) << "Name"
        << std::right << std::setw(9) << "# reqs"
        << std::setw(9) << "# fails"
        << std::setw(10) << "Avg"
        << std::setw(10) << "Min"
        << std::setw(10) << "Max"
        << std::setw(10) << "p95"
        << std::setw(10) << "req/s" << "\n";

    auto row = [&out](const StatsRollup& r) {
        out << std::left << std::setw(36) << r.category
            << std::right << std::setw(9) << r.count
            << std::setw(9) << r.failure_count
            << std::setw(10) << r.avg_latency_ms
            << std::setw(10) << r.min_latency_ms
            << std::setw(10) << r.max_latency_ms
            << std::setw(10) << r.p95_latency_ms
            << std::setw(10) << r.throughput_per_sec << "\n";
    };
    for (const auto& kv : snap.categories) row(kv.second);
    out << std::string(104, '-') << "\n";
    row(snap.total);

    if (!snap.errors.empty()) {
        out << "\nErrors:\n";
        for (const auto& e : snap.errors) {
            out << "  " << e.occurrences << "x " << e.category << ": " << e.reason << "\n";
        }
    }
    out.flags(saved);
}

std::vector<std::string> threshold_violations(const StatsSnapshot& snap, const Thresholds& limits) {
    std::vector<std::string> violations;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (limits.max_fail_ratio && snap.total.failure_rate > *limits.max_fail_ratio) {
        ss.str("");
        ss << "failure ratio " << snap.total.failure_rate << " > " << *limits.max_fail_ratio;
        violations.push_back(ss.str());
    }
    if (limits.max_p95_ms && snap.total.p95_latency_ms > *limits.max_p95_ms) {
        ss.str("");
        ss << "p95 response time " << snap.total.p95_latency_ms << " ms > " << *limits.max_p95_ms << " ms";
        violations.push_back(ss.str());
    }
    return violations;
}
