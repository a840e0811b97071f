#include "console_reporter.hpp"
#include "utils.h"

#include <ctime>
#include <iomanip>

void ConsoleReporter::on_test_start(const std::string& target_host,
                                    std::chrono::system_clock::time_point timestamp) {
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::lock_guard<std::mutex> lock(log_mutex());
    out_ << "Load test starting...\n"
         << "   Target host: " << target_host << "\n"
         << "   Started:     " << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ") << "\n\n";
}

void ConsoleReporter::on_test_stop(const StatsSnapshot& final_snapshot) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ios_base::fmtflags saved = out_.flags();
    out_ << "\nLoad test completed!\n"
         << std::fixed << std::setprecision(2)
         << "Total requests:        " << final_snapshot.total.count << "\n"
         << "Total failures:        " << final_snapshot.total.failure_count << "\n"
         << "Average response time: " << final_snapshot.total.avg_latency_ms << "ms\n"
         << "Requests per second:   " << final_snapshot.total.throughput_per_sec << "\n\n";
    out_.flags(saved);
    print_stats_table(out_, final_snapshot);
    out_.flush();
}
