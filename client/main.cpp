#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "console_reporter.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "profiles/profile_registry.hpp"
#include "run_config.hpp"
#include "TestResults.hpp"
#include "utils.h"

namespace {

struct CliOptions {
    TargetDescriptor target;
    RunConfig run;
    int users = 0;
    double spawn_rate = 1.0;
    std::string profiles;
    std::string json_path = "results.json";
    std::string csv_prefix;
    int print_interval_sec = 2;
};

void print_usage(const char* prog, const ProfileRegistry& registry) {
    std::cerr << "Usage: " << prog
              << " <base_url> <users> <spawn_rate> <duration_sec> <profiles> [seed] [--flags]\n"
              << "Profiles: comma list of name or name:users. Known:";
    for (const auto& n : registry.names()) std::cerr << " " << n;
    std::cerr << "\n"
              << "Flags:\n"
              << "  --tags=a,b            only run tasks carrying one of these tags\n"
              << "  --exclude-tags=a,b    never run tasks carrying these tags\n"
              << "  --stop-mode=graceful|immediate\n"
              << "  --stop-timeout=SEC    grace period for users to stop (default 10)\n"
              << "  --iterations=N        tasks per user before it stops (default unlimited)\n"
              << "  --timeout=SEC         default request timeout (default 30)\n"
              << "  --header=Name:Value   default request header, repeatable\n"
              << "  --json=PATH           results file (default results.json, empty disables)\n"
              << "  --csv=PREFIX          write PREFIX_stats.csv and PREFIX_failures.csv\n"
              << "  --max-fail-ratio=R    exit with 2 if the failure ratio exceeds R\n"
              << "  --max-p95-ms=MS       exit with 2 if the p95 response time exceeds MS\n"
              << "  --print-interval=SEC  stats line every SEC seconds, 0 disables (default 2)\n"
              << "  --stages=SEC:USERS,.. move to USERS at the start of each stage; users then\n"
              << "                        only weight the profiles, the run ends after the last stage\n"
              << "Duration 0 runs until interrupted, or until the last stage ends.\n"
              << "Example: " << prog << " http://localhost:3000 100 10 300 chat:80,burst:10,heavy:10\n"
              << "Example (fixed seed): " << prog << " http://localhost:3000 20 5 60 site 12345 --tags=chat\n";
}

void apply_flag(CliOptions& opts, const std::string& arg) {
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
        throw std::invalid_argument("malformed flag '" + arg + "'");
    }
    const std::string key = arg.substr(2, eq - 2);
    const std::string value = arg.substr(eq + 1);

    if (key == "tags") {
        opts.run.tags.include = split_tags(value);
    } else if (key == "exclude-tags") {
        opts.run.tags.exclude = split_tags(value);
    } else if (key == "stop-mode") {
        opts.run.stop_mode = parse_stop_mode(value);
    } else if (key == "stop-timeout") {
        opts.run.stop_timeout = std::chrono::milliseconds(static_cast<long long>(std::stod(value) * 1000));
    } else if (key == "iterations") {
        opts.run.max_iterations = std::stoll(value);
    } else if (key == "timeout") {
        opts.target.default_timeout = std::chrono::milliseconds(static_cast<long long>(std::stod(value) * 1000));
    } else if (key == "header") {
        auto colon = value.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw std::invalid_argument("header must look like Name:Value");
        }
        std::string header_value = value.substr(colon + 1);
        while (!header_value.empty() && header_value.front() == ' ') header_value.erase(0, 1);
        opts.target.default_headers.emplace(value.substr(0, colon), header_value);
    } else if (key == "json") {
        opts.json_path = value;
    } else if (key == "csv") {
        opts.csv_prefix = value;
    } else if (key == "max-fail-ratio") {
        opts.run.thresholds.max_fail_ratio = std::stod(value);
    } else if (key == "max-p95-ms") {
        opts.run.thresholds.max_p95_ms = std::stod(value);
    } else if (key == "stages") {
        opts.run.stages = parse_stages(value);
    } else if (key == "print-interval") {
        opts.print_interval_sec = std::stoi(value);
    } else {
        throw std::invalid_argument("unknown flag '--" + key + "'");
    }
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            apply_flag(opts, a);
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() != 5 && positional.size() != 6) {
        throw std::invalid_argument("expected 5 or 6 positional arguments");
    }

    opts.target.base_url = positional[0];
    opts.users = std::stoi(positional[1]);
    opts.spawn_rate = std::stod(positional[2]);
    int duration_sec = std::stoi(positional[3]);
    if (duration_sec < 0) {
        throw std::invalid_argument("duration must not be negative");
    }
    if (duration_sec > 0) {
        opts.run.duration = std::chrono::seconds(duration_sec);
    }
    opts.profiles = positional[4];
    if (positional.size() == 6) {
        opts.run.seed = std::stoi(positional[5]);
    }
    return opts;
}

void print_progress(const StatsSnapshot& snap, const Orchestrator& orch) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ios_base::fmtflags saved = std::cout.flags();
    std::cout << std::fixed << std::setprecision(2)
              << "[" << std::setw(7) << snap.elapsed_s << "s] "
              << to_string(orch.phase()) << ", users " << orch.current_users();
    const auto by_profile = orch.users_by_profile();
    if (by_profile.size() > 1) {
        const char* sep = " (";
        for (const auto& kv : by_profile) {
            std::cout << sep << kv.first << " " << kv.second;
            sep = ", ";
        }
        std::cout << ")";
    }
    std::cout << ", reqs " << snap.total.count
              << ", fails " << snap.total.failure_count
              << ", avg " << snap.total.avg_latency_ms << " ms"
              << ", p95 " << snap.total.p95_latency_ms << " ms"
              << ", " << snap.total.throughput_per_sec << " req/s\n";
    std::cout.flags(saved);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    const ProfileRegistry registry = ProfileRegistry::with_builtins();

    CliOptions opts;
    std::vector<ProfileLoad> loads;
    try {
        opts = parse_args(argc, argv);
        for (const auto& pop : distribute_users(opts.profiles, opts.users, opts.spawn_rate)) {
            loads.push_back(ProfileLoad{registry.create(pop.profile), pop.users, pop.spawn_rate});
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n\n";
        print_usage(argv[0], registry);
        return 1;
    }

    // SIGINT/SIGTERM are taken by a dedicated thread so that every other
    // thread, user threads included, inherits a mask that blocks them.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    Orchestrator orch(opts.run);
    orch.add_listener(std::make_shared<ConsoleReporter>(std::cout));

    std::atomic<bool> finished{false};
    std::thread signal_thread([&]() {
        const timespec poll{0, 200 * 1000 * 1000};
        while (!finished.load()) {
            if (sigtimedwait(&stop_signals, nullptr, &poll) > 0) {
                {
                    std::lock_guard<std::mutex> lock(log_mutex());
                    std::cout << "\nStop requested, shutting down users...\n";
                }
                orch.request_stop();
            }
        }
    });

    std::cout << "Starting load test...\n"
              << "   Target:     " << opts.target.base_url << "\n"
              << "   Users:      " << opts.users << " (spawn rate " << opts.spawn_rate << "/s)\n"
              << "   Duration:   " << (opts.run.duration ? std::to_string(opts.run.duration->count() / 1000) + " seconds"
                                     : !opts.run.stages.empty() ? std::to_string(total_duration(opts.run.stages).count() / 1000) + " seconds (staged)"
                                     : std::string("until interrupted")) << "\n"
              << "   Profiles:  ";
    for (const auto& load : loads) std::cout << " " << load.profile->name << ":" << load.users;
    std::cout << "\n   Stop mode:  " << to_string(opts.run.stop_mode) << "\n";
    if (!opts.run.stages.empty()) {
        std::cout << "   Stages:    ";
        for (const auto& stage : opts.run.stages) {
            std::cout << " " << stage.duration.count() / 1000.0 << "s->" << stage.target;
        }
        std::cout << "\n";
    }
    if (opts.run.seed != -1) {
        std::cout << "   Seed:       " << opts.run.seed << " (Deterministic, varied per user)\n\n";
    } else {
        std::cout << "   Seed:       Random\n\n";
    }

    int exit_code = 0;
    StatsSnapshot final_snapshot;
    try {
        try {
            orch.start(loads, opts.target);
        } catch (const PartialRampError& e) {
            std::lock_guard<std::mutex> lock(log_mutex());
            std::cerr << "Warning: " << e.what() << " continuing with the users that started\n";
        }
        final_snapshot = orch.wait_for_completion(
            std::chrono::seconds(opts.print_interval_sec),
            [&orch](const StatsSnapshot& snap) { print_progress(snap, orch); });
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        exit_code = 1;
    }

    finished.store(true);
    signal_thread.join();
    if (exit_code != 0) return exit_code;

    try {
        if (!opts.json_path.empty()) {
            int users = 0;
            for (const auto& load : loads) users += load.users;
            append_result_to_file(TestResult{opts.target.base_url, users, opts.profiles,
                                             final_snapshot.elapsed_s, final_snapshot},
                                  opts.json_path);
            std::cout << "Results appended to '" << opts.json_path << "'\n";
        }
        if (!opts.csv_prefix.empty()) {
            write_csv_reports(final_snapshot, opts.csv_prefix);
            std::cout << "CSV reports written to '" << opts.csv_prefix << "_stats.csv' and '"
                      << opts.csv_prefix << "_failures.csv'\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error writing reports: " << e.what() << "\n";
        exit_code = 1;
    }

    auto violations = threshold_violations(final_snapshot, opts.run.thresholds);
    for (const auto& v : violations) {
        std::cerr << "Threshold violated: " << v << "\n";
    }
    if (!violations.empty()) exit_code = 2;
    return exit_code;
}
