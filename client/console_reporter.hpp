#pragma once

#include "orchestrator.hpp"

#include <ostream>

/**
 * @brief Prints the start banner and the end-of-run summary.
 */
class ConsoleReporter : public ILifecycleListener {
    std::ostream& out_;
public:
    explicit ConsoleReporter(std::ostream& out) : out_(out) {}

    void on_test_start(const std::string& target_host,
                       std::chrono::system_clock::time_point timestamp) override;

    void on_test_stop(const StatsSnapshot& final_snapshot) override;
};
