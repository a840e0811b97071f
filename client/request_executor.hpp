#pragma once

#include "httplib.h"
#include "outcome.hpp"
#include "run_config.hpp"
#include "task.hpp"

#include <atomic>
#include <chrono>

/**
 * @brief Issues requests for one virtual user over a dedicated keep-alive client.
 *
 * Never retries. Transport failures come back as outcomes with error_kind set
 * and no status; they are never thrown.
 */
class RequestExecutor {
public:
    // Upper bound on the connect phase, whatever the request timeout.
    static constexpr std::chrono::milliseconds kMaxConnectTimeout{5000};

    explicit RequestExecutor(const TargetDescriptor& target);

    RequestExecutor(const RequestExecutor&) = delete;
    RequestExecutor& operator=(const RequestExecutor&) = delete;

    /**
     * @brief Sends spec and waits for the response or the timeout.
     * @param timeout Applies to each read and each write. The connect phase
     * gets at most kMaxConnectTimeout of it.
     */
    RequestOutcome execute(const RequestSpec& spec, std::chrono::milliseconds timeout);

    // Uses the request's own timeout, else the target default.
    RequestOutcome execute(const RequestSpec& spec);

    /**
     * @brief Aborts the in-flight call, if any, and makes later calls return
     * a cancelled outcome without touching the network. Safe from any thread.
     * May block until a connect in progress finishes, at most
     * kMaxConnectTimeout.
     */
    void cancel();

    bool cancelled() const { return cancelled_.load(); }

    static std::chrono::milliseconds connect_timeout(std::chrono::milliseconds timeout);

private:
    void apply_timeout(std::chrono::milliseconds timeout);

    httplib::Client client_;
    std::multimap<std::string, std::string> default_headers_;
    std::chrono::milliseconds default_timeout_;
    std::atomic<bool> cancelled_{false};
};
