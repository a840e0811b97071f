#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

/**
 * @brief Admits at most `limit` requests per one-second window.
 * A limit of 0 admits everything.
 */
class FixedWindowLimiter
{
    std::mutex mutex;
    int limit;
    int windowCount = 0;
    std::chrono::steady_clock::time_point windowStart;

public:
    explicit FixedWindowLimiter(int limit);

    bool TryAcquire();
};

/**
 * @brief Stand-in for the chat service the built-in profiles target.
 *
 * Answers every route they call, throttles with 429 above the configured
 * rate and can add an artificial delay to each response.
 */
class TargetServer
{
    httplib::Server server;
    FixedWindowLimiter limiter;
    std::chrono::milliseconds delay;

public:
    std::atomic<long long> totalRequests{0};
    std::atomic<long long> rateLimited{0};

    TargetServer(int thread_count=10, int rate_limit_per_sec=0, int delay_ms=0);

    void HandleChat(const httplib::Request &req, httplib::Response &res);

    void HandleTextTool(const httplib::Request &req, httplib::Response &res);

    void HandleHealth(const httplib::Request &req, httplib::Response &res);

    void HandleMetrics(const httplib::Request &req, httplib::Response &res);

    int Listen(int port);

    // Binds an ephemeral port on host and returns it, or -1.
    int BindToAnyPort(const std::string& host);

    bool ListenAfterBind();

    void WaitUntilReady();

    void Stop();

private:
    // Counts the request, applies delay and rate limit. False if throttled.
    bool Admit(httplib::Response &res);
};
