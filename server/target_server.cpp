#include "target_server.hpp"
#include "Endpoints.h"

#include <iostream>
#include <sstream>
#include <thread>

FixedWindowLimiter::FixedWindowLimiter(int limit):
    limit(limit), windowStart(std::chrono::steady_clock::now())
{
}

bool FixedWindowLimiter::TryAcquire()
{
    if (limit <= 0)
    {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto now = std::chrono::steady_clock::now();
    if (now - windowStart >= std::chrono::seconds(1))
    {
        windowStart = now;
        windowCount = 0;
    }
    if (windowCount >= limit)
    {
        return false;
    }
    windowCount++;
    return true;
}

TargetServer::TargetServer(int thread_count, int rate_limit_per_sec, int delay_ms):
    limiter(rate_limit_per_sec), delay(delay_ms)
{
    server.new_task_queue = [thread_count]{
        return new httplib::ThreadPool(thread_count, thread_count);
    };

    server.set_tcp_nodelay(true);

    server.Get(endpoints::kHomepage, [this](const httplib::Request & /*req*/, httplib::Response &res) {
        if (!Admit(res)) return;
        res.set_content("<html><body><h1>Chat</h1></body></html>", "text/html");
        res.status = 200;
    });

    server.Post(endpoints::kChat, [this](const httplib::Request &req, httplib::Response &res) {
        HandleChat(req, res);
    });

    server.Post(R"(/api/tools/([\w-]+))", [this](const httplib::Request &req, httplib::Response &res) {
        HandleTextTool(req, res);
    });
    for (const char* path : {endpoints::kTranslate, endpoints::kGrammarCheck,
                             endpoints::kSummarize, endpoints::kParaphrase})
    {
        server.Post(path, [this](const httplib::Request &req, httplib::Response &res) {
            HandleTextTool(req, res);
        });
    }

    server.Get(endpoints::kHealth, [this](const httplib::Request &req, httplib::Response &res) {
        HandleHealth(req, res);
    });
    server.Get(endpoints::kMonitoringHealth, [this](const httplib::Request &req, httplib::Response &res) {
        HandleHealth(req, res);
    });
    server.Get(endpoints::kMonitoringMetrics, [this](const httplib::Request &req, httplib::Response &res) {
        HandleMetrics(req, res);
    });
}

bool TargetServer::Admit(httplib::Response &res)
{
    totalRequests++;
    if (delay.count() > 0)
    {
        std::this_thread::sleep_for(delay);
    }
    if (!limiter.TryAcquire())
    {
        rateLimited++;
        res.set_content("{\"error\": \"Too many requests\"}", "application/json");
        res.status = 429; // Too Many Requests
        return false;
    }
    return true;
}

void TargetServer::HandleChat(const httplib::Request &req, httplib::Response &res)
{
    if (!Admit(res)) return;

    if (req.body.find("\"messages\"") == std::string::npos)
    {
        res.set_content("{\"error\": \"messages are required\"}", "application/json");
        res.status = 400; // Bad Request
        return;
    }
    res.set_content("{\"role\": \"assistant\", \"content\": \"This is a test response.\"}",
                    "application/json");
    res.status = 200; // OK
}

void TargetServer::HandleTextTool(const httplib::Request &req, httplib::Response &res)
{
    if (!Admit(res)) return;

    if (req.body.find("\"text\"") == std::string::npos)
    {
        res.set_content("{\"error\": \"text is required\"}", "application/json");
        res.status = 400; // Bad Request
        return;
    }
    res.set_content("{\"result\": \"ok\"}", "application/json");
    res.status = 200; // OK
}

void TargetServer::HandleHealth(const httplib::Request & /*req*/, httplib::Response &res)
{
    if (!Admit(res)) return;
    res.set_content("{\"status\": \"healthy\"}", "application/json");
    res.status = 200; // OK
}

void TargetServer::HandleMetrics(const httplib::Request &req, httplib::Response &res)
{
    if (!Admit(res)) return;

    if (req.get_param_value("format") == "json")
    {
        std::stringstream ss;
        ss << "{\"totalRequests\": " << totalRequests.load()
           << ", \"rateLimited\": " << rateLimited.load() << "}";
        res.set_content(ss.str(), "application/json");
    }
    else
    {
        std::stringstream ss;
        ss << "totalRequests:" << totalRequests.load() << std::endl;
        ss << "rateLimited:" << rateLimited.load() << std::endl;
        res.set_content(ss.str(), "text/plain");
    }
    res.status = 200; // OK
}

int TargetServer::Listen(int port)
{
    std::cout << "Starting target server on http://0.0.0.0:" << port << std::endl;
    if (!server.listen("0.0.0.0", port))
    {
        std::cerr << "Failed to start server!" << std::endl;
        return -1;
    }
    return 0;
}

int TargetServer::BindToAnyPort(const std::string& host)
{
    return server.bind_to_any_port(host);
}

bool TargetServer::ListenAfterBind()
{
    return server.listen_after_bind();
}

void TargetServer::WaitUntilReady()
{
    server.wait_until_ready();
}

void TargetServer::Stop()
{
    server.stop();
}
