#include "errors.hpp"
#include "request_executor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <future>
#include <thread>

namespace {

/**
 * @brief Loopback socket that listens but never accepts. Connects succeed
 * through the backlog; nothing is ever read or answered.
 */
class SilentListener {
    int fd_ = -1;
    int port_ = 0;
public:
    SilentListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket() failed");
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0
            || ::listen(fd_, 8) != 0
            || ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(fd_);
            throw std::runtime_error("cannot listen on loopback");
        }
        port_ = ntohs(addr.sin_port);
    }
    ~SilentListener() { if (fd_ >= 0) ::close(fd_); }

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }
};

// A loopback port nobody listens on.
int closed_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

RequestSpec get(const std::string& path) {
    RequestSpec spec;
    spec.category = path;
    spec.path = path;
    return spec;
}

}  // namespace

TEST(RequestExecutorTest, SuccessfulGet) {
    LocalTarget target;
    RequestExecutor executor(TargetDescriptor{target.base_url()});

    RequestOutcome o = executor.execute(get(endpoints::kHealth));
    EXPECT_FALSE(o.transport_error());
    ASSERT_TRUE(o.status.has_value());
    EXPECT_EQ(*o.status, 200);
    EXPECT_GT(o.body_length, 0u);
    EXPECT_GE(o.latency_ms, 0.0);
    EXPECT_EQ(o.category, endpoints::kHealth);
}

TEST(RequestExecutorTest, PostsJsonBody) {
    LocalTarget target;
    RequestExecutor executor(TargetDescriptor{target.base_url()});

    RequestOutcome ok = executor.execute(json_post("chat", endpoints::kChat,
                                                   single_prompt_payload("hi", prompts::kFastModel)));
    ASSERT_TRUE(ok.status.has_value());
    EXPECT_EQ(*ok.status, 200);

    RequestOutcome bad = executor.execute(json_post("chat", endpoints::kChat, "{}"));
    ASSERT_TRUE(bad.status.has_value());
    EXPECT_EQ(*bad.status, 400);
    EXPECT_FALSE(bad.transport_error());
}

TEST(RequestExecutorTest, TimeoutIsReportedAsTransportError) {
    SilentListener silent;
    RequestExecutor executor(TargetDescriptor{silent.base_url()});

    RequestOutcome o = executor.execute(get(endpoints::kHealth), std::chrono::milliseconds(1000));
    EXPECT_EQ(o.error_kind, ErrorKind::Timeout);
    EXPECT_FALSE(o.status.has_value());
    EXPECT_GE(o.latency_ms, 980.0);
    EXPECT_LT(o.latency_ms, 1200.0);
}

TEST(RequestExecutorTest, RefusedConnection) {
    RequestExecutor executor(TargetDescriptor{"http://127.0.0.1:" + std::to_string(closed_port())});

    RequestOutcome o = executor.execute(get("/"), std::chrono::milliseconds(2000));
    EXPECT_TRUE(o.transport_error());
    EXPECT_EQ(o.error_kind, ErrorKind::Connection);
    EXPECT_FALSE(o.status.has_value());
}

TEST(RequestExecutorTest, CancelledBeforeSend) {
    RequestExecutor executor(TargetDescriptor{"http://127.0.0.1:1"});
    executor.cancel();

    RequestOutcome o = executor.execute(get("/"));
    EXPECT_TRUE(o.cancelled());
    EXPECT_DOUBLE_EQ(o.latency_ms, 0.0);
}

TEST(RequestExecutorTest, CancelAbortsInFlightRequest) {
    LocalTarget target(4, 0, 2000);
    RequestExecutor executor(TargetDescriptor{target.base_url()});

    auto pending = std::async(std::launch::async, [&executor] {
        return executor.execute(get(endpoints::kHealth));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    executor.cancel();

    RequestOutcome o = pending.get();
    EXPECT_TRUE(o.cancelled());
    EXPECT_LT(o.latency_ms, 1500.0);
}

TEST(RequestExecutorTest, RejectsUnusableBaseUrl) {
    EXPECT_THROW(RequestExecutor(TargetDescriptor{"not a url"}), ConfigurationError);
}

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
TEST(RequestExecutorTest, RejectsHttpsWithoutTls) {
    EXPECT_THROW(RequestExecutor(TargetDescriptor{"https://127.0.0.1:8443"}), ConfigurationError);
}
#endif

TEST(RequestExecutorTest, FollowsRedirects) {
    httplib::Server server;
    server.Get("/old", [](const httplib::Request&, httplib::Response& res) {
        res.set_redirect("/new");
    });
    server.Get("/new", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("moved here", "text/plain");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread serving([&server] { server.listen_after_bind(); });
    server.wait_until_ready();

    RequestExecutor executor(TargetDescriptor{"http://127.0.0.1:" + std::to_string(port)});
    RequestOutcome o = executor.execute(get("/old"));

    server.stop();
    serving.join();

    ASSERT_TRUE(o.status.has_value());
    EXPECT_EQ(*o.status, 200);
    EXPECT_EQ(o.body_length, std::string("moved here").size());
}

TEST(RequestExecutorTest, ConnectTimeoutIsCapped) {
    EXPECT_EQ(RequestExecutor::connect_timeout(std::chrono::milliseconds(800)),
              std::chrono::milliseconds(800));
    EXPECT_EQ(RequestExecutor::connect_timeout(std::chrono::milliseconds(60000)),
              RequestExecutor::kMaxConnectTimeout);
}

TEST(RequestExecutorTest, UnreachableHostGivesUpAtTheConnectCap) {
    // Non-routable address: the SYN goes unanswered.
    RequestExecutor executor(TargetDescriptor{"http://10.255.255.1:81"});

    RequestOutcome o = executor.execute(get("/"), std::chrono::milliseconds(60000));
    EXPECT_TRUE(o.transport_error());
    EXPECT_FALSE(o.status.has_value());
    EXPECT_LT(o.latency_ms, 6000.0);
}
