#include "request_executor.hpp"
#include "errors.hpp"

#include <algorithm>
#include <string>

namespace {
    // Slack for deciding that a failed call ran into its timeout.
    constexpr std::chrono::milliseconds kTimeoutSlack{20};

    // Checked before the client is built: httplib throws std::invalid_argument
    // for a scheme it was compiled without.
    const std::string& checked_base_url(const std::string& url) {
        const ParsedUrl parsed = parse_base_url(url);
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
        if (parsed.scheme == "https") {
            throw ConfigurationError("'" + url + "' needs HTTPS, but this build has no TLS support");
        }
#endif
        return url;
    }

    ErrorKind map_error(httplib::Error err) {
        switch (err) {
            case httplib::Error::Success:    return ErrorKind::None;
            case httplib::Error::Connection: return ErrorKind::Connection;
            case httplib::Error::Read:       return ErrorKind::Read;
            case httplib::Error::Write:      return ErrorKind::Write;
            case httplib::Error::Canceled:   return ErrorKind::Cancelled;
            default:                         return ErrorKind::Other;
        }
    }
}

RequestExecutor::RequestExecutor(const TargetDescriptor& target)
    : client_(checked_base_url(target.base_url)),
      default_headers_(target.default_headers),
      default_timeout_(target.default_timeout)
{
    if (!client_.is_valid()) {
        throw ConfigurationError("cannot create HTTP client for '" + target.base_url + "'");
    }
    client_.set_keep_alive(true);
    client_.set_tcp_nodelay(true);
    client_.set_follow_location(true);
    apply_timeout(default_timeout_);
}

std::chrono::milliseconds RequestExecutor::connect_timeout(std::chrono::milliseconds timeout) {
    return std::min(timeout, kMaxConnectTimeout);
}

void RequestExecutor::apply_timeout(std::chrono::milliseconds timeout) {
    const auto connect = connect_timeout(timeout);
    client_.set_connection_timeout(static_cast<time_t>(connect.count() / 1000),
                                   static_cast<time_t>((connect.count() % 1000) * 1000));

    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client_.set_read_timeout(sec, usec);
    client_.set_write_timeout(sec, usec);
}

RequestOutcome RequestExecutor::execute(const RequestSpec& spec) {
    return execute(spec, spec.timeout.value_or(default_timeout_));
}

RequestOutcome RequestExecutor::execute(const RequestSpec& spec, std::chrono::milliseconds timeout) {
    RequestOutcome outcome;
    outcome.category = spec.category;
    outcome.timestamp = std::chrono::system_clock::now();

    apply_timeout(timeout);

    httplib::Request req;
    req.method = spec.method;
    req.path = spec.path;
    for (const auto& h : default_headers_) {
        if (spec.headers.find(h.first) == spec.headers.end()) {
            req.headers.emplace(h.first, h.second);
        }
    }
    for (const auto& h : spec.headers) {
        req.headers.emplace(h.first, h.second);
    }
    if (!spec.body.empty()) {
        req.body = spec.body;
        if (!spec.content_type.empty() && !req.has_header("Content-Type")) {
            req.set_header("Content-Type", spec.content_type);
        }
    }

    // Last check before the socket opens; cancel() only reaches a request
    // that is already connected or connecting.
    if (cancelled_.load()) {
        outcome.error_kind = ErrorKind::Cancelled;
        outcome.error_message = "cancelled before send";
        return outcome;
    }

    auto start_time = std::chrono::steady_clock::now();
    httplib::Result res = client_.send(req);
    auto end_time = std::chrono::steady_clock::now();

    auto elapsed = end_time - start_time;
    outcome.latency_ms = std::chrono::duration<double, std::milli>(elapsed).count();

    if (res) {
        outcome.status = res->status;
        outcome.body_length = res->body.size();
        return outcome;
    }

    const auto err = res.error();
    outcome.error_message = httplib::to_string(err);
    if (cancelled_.load()) {
        outcome.error_kind = ErrorKind::Cancelled;
    } else if (err != httplib::Error::Canceled
               && (elapsed + kTimeoutSlack >= timeout
                   || (err == httplib::Error::Connection
                       && elapsed + kTimeoutSlack >= connect_timeout(timeout)))) {
        outcome.error_kind = ErrorKind::Timeout;
    } else {
        outcome.error_kind = map_error(err);
    }
    return outcome;
}

void RequestExecutor::cancel() {
    cancelled_.store(true);
    client_.stop();
}
