#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Transport-level failure of a request, independent of any status code.
 */
enum class ErrorKind {
    None,
    Timeout,
    Connection,   // refused, unreachable, DNS failure
    Read,
    Write,
    Cancelled,    // aborted by an immediate stop
    Other
};

const char* to_string(ErrorKind kind);

/**
 * @brief Result of one request, produced by RequestExecutor and recorded
 * exactly once by the StatsAggregator.
 */
struct RequestOutcome {
    std::string category;
    std::optional<int> status;
    double latency_ms = 0.0;
    size_t body_length = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp;

    bool transport_error() const { return error_kind != ErrorKind::None; }
    bool cancelled() const { return error_kind == ErrorKind::Cancelled; }
};

enum class Verdict {
    Success,
    ExpectedFailure,
    Failure
};

const char* to_string(Verdict verdict);

struct Classification {
    Verdict verdict = Verdict::Success;
    std::string reason;

    bool is_failure() const { return verdict == Verdict::Failure; }
};
