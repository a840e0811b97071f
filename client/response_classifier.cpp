#include "response_classifier.hpp"

#include <utility>

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:       return "none";
        case ErrorKind::Timeout:    return "timeout";
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Read:       return "read";
        case ErrorKind::Write:      return "write";
        case ErrorKind::Cancelled:  return "cancelled";
        case ErrorKind::Other:      return "other";
    }
    return "other";
}

const char* to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::Success:         return "success";
        case Verdict::ExpectedFailure: return "expected-failure";
        case Verdict::Failure:         return "failure";
    }
    return "failure";
}

ClassificationPolicy& ClassificationPolicy::on_status(int status, Verdict verdict, std::string reason) {
    status_rules_[status] = Rule{verdict, std::move(reason)};
    return *this;
}

ClassificationPolicy& ClassificationPolicy::on_error(ErrorKind kind, Verdict verdict, std::string reason) {
    error_rules_[kind] = Rule{verdict, std::move(reason)};
    return *this;
}

ClassificationPolicy& ClassificationPolicy::tolerate_rate_limit() {
    return on_status(ResponseClassifier::kRateLimited, Verdict::Success, "throttled as expected");
}

const ClassificationPolicy::Rule* ClassificationPolicy::rule_for_status(int status) const {
    auto it = status_rules_.find(status);
    return it == status_rules_.end() ? nullptr : &it->second;
}

const ClassificationPolicy::Rule* ClassificationPolicy::rule_for_error(ErrorKind kind) const {
    auto it = error_rules_.find(kind);
    return it == error_rules_.end() ? nullptr : &it->second;
}

Classification ResponseClassifier::classify(const RequestOutcome& outcome,
                                            const ClassificationPolicy& policy) const {
    if (outcome.cancelled()) {
        return {Verdict::ExpectedFailure, "cancelled"};
    }

    // A timeout is a transport failure whatever the policy says.
    if (outcome.error_kind == ErrorKind::Timeout) {
        return {Verdict::Failure, "transport error: timeout"};
    }

    if (outcome.transport_error() || !outcome.status.has_value()) {
        if (const auto* rule = policy.rule_for_error(outcome.error_kind)) {
            return {rule->verdict, rule->reason};
        }
        return {Verdict::Failure, std::string("transport error: ") + to_string(outcome.error_kind)};
    }

    const int status = *outcome.status;
    if (const auto* rule = policy.rule_for_status(status)) {
        std::string reason = rule->reason;
        if (reason.empty() && rule->verdict == Verdict::Failure) {
            reason = "Got status code " + std::to_string(status);
        }
        return {rule->verdict, reason};
    }

    if (status >= 200 && status <= 299) {
        return {Verdict::Success, ""};
    }
    if (status == kRateLimited) {
        return {Verdict::Failure, "rate limited"};
    }
    return {Verdict::Failure, "Got status code " + std::to_string(status)};
}
