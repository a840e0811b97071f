#pragma once

#include "outcome.hpp"

#include <map>
#include <string>

/**
 * @brief Per-task table of verdict overrides.
 *
 * Status codes and transport error kinds without a rule fall back to the
 * default mapping (2xx success, 429 "rate limited", anything else failure).
 */
class ClassificationPolicy {
public:
    struct Rule {
        Verdict verdict;
        std::string reason;
    };

    ClassificationPolicy& on_status(int status, Verdict verdict, std::string reason = "");
    ClassificationPolicy& on_error(ErrorKind kind, Verdict verdict, std::string reason = "");

    // 429 counts as success: the service throttled us as it should.
    ClassificationPolicy& tolerate_rate_limit();

    const Rule* rule_for_status(int status) const;
    const Rule* rule_for_error(ErrorKind kind) const;

private:
    std::map<int, Rule> status_rules_;
    std::map<ErrorKind, Rule> error_rules_;
};

/**
 * @brief Maps a request outcome to a verdict. Holds no state; every decision
 * comes from the policy passed in.
 */
class ResponseClassifier {
public:
    static constexpr int kRateLimited = 429;

    Classification classify(const RequestOutcome& outcome, const ClassificationPolicy& policy) const;
};
