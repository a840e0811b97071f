#pragma once

#include "outcome.hpp"
#include "response_classifier.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

struct ChatMessage {
    std::string role;
    std::string content;
};

/**
 * @brief Mutable per-user state. Only the owning VirtualUser's thread
 * touches it.
 */
struct SessionState {
    std::string session_id;
    std::map<std::string, std::string> values;
    std::vector<ChatMessage> transcript;
};

/**
 * @brief What a task wants sent. `category` is the statistics bucket.
 */
struct RequestSpec {
    std::string category;
    std::string method = "GET";
    std::string path = "/";
    std::multimap<std::string, std::string> headers;
    std::string body;
    std::string content_type;
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Abstract interface for one kind of request a virtual user can make.
 *
 * Tasks are shared by every user running the same profile, so they must not
 * keep per-user state of their own. Anything that has to survive between
 * invocations lives in the SessionState passed in.
 */
class ITask {
public:
    virtual ~ITask() = default;

    /**
     * @brief Builds the next request from the user's session.
     * @param session The calling user's session; may be updated.
     * @param gen The random number generator dedicated to the calling user.
     */
    virtual RequestSpec build(SessionState& session, std::mt19937& gen) const = 0;

    /**
     * @brief The verdict table used for this task's responses.
     */
    virtual const ClassificationPolicy& policy() const = 0;

    /**
     * @brief (Optional) Called after the outcome has been classified and recorded.
     */
    virtual void on_result(SessionState& /*session*/, const RequestOutcome& /*outcome*/,
                           const Classification& /*verdict*/) const {
        // Default implementation does nothing.
    }

    // Total attempts per selection, first one included.
    virtual int max_attempts() const { return 1; }

    virtual bool should_retry(const Classification& /*verdict*/, int /*attempt*/) const { return false; }
};

/**
 * @brief A task plus the metadata used to schedule it.
 */
struct TaskDescriptor {
    std::string name;
    int weight = 1;
    std::set<std::string> tags;
    std::shared_ptr<const ITask> task;
};

/**
 * @brief Decorator that re-issues a task while its verdict is a failure.
 * Every attempt is recorded on its own.
 */
class RetryingTask : public ITask {
    std::shared_ptr<const ITask> inner_;
    int attempts_;
public:
    RetryingTask(std::shared_ptr<const ITask> inner, int attempts)
        : inner_(std::move(inner)), attempts_(attempts < 1 ? 1 : attempts) {}

    RequestSpec build(SessionState& session, std::mt19937& gen) const override {
        return inner_->build(session, gen);
    }

    const ClassificationPolicy& policy() const override { return inner_->policy(); }

    void on_result(SessionState& session, const RequestOutcome& outcome,
                   const Classification& verdict) const override {
        inner_->on_result(session, outcome, verdict);
    }

    int max_attempts() const override { return attempts_; }

    bool should_retry(const Classification& verdict, int attempt) const override {
        return verdict.is_failure() && attempt < attempts_;
    }
};
