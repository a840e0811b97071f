#pragma once

#include "../task.hpp"
#include "../utils.h"
#include "Endpoints.h"

#include <chrono>
#include <functional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace prompts
{
  const std::vector<std::string> kSample = {
    "Write a product description for a new smartphone",
    "Create a marketing email for a summer sale",
    "Explain the benefits of cloud computing",
    "Write a blog post about SEO best practices",
    "Translate this text to Spanish: Hello, how are you?",
    "Summarize the importance of content marketing",
    "Generate social media captions for a coffee shop",
    "Write code to reverse a string in Python",
    "Create a business plan outline for a startup",
    "Explain machine learning in simple terms",
  };

  const std::vector<std::string> kSite = {
    "What is the capital of the Philippines?",
    "Explain machine learning in simple terms",
    "Write a short story about Manila",
    "Translate 'Hello, how are you?' to Tagalog",
    "Summarize the benefits of AI",
    "Write a business plan for a coffee shop",
    "Check grammar: 'I goes to the store yesterday'",
    "Paraphrase: 'The quick brown fox jumps over the lazy dog'",
    "Generate a slogan for a tech startup",
    "Write an essay about climate change",
  };

  const std::vector<std::string> kModels = {
    "claude-3-5-sonnet-20241022",
    "claude-3-7-sonnet-20250219",
    "claude-3-haiku-20240307",
  };

  const std::vector<std::string> kLanguages = {"Tagalog", "Cebuano", "Ilocano"};

  constexpr const char* kDefaultModel = "claude-3-7-sonnet-20250219";
  constexpr const char* kHeavyModel = "claude-sonnet-4-20250514";
  constexpr const char* kFastModel = "claude-3-haiku-20240307";
  constexpr const char* kFollowUp = "Can you explain that in more detail?";
}

template <typename Container>
const typename Container::value_type& pick_one(const Container& items, std::mt19937& gen) {
    std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
    return items[dist(gen)];
}

inline std::string chat_payload(const std::vector<ChatMessage>& messages, const std::string& model) {
    std::ostringstream ss;
    ss << "{\"messages\": [";
    for (size_t i = 0; i < messages.size(); ++i) {
        if (i) ss << ", ";
        ss << "{\"role\": \"" << json_escape(messages[i].role)
           << "\", \"content\": \"" << json_escape(messages[i].content) << "\"}";
    }
    ss << "]";
    if (!model.empty()) {
        ss << ", \"model\": \"" << json_escape(model) << "\"";
    }
    ss << "}";
    return ss.str();
}

inline RequestSpec json_post(std::string category, std::string path, std::string body) {
    RequestSpec spec;
    spec.category = std::move(category);
    spec.method = "POST";
    spec.path = std::move(path);
    spec.body = std::move(body);
    spec.content_type = "application/json";
    return spec;
}

/**
 * @brief POSTs a JSON body produced by a builder function.
 * Covers the simple endpoints whose payload needs no session state.
 */
class JsonPostTask : public ITask {
public:
    using BodyBuilder = std::function<std::string(std::mt19937&)>;

    JsonPostTask(std::string category, std::string path, BodyBuilder body,
                 ClassificationPolicy policy = {},
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        : category_(std::move(category)), path_(std::move(path)), body_(std::move(body)),
          policy_(std::move(policy)), timeout_(timeout) {}

    RequestSpec build(SessionState& /*session*/, std::mt19937& gen) const override {
        RequestSpec spec = json_post(category_, path_, body_(gen));
        spec.timeout = timeout_;
        return spec;
    }

    const ClassificationPolicy& policy() const override { return policy_; }

private:
    std::string category_;
    std::string path_;
    BodyBuilder body_;
    ClassificationPolicy policy_;
    std::optional<std::chrono::milliseconds> timeout_;
};

/**
 * @brief Plain GET against a fixed path.
 */
class GetTask : public ITask {
    std::string category_;
    std::string path_;
    ClassificationPolicy policy_;
public:
    GetTask(std::string category, std::string path, ClassificationPolicy policy = {})
        : category_(std::move(category)), path_(std::move(path)), policy_(std::move(policy)) {}

    RequestSpec build(SessionState& /*session*/, std::mt19937& /*gen*/) const override {
        RequestSpec spec;
        spec.category = category_;
        spec.path = path_;
        return spec;
    }

    const ClassificationPolicy& policy() const override { return policy_; }
};

/**
 * @brief Chat with history. Seeds the transcript with one exchange on first
 * use, then always asks the same follow-up on top of it.
 */
class ConversationTask : public ITask {
    ClassificationPolicy policy_;
public:
    RequestSpec build(SessionState& session, std::mt19937& gen) const override {
        if (session.transcript.size() < 2) {
            session.transcript.push_back({"user", pick_one(prompts::kSample, gen)});
            session.transcript.push_back({"assistant", "This is a test response."});
        }
        std::vector<ChatMessage> messages = session.transcript;
        messages.push_back({"user", prompts::kFollowUp});
        return json_post("/api/chat [conversation]", endpoints::kChat,
                         chat_payload(messages, prompts::kDefaultModel));
    }

    const ClassificationPolicy& policy() const override { return policy_; }
};

/**
 * @brief POSTs sample text to one of the AI tool endpoints, picked at random.
 */
class ToolTask : public ITask {
    ClassificationPolicy policy_;
public:
    RequestSpec build(SessionState& /*session*/, std::mt19937& gen) const override {
        const std::string endpoint = pick_one(endpoints::kTools, gen);
        return json_post(endpoint + " [tool]", endpoint,
                         "{\"text\": \"This is a sample text for testing the AI tool functionality.\", "
                         "\"options\": {}}");
    }

    const ClassificationPolicy& policy() const override { return policy_; }
};

inline std::string single_prompt_payload(const std::string& prompt, const std::string& model) {
    return chat_payload({ChatMessage{"user", prompt}}, model);
}

inline std::string text_payload(const std::string& text) {
    return "{\"text\": \"" + json_escape(text) + "\"}";
}
