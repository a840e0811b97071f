#pragma once

#include "../behavior_profile.hpp"
#include "chat_tasks.hpp"

#include <chrono>
#include <memory>

/**
 * @brief Profile "heavy": document-sized prompts on the stronger model,
 * with a 60 s request timeout. Waits 2-8 s between tasks.
 */
inline ProfilePtr make_heavy_user_profile() {
    auto p = std::make_shared<BehaviorProfile>();
    p->name = "heavy";
    p->wait = WaitRange{2.0, 8.0};

    std::string joined;
    for (const auto& prompt : prompts::kSample) {
        if (!joined.empty()) joined += " ";
        joined += prompt;
    }
    std::string large_prompt = "Please analyze the following text: ";
    for (int i = 0; i < 20; ++i) large_prompt += joined;

    const std::string body = single_prompt_payload(large_prompt, prompts::kHeavyModel);
    p->add_task("chat_heavy", 1, std::make_shared<JsonPostTask>(
        "/api/chat [heavy]", endpoints::kChat,
        [body](std::mt19937&) { return body; },
        ClassificationPolicy{},
        std::chrono::milliseconds(60000)));
    return p;
}
