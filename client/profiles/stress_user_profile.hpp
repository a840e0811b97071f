#pragma once

#include "../behavior_profile.hpp"
#include "chat_tasks.hpp"

#include <memory>

// Profile "stress": rapid-fire chats on the fast model, 0.1-0.5 s apart.
inline ProfilePtr make_stress_user_profile() {
    auto p = std::make_shared<BehaviorProfile>();
    p->name = "stress";
    p->wait = WaitRange{0.1, 0.5};
    p->add_task("stress_test_chat", 1, std::make_shared<JsonPostTask>(
        "/api/chat", endpoints::kChat,
        [](std::mt19937&) { return single_prompt_payload("Quick test", prompts::kFastModel); }));
    return p;
}

// Profile "premium": one long business-plan request every 2-8 s.
inline ProfilePtr make_premium_user_profile() {
    auto p = std::make_shared<BehaviorProfile>();
    p->name = "premium";
    p->wait = WaitRange{2.0, 8.0};
    p->add_task("premium_request", 1, std::make_shared<JsonPostTask>(
        "/api/chat", endpoints::kChat,
        [](std::mt19937&) {
            return single_prompt_payload("Write a comprehensive business plan for a tech startup",
                                         prompts::kDefaultModel);
        }));
    return p;
}
