#pragma once

#include "../behavior_profile.hpp"
#include "chat_tasks.hpp"

#include <memory>

/**
 * @brief Profile "burst": rapid short chats meant to trip the rate limiter.
 * A 429 here means throttling works, so it counts as success. Waits 0.1-1 s.
 */
inline ProfilePtr make_burst_user_profile() {
    auto p = std::make_shared<BehaviorProfile>();
    p->name = "burst";
    p->wait = WaitRange{0.1, 1.0};

    ClassificationPolicy policy;
    policy.tolerate_rate_limit();

    p->add_task("rapid_requests", 1, std::make_shared<JsonPostTask>(
        "/api/chat [burst]", endpoints::kChat,
        [](std::mt19937&) { return single_prompt_payload("Quick test", ""); },
        policy));
    return p;
}
