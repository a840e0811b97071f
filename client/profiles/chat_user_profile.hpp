#pragma once

#include "../behavior_profile.hpp"
#include "chat_tasks.hpp"

#include <memory>

/**
 * @brief Profile "chat": a user talking to the chat API.
 * Mostly single prompts, some follow-up conversations, occasional tool
 * calls, health checks and homepage loads. Waits 1-5 s between tasks.
 */
inline ProfilePtr make_chat_user_profile() {
    auto p = std::make_shared<BehaviorProfile>();
    p->name = "chat";
    p->wait = WaitRange{1.0, 5.0};

    p->on_start = [](SessionState& session, std::mt19937& gen) {
        std::uniform_int_distribution<int> dist(1000, 9999);
        session.session_id = "session_" + std::to_string(dist(gen));
        session.transcript.clear();
    };

    p->add_task("chat_simple", 10, std::make_shared<JsonPostTask>(
        "/api/chat [simple]", endpoints::kChat,
        [](std::mt19937& gen) {
            return single_prompt_payload(pick_one(prompts::kSample, gen), prompts::kDefaultModel);
        }));
    p->add_task("chat_conversation", 5, std::make_shared<ConversationTask>());
    p->add_task("tool_endpoint", 3, std::make_shared<ToolTask>());
    p->add_task("check_health", 1, std::make_shared<GetTask>("/api/health", endpoints::kHealth));
    p->add_task("view_homepage", 1, std::make_shared<GetTask>("Homepage", endpoints::kHomepage));
    return p;
}
