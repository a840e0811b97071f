#pragma once

#include "../behavior_profile.hpp"
#include "chat_tasks.hpp"

#include <memory>

/**
 * @brief Profile "site": a visitor spread over the site's AI features.
 * Every task is tagged so a run can be narrowed with --tags.
 */
inline ProfilePtr make_site_user_profile() {
    auto p = std::make_shared<BehaviorProfile>();
    p->name = "site";
    p->wait = WaitRange{1.0, 5.0};

    p->add_task("chat_endpoint", 5, std::make_shared<JsonPostTask>(
        "/api/chat", endpoints::kChat,
        [](std::mt19937& gen) {
            const std::string& prompt = pick_one(prompts::kSite, gen);
            return single_prompt_payload(prompt, pick_one(prompts::kModels, gen));
        }), {"chat"});

    p->add_task("translate_endpoint", 2, std::make_shared<JsonPostTask>(
        "/api/translate", endpoints::kTranslate,
        [](std::mt19937& gen) {
            const std::string& text = pick_one(prompts::kSite, gen);
            return "{\"text\": \"" + json_escape(text) + "\", \"targetLanguage\": \""
                   + pick_one(prompts::kLanguages, gen) + "\"}";
        }), {"translate"});

    p->add_task("grammar_check_endpoint", 2, std::make_shared<JsonPostTask>(
        "/api/grammar-check", endpoints::kGrammarCheck,
        [](std::mt19937&) { return text_payload("I goes to the store yesterday and buys some apples"); }),
        {"grammar"});

    p->add_task("summarize_endpoint", 2, std::make_shared<JsonPostTask>(
        "/api/summarize", endpoints::kSummarize,
        [](std::mt19937&) {
            return text_payload(
                "Artificial intelligence (AI) is intelligence demonstrated by machines, "
                "as opposed to natural intelligence displayed by animals including humans. "
                "AI research has been defined as the field of study of intelligent agents...");
        }), {"summarize"});

    p->add_task("paraphrase_endpoint", 1, std::make_shared<JsonPostTask>(
        "/api/paraphrase", endpoints::kParaphrase,
        [](std::mt19937&) { return text_payload("The quick brown fox jumps over the lazy dog"); }),
        {"paraphrase"});

    p->add_task("health_check", 1, std::make_shared<GetTask>(
        "/api/monitoring/health", endpoints::kMonitoringHealth), {"monitoring"});

    p->add_task("metrics_check", 1, std::make_shared<GetTask>(
        "/api/monitoring/metrics", std::string(endpoints::kMonitoringMetrics) + "?format=json"),
        {"monitoring"});
    return p;
}
