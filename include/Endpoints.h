#pragma once

#include <array>

// Paths of the chat service exercised by the built-in profiles.
// The mock target server registers the same routes.
namespace endpoints
{
  constexpr const char* kHomepage = "/";
  constexpr const char* kChat = "/api/chat";
  constexpr const char* kHealth = "/api/health";
  constexpr const char* kMonitoringHealth = "/api/monitoring/health";
  constexpr const char* kMonitoringMetrics = "/api/monitoring/metrics";
  constexpr const char* kTranslate = "/api/translate";
  constexpr const char* kGrammarCheck = "/api/grammar-check";
  constexpr const char* kSummarize = "/api/summarize";
  constexpr const char* kParaphrase = "/api/paraphrase";

  constexpr const char* kToolPrefix = "/api/tools/";

  constexpr std::array<const char*, 8> kTools = {
    "/api/tools/grammar-check",
    "/api/tools/translator",
    "/api/tools/summarizer",
    "/api/tools/paraphraser",
    "/api/tools/content-generator",
    "/api/tools/seo-analyzer",
    "/api/tools/code-generator",
    "/api/tools/email-writer",
  };
}
