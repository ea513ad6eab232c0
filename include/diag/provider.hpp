// llmlink diag: well-known OpenAI-compatible servers and provider ids
#pragma once

#include <string>
#include <vector>

namespace ll {

inline constexpr const char* kDefaultLmStudio = "http://localhost:1234/v1";
inline constexpr const char* kDefaultOllama = "http://localhost:11434/v1";
inline constexpr const char* kDefaultVllm = "http://localhost:8000/v1";
inline constexpr const char* kDefaultTgwui = "http://localhost:5000/v1";
inline constexpr const char* kDefaultTgi8080 = "http://localhost:8080/v1";
inline constexpr const char* kDefaultTgi3000 = "http://localhost:3000/v1";
inline constexpr const char* kDefaultOpenRouterLocal = "http://localhost:7000/v1";

// Local servers probed by auto-detection, in preference order.
std::vector<std::string> default_candidates();

// Canonical provider id for a base URL ("lmstudio", "ollama", ..., "azure"),
// or "custom" when unrecognised.
std::string resolve_provider(const std::string& base_url);

// Display label for a provider id; the id itself when unknown.
std::string provider_label(const std::string& provider_id);

}  // namespace ll
