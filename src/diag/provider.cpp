// llmlink diag: provider table
#include "diag/provider.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace ll {

namespace {

// Base prefix (without the API version segment) -> provider id.
const std::vector<std::pair<std::string, std::string>>& provider_prefixes() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"http://localhost:1234", "lmstudio"},
        {"http://localhost:11434", "ollama"},
        {"http://localhost:8000", "vllm"},
        {"http://localhost:5000", "tgwui"},
        {"http://localhost:8080", "tgi"},
        {"http://localhost:3000", "tgi"},
        {"http://localhost:7000", "openrouter"},
        {"https://openrouter.ai/api", "openrouter-remote"},
        {"https://api.anthropic.com", "anthropic"},
        {"https://api.groq.com/openai", "groq"},
        {"https://api.mistral.ai", "mistral"},
        {"https://api.deepseek.com", "deepseek"},
        {"https://api.cohere.com", "cohere"},
        {"https://inference.baseten.co", "baseten"},
        {"https://api.openai.com", "openai"},
        {"http://localhost:3001", "anythingllm"},
        {"http://localhost:1337", "jan"},
    };
    return table;
}

std::string host_of(const std::string& url) {
    auto scheme = url.find("://");
    std::string rest = scheme == std::string::npos ? url : url.substr(scheme + 3);
    auto end = rest.find_first_of("/?#");
    std::string host = rest.substr(0, end);
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);
    auto colon = host.rfind(':');
    if (colon != std::string::npos) host = host.substr(0, colon);
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::vector<std::string> default_candidates() {
    return {kDefaultLmStudio, kDefaultOllama,  kDefaultVllm,           kDefaultTgwui,
            kDefaultTgi8080,  kDefaultTgi3000, kDefaultOpenRouterLocal};
}

std::string resolve_provider(const std::string& base_url) {
    for (const auto& [prefix, id] : provider_prefixes()) {
        if (base_url.rfind(prefix, 0) == 0) return id;
    }
    if (ends_with(host_of(base_url), ".openai.azure.com")) return "azure";
    return "custom";
}

std::string provider_label(const std::string& provider_id) {
    static const std::map<std::string, std::string> labels = {
        {"lmstudio", "LM Studio"},
        {"ollama", "Ollama"},
        {"vllm", "vLLM"},
        {"tgwui", "Text-Gen-WebUI"},
        {"tgi", "TGI"},
        {"openrouter", "OpenRouter Local"},
        {"openrouter-remote", "OpenRouter"},
        {"anthropic", "Anthropic"},
        {"azure", "Azure OpenAI"},
        {"groq", "Groq"},
        {"mistral", "Mistral"},
        {"deepseek", "DeepSeek"},
        {"cohere", "Cohere"},
        {"baseten", "Baseten"},
        {"koboldcpp", "KoboldCpp"},
        {"anythingllm", "AnythingLLM"},
        {"jan", "Jan AI"},
        {"llamacpp", "llama.cpp"},
        {"openai", "OpenAI"},
    };
    auto it = labels.find(provider_id);
    return it == labels.end() ? provider_id : it->second;
}

}  // namespace ll
