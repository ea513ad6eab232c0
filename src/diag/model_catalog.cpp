// llmlink diag: model catalog implementation
#include "diag/model_catalog.hpp"

#include <exception>
#include <limits>

#include "ll_types.hpp"

namespace ll {

namespace {

const char* const kContextKeys[] = {"context_length", "max_context_length", "context_window",
                                    "max_context_window", "n_ctx"};
const char* const kNestedKeys[] = {"metadata", "settings", "config", "parameters"};

int positive_int(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) return 0;
    auto v = it->get<long long>();
    if (v <= 0 || v > std::numeric_limits<int>::max()) return 0;
    return static_cast<int>(v);
}

int context_from_entry(const nlohmann::json& meta) {
    if (!meta.is_object()) return 0;
    for (const char* key : kContextKeys) {
        if (int v = positive_int(meta, key)) return v;
        for (const char* sub : kNestedKeys) {
            auto it = meta.find(sub);
            if (it != meta.end() && it->is_object()) {
                if (int v = positive_int(*it, key)) return v;
            }
        }
    }
    return 0;
}

int context_from_model(const nlohmann::json& entry) {
    if (int v = context_from_entry(entry)) return v;
    auto it = entry.find("meta");
    if (it != entry.end()) return context_from_entry(*it);
    return 0;
}

}  // namespace

std::vector<std::string> model_ids(const nlohmann::json& models_doc) {
    std::vector<std::string> ids;
    if (!models_doc.is_object()) return ids;
    auto data = models_doc.find("data");
    if (data == models_doc.end() || !data->is_array()) return ids;
    for (const auto& entry : *data) {
        if (!entry.is_object()) continue;
        auto id = entry.find("id");
        if (id != entry.end() && id->is_string() && !id->get<std::string>().empty())
            ids.push_back(id->get<std::string>());
    }
    return ids;
}

std::vector<std::string> list_models(const std::string& base_url, const JsonFetcher& fetcher,
                                     const HttpRequestOptions& opts) {
    const std::string url = join_url(base_url, "/models");
    JsonFetchResult result = fetcher(url, opts);
    if (!result.data) {
        LinkErrc code = result.status > 0 ? LinkErrc::HttpStatus : LinkErrc::Network;
        if (result.status >= 200 && result.status < 300) code = LinkErrc::InvalidJson;
        throw LinkError(code, "Failed to fetch models from " + url + ": " + result.error);
    }
    if (!result.data->is_object() || !result.data->contains("data"))
        throw LinkError(LinkErrc::InvalidJson,
                        "Failed to fetch models from " + url + ": response has no \"data\" key");
    return model_ids(*result.data);
}

int extract_context_window(const nlohmann::json& models_doc, const std::string& model_id) {
    if (!models_doc.is_object()) return 0;
    auto data = models_doc.find("data");
    if (data == models_doc.end() || !data->is_array()) return 0;

    for (const auto& entry : *data) {
        if (!entry.is_object()) continue;
        auto id = entry.find("id");
        if (id != entry.end() && id->is_string() && id->get<std::string>() == model_id) {
            if (int v = context_from_model(entry)) return v;
        }
    }
    for (const auto& entry : *data) {
        if (!entry.is_object()) continue;
        if (int v = context_from_model(entry)) return v;
    }
    return 0;
}

int try_auto_context_window(const std::string& base_url, const std::string& model_id,
                            const JsonFetcher& fetcher, const HttpRequestOptions& opts) {
    try {
        JsonFetchResult result = fetcher(join_url(base_url, "/models"), opts);
        if (!result.data) return 0;
        return extract_context_window(*result.data, model_id);
    } catch (const std::exception&) {
        return 0;
    }
}

}  // namespace ll
