// llmlink diag: model listing and context window detection
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "net/http_client.hpp"

namespace ll {

// GET <base>/models and return every entry id. Throws LinkError when the
// request fails or the document has no usable "data" array.
std::vector<std::string> list_models(const std::string& base_url,
                                     const JsonFetcher& fetcher = &http_get_json,
                                     const HttpRequestOptions& opts = {});

std::vector<std::string> model_ids(const nlohmann::json& models_doc);

// Best-effort context window from a /models document; 0 when unknown.
int extract_context_window(const nlohmann::json& models_doc, const std::string& model_id);

// Fetches /models and runs extract_context_window(). Never throws.
int try_auto_context_window(const std::string& base_url, const std::string& model_id,
                            const JsonFetcher& fetcher = &http_get_json,
                            const HttpRequestOptions& opts = {});

}  // namespace ll
