// llmlink net: blocking HTTP client over libcurl
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ll {

// Raised by the owner to abort an in-flight transfer.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag make_cancel_flag() { return std::make_shared<std::atomic<bool>>(false); }

struct HttpRequestOptions {
  std::chrono::milliseconds timeout{3000};  // values below 1 ms are raised to 1 ms
  std::map<std::string, std::string> headers;
  CancelFlag cancel;  // optional
};

struct HttpResponse {
  long status = 0;     // 0 when no HTTP response was received
  std::string body;
  std::string error;   // transport error text, empty on success

  bool transport_ok() const { return error.empty() && status > 0; }
  bool is_success() const { return transport_ok() && status >= 200 && status < 300; }
};

// Outcome of a JSON request: `data` is set only for a 2xx response whose
// body parsed as JSON. `error` is "HTTP <code>" or the transport error.
struct JsonFetchResult {
  std::optional<nlohmann::json> data;
  long status = 0;
  std::string error;
};

using JsonFetcher =
    std::function<JsonFetchResult(const std::string& url, const HttpRequestOptions& opts)>;
using JsonPoster = std::function<JsonFetchResult(
    const std::string& url, const nlohmann::json& body, const HttpRequestOptions& opts)>;

// One easy handle per request, so instances can be shared across threads.
class HttpClient {
public:
  HttpClient();

  HttpResponse get(const std::string& url, const HttpRequestOptions& opts) const;
  HttpResponse post(const std::string& url, const std::string& body,
                    const std::string& content_type,
                    const HttpRequestOptions& opts) const;

private:
  HttpResponse perform(const std::string& url, const std::string* post_body,
                       const std::string& content_type,
                       const HttpRequestOptions& opts) const;
};

JsonFetchResult to_json_result(const HttpResponse& resp);

JsonFetchResult http_get_json(const std::string& url, const HttpRequestOptions& opts);
JsonFetchResult http_post_json(const std::string& url, const nlohmann::json& body,
                               const HttpRequestOptions& opts);

// "http://host:1234/v1/" + "/models" -> "http://host:1234/v1/models"
std::string join_url(const std::string& base, const std::string& path);

}  // namespace ll
