// llmlink net: HttpClient implementation
#include "net/http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

namespace ll {

namespace {

std::once_flag g_curl_once;

void ensure_curl_initialized() {
    // Never paired with curl_global_cleanup: detached probe threads may still
    // hold easy handles when main returns.
    std::call_once(g_curl_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
    return (cancel && cancel->load()) ? 1 : 0;
}

}  // namespace

HttpClient::HttpClient() { ensure_curl_initialized(); }

HttpResponse HttpClient::get(const std::string& url, const HttpRequestOptions& opts) const {
    return perform(url, nullptr, "", opts);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::string& content_type,
                              const HttpRequestOptions& opts) const {
    return perform(url, &body, content_type, opts);
}

HttpResponse HttpClient::perform(const std::string& url, const std::string* post_body,
                                 const std::string& content_type,
                                 const HttpRequestOptions& opts) const {
    HttpResponse resp;
    std::unique_ptr<CURL, EasyDeleter> easy(curl_easy_init());
    if (!easy) {
        resp.error = "curl_easy_init failed";
        return resp;
    }
    CURL* h = easy.get();

    std::vector<std::string> lines;
    for (const auto& kv : opts.headers) lines.push_back(kv.first + ": " + kv.second);
    if (post_body && !content_type.empty()) lines.push_back("Content-Type: " + content_type);
    curl_slist* raw_headers = nullptr;
    for (const auto& line : lines) {
        if (curl_slist* next = curl_slist_append(raw_headers, line.c_str())) raw_headers = next;
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    // libcurl treats 0 as "no timeout"; every request here is bounded.
    const long timeout_ms = std::max<long>(1, static_cast<long>(opts.timeout.count()));
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);  // required for timeouts in worker threads
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    if (headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    if (post_body) {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }
    if (opts.cancel) {
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &on_progress);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, opts.cancel.get());
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        resp.error = (rc == CURLE_ABORTED_BY_CALLBACK) ? "cancelled" : curl_easy_strerror(rc);
        resp.status = 0;
        return resp;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

JsonFetchResult to_json_result(const HttpResponse& resp) {
    JsonFetchResult out;
    out.status = resp.status;
    if (!resp.transport_ok()) {
        out.error = resp.error.empty() ? "no response" : resp.error;
        return out;
    }
    if (!resp.is_success()) {
        out.error = "HTTP " + std::to_string(resp.status);
        return out;
    }
    auto parsed = nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions*/ false);
    if (parsed.is_discarded()) {
        out.error = "invalid JSON body";
        return out;
    }
    out.data = std::move(parsed);
    return out;
}

JsonFetchResult http_get_json(const std::string& url, const HttpRequestOptions& opts) {
    HttpClient client;
    return to_json_result(client.get(url, opts));
}

JsonFetchResult http_post_json(const std::string& url, const nlohmann::json& body,
                               const HttpRequestOptions& opts) {
    HttpClient client;
    return to_json_result(client.post(url, body.dump(), "application/json", opts));
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string b = base;
    while (!b.empty() && b.back() == '/') b.pop_back();
    if (path.empty()) return b;
    if (path.front() == '/') return b + path;
    return b + "/" + path;
}

}  // namespace ll
