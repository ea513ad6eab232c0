// llmlink diag: Probe implementation
#include "diag/probe.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace ll {

Probe::Probe() : Probe(Options{}) {}

Probe::Probe(Options opts, JsonFetcher fetcher)
    : opts_(std::move(opts)), fetcher_(std::move(fetcher)) {
    if (!fetcher_) fetcher_ = &http_get_json;
}

std::string Probe::endpoint_url(const std::string& candidate) const {
    return join_url(candidate, opts_.path);
}

void Probe::attach_bearer(Options& opts, const std::string& api_key) {
    if (api_key.empty()) return;
    std::string upper = api_key;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "NULLKEY") return;
    opts.headers["Authorization"] = "Bearer " + api_key;
}

ProbeOutcome classify_probe_response(const std::string& candidate,
                                     const JsonFetchResult& result) {
    ProbeOutcome out;
    out.candidate = candidate;
    if (!result.data) {
        out.error = result.error.empty() ? "no data" : result.error;
        return out;
    }
    const auto& doc = *result.data;
    if (!doc.is_object()) {
        out.error = "response is not a JSON object";
        return out;
    }
    if (!doc.contains("data")) {
        out.error = "response has no \"data\" key";
        return out;
    }
    out.success = true;
    out.payload = doc;
    return out;
}

ProbeOutcome Probe::operator()(const std::string& candidate,
                               std::chrono::milliseconds timeout,
                               const CancelFlag& cancel) const {
    auto start = std::chrono::steady_clock::now();
    ProbeOutcome out;
    if (timeout.count() <= 0) {
        out.candidate = candidate;
        out.error = "invalid timeout";
        return out;
    }
    HttpRequestOptions req;
    req.timeout = timeout;
    req.headers = opts_.headers;
    req.cancel = cancel;
    try {
        out = classify_probe_response(candidate, fetcher_(endpoint_url(candidate), req));
    } catch (const std::exception& e) {
        out = ProbeOutcome{};
        out.candidate = candidate;
        out.error = e.what();
    }
    out.elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return out;
}

ProbeFn make_probe_fn(Probe probe) {
    return [probe = std::move(probe)](const std::string& candidate,
                                      std::chrono::milliseconds timeout,
                                      const CancelFlag& cancel) {
        return probe(candidate, timeout, cancel);
    };
}

}  // namespace ll
