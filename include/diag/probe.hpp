// llmlink diag: single bounded-time health check against one candidate
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "net/http_client.hpp"

namespace ll {

struct ProbeOutcome {
  std::string candidate;
  bool success = false;
  nlohmann::json payload;  // parsed body when success
  std::string error;       // reason when !success
  double elapsed_ms = 0.0;
};

// Strategy used by EndpointRace; must not throw, but throwing is tolerated.
using ProbeFn = std::function<ProbeOutcome(const std::string& candidate,
                                           std::chrono::milliseconds timeout,
                                           const CancelFlag& cancel)>;

// GET <candidate><path> and classify: success iff the body is a JSON object
// containing a "data" key. A non-positive timeout fails without a request.
// Never throws.
class Probe {
public:
  struct Options {
    std::string path = "/models";
    std::map<std::string, std::string> headers;
  };

  Probe();
  explicit Probe(Options opts, JsonFetcher fetcher = nullptr);

  ProbeOutcome operator()(const std::string& candidate,
                          std::chrono::milliseconds timeout,
                          const CancelFlag& cancel = nullptr) const;

  std::string endpoint_url(const std::string& candidate) const;

  // Bearer header helper; ignores empty keys and the "NULLKEY" placeholder.
  static void attach_bearer(Options& opts, const std::string& api_key);

private:
  Options opts_;
  JsonFetcher fetcher_;
};

ProbeOutcome classify_probe_response(const std::string& candidate,
                                     const JsonFetchResult& result);

// Adapts a Probe to the ProbeFn strategy signature.
ProbeFn make_probe_fn(Probe probe);

}  // namespace ll
