#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "diag/endpoint_race.hpp"
#include "diag/probe.hpp"
#include "local_http_server.hpp"

using namespace std::chrono_literals;

namespace {

ll::JsonFetchResult ok_result(nlohmann::json body) {
  ll::JsonFetchResult r;
  r.status = 200;
  r.data = std::move(body);
  return r;
}

}  // namespace

TEST(ProbeTest, SuccessRequiresObjectWithDataKey) {
  auto out = ll::classify_probe_response("http://h/v1", ok_result({{"data", nlohmann::json::array()}}));
  EXPECT_TRUE(out.success);
  EXPECT_EQ(out.candidate, "http://h/v1");
  EXPECT_TRUE(out.payload.contains("data"));
  EXPECT_TRUE(out.error.empty());
}

TEST(ProbeTest, MissingDataKeyIsFailure) {
  auto out = ll::classify_probe_response("c", ok_result({{"object", "list"}}));
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.error, "response has no \"data\" key");
}

TEST(ProbeTest, NonObjectBodyIsFailure) {
  auto out = ll::classify_probe_response("c", ok_result(nlohmann::json::array({1, 2})));
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.error, "response is not a JSON object");
}

TEST(ProbeTest, TransportErrorIsReported) {
  ll::JsonFetchResult r;
  r.status = 503;
  r.error = "HTTP 503";
  auto out = ll::classify_probe_response("c", r);
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.error, "HTTP 503");

  auto empty = ll::classify_probe_response("c", ll::JsonFetchResult{});
  EXPECT_EQ(empty.error, "no data");
}

TEST(ProbeTest, FetchesModelsEndpointWithTimeoutAndHeaders) {
  std::string seen_url;
  ll::HttpRequestOptions seen_opts;
  ll::Probe::Options opts;
  ll::Probe::attach_bearer(opts, "sk-test");
  ll::Probe probe(opts, [&](const std::string& url, const ll::HttpRequestOptions& o) {
    seen_url = url;
    seen_opts = o;
    return ok_result({{"data", nlohmann::json::array()}});
  });

  auto cancel = ll::make_cancel_flag();
  auto out = probe("http://localhost:1234/v1/", 750ms, cancel);
  EXPECT_TRUE(out.success);
  EXPECT_EQ(seen_url, "http://localhost:1234/v1/models");
  EXPECT_EQ(seen_opts.timeout, 750ms);
  EXPECT_EQ(seen_opts.cancel, cancel);
  EXPECT_EQ(seen_opts.headers["Authorization"], "Bearer sk-test");
  EXPECT_GE(out.elapsed_ms, 0.0);
}

TEST(ProbeTest, ThrowingFetcherBecomesFailure) {
  ll::Probe probe(ll::Probe::Options{}, [](const std::string&, const ll::HttpRequestOptions&)
                                            -> ll::JsonFetchResult {
    throw std::runtime_error("socket exploded");
  });
  ll::ProbeOutcome out;
  EXPECT_NO_THROW(out = probe("http://x", 100ms));
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.candidate, "http://x");
  EXPECT_EQ(out.error, "socket exploded");
}

TEST(ProbeTest, BearerSkipsPlaceholderKeys) {
  ll::Probe::Options opts;
  ll::Probe::attach_bearer(opts, "");
  ll::Probe::attach_bearer(opts, "nullkey");
  ll::Probe::attach_bearer(opts, "NULLKEY");
  EXPECT_TRUE(opts.headers.empty());
}

TEST(ProbeTest, ProbeFnForwardsToProbe) {
  ll::Probe probe(ll::Probe::Options{}, [](const std::string&, const ll::HttpRequestOptions&) {
    return ok_result({{"data", nlohmann::json::array()}});
  });
  ll::ProbeFn fn = ll::make_probe_fn(probe);
  auto out = fn("http://y", 100ms, nullptr);
  EXPECT_TRUE(out.success);
  EXPECT_EQ(out.candidate, "http://y");
}

TEST(ProbeTest, RefusedConnectionFailsQuickly) {
  // Port 9 (discard) is closed on test machines.
  ll::Probe probe;
  auto start = std::chrono::steady_clock::now();
  auto out = probe("http://127.0.0.1:9/v1", 1000ms);
  EXPECT_FALSE(out.success);
  EXPECT_FALSE(out.error.empty());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(NonPositiveTimeoutTest, FailsWithoutRequest) {
  int calls = 0;
  ll::Probe check(ll::Probe::Options{}, [&](const std::string&, const ll::HttpRequestOptions&) {
    ++calls;
    return ok_result({{"data", nlohmann::json::array()}});
  });
  for (auto timeout : {0ms, -5ms}) {
    auto out = check("http://h/v1", timeout);
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.candidate, "http://h/v1");
    EXPECT_EQ(out.error, "invalid timeout");
  }
  EXPECT_EQ(calls, 0);
}

TEST(NonPositiveTimeoutTest, RaceAgainstSilentServerReturns) {
  LocalHttpServer server(200, LocalHttpServer::Mode::Silent);
  ll::EndpointRace race(ll::make_probe_fn(ll::Probe()));
  auto start = std::chrono::steady_clock::now();
  auto winner = race.race({server.url("/v1")}, 0ms);
  EXPECT_FALSE(winner.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
  auto failures = race.last_failures();
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].error, "invalid timeout");
}
