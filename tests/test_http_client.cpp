#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "ll_types.hpp"
#include "local_http_server.hpp"
#include "log/log_dispatcher.hpp"
#include "log/log_transport.hpp"
#include "net/http_client.hpp"

using namespace std::chrono_literals;

TEST(HttpClientTest, JoinUrlNormalisesSlashes) {
  EXPECT_EQ(ll::join_url("http://h:1/v1/", "/models"), "http://h:1/v1/models");
  EXPECT_EQ(ll::join_url("http://h:1/v1", "models"), "http://h:1/v1/models");
  EXPECT_EQ(ll::join_url("http://h:1/v1//", ""), "http://h:1/v1");
}

TEST(HttpClientTest, JsonResultClassifiesResponses) {
  ll::HttpResponse ok;
  ok.status = 200;
  ok.body = R"({"data": []})";
  auto r = ll::to_json_result(ok);
  ASSERT_TRUE(r.data.has_value());
  EXPECT_TRUE(r.data->contains("data"));

  ll::HttpResponse not_found;
  not_found.status = 404;
  not_found.body = "{}";
  r = ll::to_json_result(not_found);
  EXPECT_FALSE(r.data.has_value());
  EXPECT_EQ(r.status, 404);
  EXPECT_EQ(r.error, "HTTP 404");

  ll::HttpResponse garbage;
  garbage.status = 200;
  garbage.body = "<html>";
  r = ll::to_json_result(garbage);
  EXPECT_FALSE(r.data.has_value());
  EXPECT_EQ(r.error, "invalid JSON body");
}

TEST(HttpClientTest, RefusedConnectionReportsTransportError) {
  ll::HttpClient client;
  ll::HttpRequestOptions opts;
  opts.timeout = 1000ms;
  auto resp = client.get("http://127.0.0.1:9/", opts);
  EXPECT_FALSE(resp.transport_ok());
  EXPECT_EQ(resp.status, 0);
  EXPECT_FALSE(resp.error.empty());
}

TEST(HttpClientTest, RaisedCancelFlagAbortsTransfer) {
  ll::HttpClient client;
  ll::HttpRequestOptions opts;
  opts.timeout = 1000ms;
  opts.cancel = ll::make_cancel_flag();
  opts.cancel->store(true);
  // 192.0.2.0/24 is reserved for documentation and never routes.
  auto start = std::chrono::steady_clock::now();
  auto resp = client.get("http://192.0.2.1/", opts);
  EXPECT_FALSE(resp.is_success());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
}

TEST(HttpClientTest, ZeroTimeoutStillBoundsSilentServer) {
  LocalHttpServer server(200, LocalHttpServer::Mode::Silent);
  ll::HttpClient client;
  ll::HttpRequestOptions opts;
  opts.timeout = 0ms;
  auto start = std::chrono::steady_clock::now();
  auto resp = client.get(server.url("/v1/models"), opts);
  EXPECT_FALSE(resp.transport_ok());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(HttpLogTransportTest, PostsRecordAsJson) {
  LocalHttpServer server(200);
  ll::HttpLogTransport transport(server.url("/logs"));
  ll::LogRecord record;
  record.level = ll::LogLevel::Warning;
  record.message = "detect_base_url";
  record.fields.event = "detect_base_url";
  record.fields.duration_ms = 42.0;
  ASSERT_NO_THROW(transport.send(record));

  std::string request = server.wait_request();
  EXPECT_EQ(request.rfind("POST /logs HTTP/1.1", 0), 0u);
  EXPECT_NE(request.find("Content-Type: application/json"), std::string::npos);
  auto body = nlohmann::json::parse(LocalHttpServer::body_of(request));
  EXPECT_EQ(body["level"], "WARNING");
  EXPECT_EQ(body["message"], "detect_base_url");
  EXPECT_EQ(body["event"], "detect_base_url");
  EXPECT_DOUBLE_EQ(body["duration_ms"].get<double>(), 42.0);
  EXPECT_FALSE(body.contains("model"));
}

TEST(HttpLogTransportTest, ErrorStatusThrowsHttpStatus) {
  LocalHttpServer server(500);
  ll::HttpLogTransport transport(server.url("/logs"));
  try {
    transport.send(ll::LogRecord{});
    FAIL() << "expected LinkError";
  } catch (const ll::LinkError& e) {
    EXPECT_EQ(e.code(), ll::LinkErrc::HttpStatus);
  }
}

TEST(HttpLogTransportTest, RefusedConnectionThrowsNetwork) {
  ll::HttpLogTransport transport("http://127.0.0.1:9/logs", 1000ms);
  try {
    transport.send(ll::LogRecord{});
    FAIL() << "expected LinkError";
  } catch (const ll::LinkError& e) {
    EXPECT_EQ(e.code(), ll::LinkErrc::Network);
  }
}

TEST(HttpLogTransportTest, SendAfterCloseIsNoOp) {
  LocalHttpServer server(200);
  ll::HttpLogTransport transport(server.url("/logs"));
  transport.close();
  EXPECT_NO_THROW(transport.send(ll::LogRecord{}));
  EXPECT_TRUE(server.wait_request(200ms).empty());
}

TEST(HttpLogTransportTest, DispatcherCountsUnreachableCollectorAsFailed) {
  ll::DispatcherOptions opts;
  opts.synchronous = true;
  ll::LogDispatcher dispatcher(
      std::make_unique<ll::HttpLogTransport>("http://127.0.0.1:9/logs", 1000ms), opts);
  ll::LogRecord record;
  record.message = "lost";
  EXPECT_TRUE(dispatcher.enqueue(record));
  EXPECT_EQ(dispatcher.failed(), 1u);
  EXPECT_EQ(dispatcher.delivered(), 0u);
  dispatcher.close();
}

TEST(HttpLogTransportTest, DispatcherDeliversToCollector) {
  LocalHttpServer server(200);
  {
    ll::LogDispatcher dispatcher(std::make_unique<ll::HttpLogTransport>(server.url("/logs")));
    ll::LogRecord record;
    record.message = "shipped";
    dispatcher.enqueue(record);
    dispatcher.close();
    EXPECT_EQ(dispatcher.delivered(), 1u);
  }
  auto body = nlohmann::json::parse(LocalHttpServer::body_of(server.wait_request()));
  EXPECT_EQ(body["message"], "shipped");
}
