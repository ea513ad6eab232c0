// llmlink log: remote transport strategy for LogDispatcher
#pragma once

#include <chrono>
#include <string>

#include "log/log_record.hpp"
#include "net/http_client.hpp"

namespace ll {

// One blocking delivery per call. send() may throw; LogDispatcher absorbs it.
class LogTransport {
public:
  virtual ~LogTransport() = default;
  virtual void send(const LogRecord& record) = 0;
  virtual void close() {}
};

// POSTs each record as a JSON object to a fixed URL.
class HttpLogTransport : public LogTransport {
public:
  explicit HttpLogTransport(std::string url,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

  void send(const LogRecord& record) override;
  void close() override;

  const std::string& url() const { return url_; }

private:
  std::string url_;
  HttpRequestOptions opts_;
  HttpClient client_;
  bool closed_ = false;
};

}  // namespace ll
