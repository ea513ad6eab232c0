#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "ll_types.hpp"
#include "log/log_dispatcher.hpp"
#include "log/log_record.hpp"
#include "log/logger.hpp"

namespace {

struct Collected {
  std::mutex mutex;
  std::vector<nlohmann::json> records;
  int closes = 0;
};

class CollectingTransport : public ll::LogTransport {
public:
  explicit CollectingTransport(std::shared_ptr<Collected> out) : out_(std::move(out)) {}
  void send(const ll::LogRecord& record) override {
    std::lock_guard<std::mutex> lk(out_->mutex);
    out_->records.push_back(nlohmann::json(record));
  }
  void close() override {
    std::lock_guard<std::mutex> lk(out_->mutex);
    ++out_->closes;
  }

private:
  std::shared_ptr<Collected> out_;
};

// Points the singleton at string streams and restores it afterwards.
class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override { ll::Logger::instance().set_streams(&err_, &out_); }
  void TearDown() override {
    ll::Logger::instance().shutdown();
    ll::Logger::instance().configure(ll::LoggingConfig{});
    ll::Logger::instance().set_streams(nullptr, nullptr);
  }

  std::ostringstream err_;
  std::ostringstream out_;
};

}  // namespace

TEST(LogRecordTest, LevelNamesAndParsing) {
  EXPECT_STREQ(ll::level_name(ll::LogLevel::Warning), "WARNING");
  EXPECT_TRUE(ll::parse_log_level("DEBUG") == ll::LogLevel::Debug);
  EXPECT_TRUE(ll::parse_log_level("Info") == ll::LogLevel::Info);
  EXPECT_TRUE(ll::parse_log_level("warn") == ll::LogLevel::Warning);
  EXPECT_TRUE(ll::parse_log_level("error") == ll::LogLevel::Error);
  EXPECT_FALSE(ll::parse_log_level("loud").has_value());
  EXPECT_FALSE(ll::parse_log_level("").has_value());
}

TEST(LogRecordTest, JsonCarriesOnlySetFields) {
  ll::LogRecord r;
  r.level = ll::LogLevel::Error;
  r.message = "boom";
  r.fields.provider = "ollama";
  r.fields.duration_ms = 12.5;
  nlohmann::json j = r;
  EXPECT_EQ(j["level"], "ERROR");
  EXPECT_EQ(j["message"], "boom");
  EXPECT_EQ(j["provider"], "ollama");
  EXPECT_DOUBLE_EQ(j["duration_ms"].get<double>(), 12.5);
  EXPECT_FALSE(j.contains("model"));
  EXPECT_FALSE(j.contains("event"));
}

TEST_F(LoggerTest, DefaultThresholdIsWarning) {
  ll::Logger::instance().configure(ll::LoggingConfig{});
  ll::Logger::instance().info("hidden");
  ll::Logger::instance().warn("shown");
  EXPECT_EQ(err_.str(), "WARNING: shown\n");
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggerTest, VerboseEnablesDebugAndExplicitLevelWins) {
  ll::LoggingConfig cfg;
  cfg.verbose = true;
  ll::Logger::instance().configure(cfg);
  EXPECT_EQ(ll::Logger::instance().threshold(), ll::LogLevel::Debug);

  cfg.level = "error";
  ll::Logger::instance().configure(cfg);
  EXPECT_EQ(ll::Logger::instance().threshold(), ll::LogLevel::Error);
  EXPECT_FALSE(ll::Logger::instance().enabled(ll::LogLevel::Warning));
}

TEST_F(LoggerTest, JsonModeWritesStructuredEvents) {
  ll::LoggingConfig cfg;
  cfg.level = "info";
  cfg.json = true;
  ll::Logger::instance().configure(cfg);

  ll::LogFields fields;
  fields.model = "qwen";
  ll::log_event("model_selected", ll::LogLevel::Info, fields);

  auto j = nlohmann::json::parse(out_.str());
  EXPECT_EQ(j["event"], "model_selected");
  EXPECT_EQ(j["message"], "model_selected");
  EXPECT_EQ(j["model"], "qwen");
  EXPECT_EQ(j["level"], "INFO");
  EXPECT_EQ(err_.str(), "INFO: model_selected\n");
}

TEST_F(LoggerTest, FileSinkAppendsPlainLines) {
  auto path = ll::fs::temp_directory_path() / "llmlink_logger_test.log";
  ll::fs::remove(path);
  ll::LoggingConfig cfg;
  cfg.file_path = path.string();
  ll::Logger::instance().configure(cfg);
  ll::Logger::instance().error("disk line");
  ll::Logger::instance().shutdown();

  std::ifstream in(path);
  std::string line;
  ASSERT_TRUE(std::getline(in, line));
  EXPECT_EQ(line, "ERROR: disk line");
  ll::fs::remove(path);
}

TEST_F(LoggerTest, RemoteSinkReceivesRecordsAndShutdownDrains) {
  auto collected = std::make_shared<Collected>();
  auto dispatcher =
      std::make_unique<ll::LogDispatcher>(std::make_unique<CollectingTransport>(collected));
  ll::LoggingConfig cfg;
  cfg.level = "debug";
  ll::Logger::instance().configure(cfg, std::move(dispatcher));
  ASSERT_NE(ll::Logger::instance().remote(), nullptr);

  ll::Logger::instance().debug("one");
  ll::LogFields fields;
  fields.error_type = "network";
  ll::log_event("link_failed", ll::LogLevel::Error, fields);
  ll::Logger::instance().shutdown();
  EXPECT_EQ(ll::Logger::instance().remote(), nullptr);

  std::lock_guard<std::mutex> lk(collected->mutex);
  ASSERT_EQ(collected->records.size(), 2u);
  EXPECT_EQ(collected->records[0]["message"], "one");
  EXPECT_EQ(collected->records[1]["event"], "link_failed");
  EXPECT_EQ(collected->records[1]["error_type"], "network");
  EXPECT_EQ(collected->closes, 1);
}

TEST_F(LoggerTest, ReconfigureClosesPreviousDispatcher) {
  auto first = std::make_shared<Collected>();
  ll::Logger::instance().configure(
      ll::LoggingConfig{},
      std::make_unique<ll::LogDispatcher>(std::make_unique<CollectingTransport>(first)));
  ll::Logger::instance().configure(ll::LoggingConfig{});
  std::lock_guard<std::mutex> lk(first->mutex);
  EXPECT_EQ(first->closes, 1);
}
