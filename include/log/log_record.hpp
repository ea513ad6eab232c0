// llmlink log: structured log record and its JSON form
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ll {

enum class LogLevel { Debug, Info, Warning, Error };

const char* level_name(LogLevel level);

// Accepts debug|info|warning|warn|error in any case.
std::optional<LogLevel> parse_log_level(const std::string& text);

struct LogFields {
  std::optional<std::string> event;
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<std::string> path;
  std::optional<double> duration_ms;
  std::optional<std::string> error_type;
};

struct LogRecord {
  LogLevel level = LogLevel::Info;
  std::string message;
  LogFields fields;
};

// {"level": ..., "message": ...} plus every structured field that is set.
void to_json(nlohmann::json& j, const LogRecord& record);

}  // namespace ll
