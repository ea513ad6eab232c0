// llmlink log: process-wide logging front-end
#pragma once

#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

#include "log/log_dispatcher.hpp"
#include "log/log_record.hpp"

namespace ll {

struct LoggingConfig {
  bool verbose = false;
  std::string level;      // explicit level name; overrides verbose when valid
  std::string file_path;  // plain-text tee, appended
  bool json = false;      // JSON lines on the output stream
};

// Human-readable lines go to the error stream, optional JSON lines to the
// output stream, optional file, optional remote dispatcher. Logging calls
// never throw.
class Logger {
public:
  static Logger& instance();

  Logger();
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Replaces every sink installed by a previous configure(); the previous
  // dispatcher is closed. `remote` may be null.
  void configure(const LoggingConfig& config, std::unique_ptr<LogDispatcher> remote = nullptr);

  // Redirect the console sinks (tests). Streams must outlive the logger use.
  void set_streams(std::ostream* err, std::ostream* out);

  LogLevel threshold() const;
  bool enabled(LogLevel level) const;

  void log(const LogRecord& record);
  void log(LogLevel level, const std::string& message);
  void debug(const std::string& message) { log(LogLevel::Debug, message); }
  void info(const std::string& message) { log(LogLevel::Info, message); }
  void warn(const std::string& message) { log(LogLevel::Warning, message); }
  void error(const std::string& message) { log(LogLevel::Error, message); }

  // Closes the remote dispatcher (graceful drain) and the file sink.
  void shutdown();

  // Null when no remote sink is configured.
  const LogDispatcher* remote() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return remote_.get();
  }

private:
  void release_sinks_locked();

  mutable std::mutex mutex_;
  LogLevel threshold_ = LogLevel::Warning;
  bool json_ = false;
  std::ostream* err_;
  std::ostream* out_;
  std::ofstream file_;
  std::shared_ptr<LogDispatcher> remote_;  // shared with in-progress log() calls
};

// Structured event record whose message is the event name.
void log_event(const std::string& event, LogLevel level = LogLevel::Info, LogFields fields = {});

}  // namespace ll
