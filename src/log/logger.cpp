// llmlink log: Logger implementation
#include "log/logger.hpp"

#include <iostream>
#include <utility>

namespace ll {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : err_(&std::cerr), out_(&std::cout) {}

Logger::~Logger() { shutdown(); }

void Logger::configure(const LoggingConfig& config, std::unique_ptr<LogDispatcher> remote) {
    std::shared_ptr<LogDispatcher> previous;
    std::string file_error;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        previous = std::move(remote_);
        release_sinks_locked();

        if (auto lvl = parse_log_level(config.level))
            threshold_ = *lvl;
        else
            threshold_ = config.verbose ? LogLevel::Debug : LogLevel::Warning;
        json_ = config.json;
        if (!config.file_path.empty()) {
            file_.open(config.file_path, std::ios::app);
            if (!file_.is_open()) file_error = config.file_path;
        }
        remote_ = std::move(remote);
    }
    if (previous) previous->close();
    if (!file_error.empty()) warn("Could not open log file: " + file_error);
}

void Logger::set_streams(std::ostream* err, std::ostream* out) {
    std::lock_guard<std::mutex> lk(mutex_);
    err_ = err ? err : &std::cerr;
    out_ = out ? out : &std::cout;
}

LogLevel Logger::threshold() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return threshold_;
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(threshold());
}

void Logger::log(const LogRecord& record) {
    std::shared_ptr<LogDispatcher> remote;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (static_cast<int>(record.level) < static_cast<int>(threshold_)) return;

        const std::string line = std::string(level_name(record.level)) + ": " + record.message;
        *err_ << line << '\n';
        if (json_) {
            nlohmann::json j = record;
            *out_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        }
        if (file_.is_open()) file_ << line << std::endl;
        remote = remote_;
    }
    // Outside the lock: a synchronous dispatcher sends on this thread.
    if (remote) remote->enqueue(record);
}

void Logger::log(LogLevel level, const std::string& message) {
    LogRecord record;
    record.level = level;
    record.message = message;
    log(record);
}

void Logger::shutdown() {
    std::shared_ptr<LogDispatcher> remote;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        remote = std::move(remote_);
        release_sinks_locked();
    }
    if (remote) remote->close();
}

void Logger::release_sinks_locked() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    file_.clear();
    json_ = false;
}

void log_event(const std::string& event, LogLevel level, LogFields fields) {
    LogRecord record;
    record.level = level;
    record.message = event;
    record.fields = std::move(fields);
    record.fields.event = event;
    Logger::instance().log(record);
}

}  // namespace ll
