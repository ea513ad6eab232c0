// llmlink log: LogRecord helpers
#include "log/log_record.hpp"

#include <algorithm>
#include <cctype>

namespace ll {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warning" || s == "warn") return LogLevel::Warning;
    if (s == "error") return LogLevel::Error;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const LogRecord& record) {
    j = nlohmann::json{{"level", level_name(record.level)}, {"message", record.message}};
    const auto& f = record.fields;
    if (f.event) j["event"] = *f.event;
    if (f.provider) j["provider"] = *f.provider;
    if (f.model) j["model"] = *f.model;
    if (f.path) j["path"] = *f.path;
    if (f.duration_ms) j["duration_ms"] = *f.duration_ms;
    if (f.error_type) j["error_type"] = *f.error_type;
}

}  // namespace ll
