#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace ll {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(LLMLINK_LIB_BUILD)
        #define LLMLINK_API __declspec(dllexport)
    #else
        #define LLMLINK_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(LLMLINK_LIB_BUILD)
        #define LLMLINK_API __attribute__((visibility("default")))
    #else
        #define LLMLINK_API
    #endif
#endif

enum class LinkErrc {
    Unknown = 1, Network, HttpStatus, InvalidJson, NotFound, Io, InvalidConfig,
};

struct LLMLINK_API LinkError : public std::runtime_error {
    explicit LinkError(const std::string& what)
        : std::runtime_error(what), code_(LinkErrc::Unknown) {}
    LinkError(LinkErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    LinkErrc code() const noexcept { return code_; }
private:
    LinkErrc code_;
};

inline const char* errc_name(LinkErrc code) {
    switch (code) {
        case LinkErrc::Unknown: return "unknown";
        case LinkErrc::Network: return "network";
        case LinkErrc::HttpStatus: return "http_status";
        case LinkErrc::InvalidJson: return "invalid_json";
        case LinkErrc::NotFound: return "not_found";
        case LinkErrc::Io: return "io";
        case LinkErrc::InvalidConfig: return "invalid_config";
    }
    return "unknown";
}

} // namespace ll
