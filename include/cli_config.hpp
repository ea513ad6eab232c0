// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <string>
#include <vector>

#include "diag/provider.hpp"

namespace ll {

struct CliConfig {
    std::string loaded_config_path;
    // Base URLs probed by auto-detection.
    std::vector<std::string> candidate_urls = default_candidates();
    int probe_timeout_ms = 3000;
    // "debug", "info", "warning" or "error"; empty derives it from --verbose.
    std::string log_level = "";
    std::string log_file = "";
    bool log_json = false;
    // URL receiving log records as JSON POSTs; empty disables remote logging.
    std::string log_remote = "";
    int log_queue_capacity = 256;
    int log_drain_timeout_ms = 2000;
    bool log_synchronous = false;
    // Empty means $CODEX_HOME/linker_state.json.
    std::string state_path = "";
};

inline constexpr const char* kDefaultConfigPath = "llmlink.yaml";

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "llmlink.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// $CODEX_HOME, or ~/.codex when unset.
std::string agent_home_dir();

std::string resolve_state_path(const CliConfig& config);

} // namespace ll
