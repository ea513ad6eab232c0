// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>
#include "ll_types.hpp" // for ll::fs alias

namespace ll {

namespace {

// Keeps `current` unless the node holds a positive integer.
void read_positive(const YAML::Node& root, const char* key, int& current) {
    if (!root[key]) return;
    int v = root[key].as<int>();
    if (v > 0) {
        current = v;
    } else {
        std::cerr << "Warning: config key '" << key << "' must be positive; keeping "
                  << current << "." << std::endl;
    }
}

} // namespace

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "llmlink CLI configuration.";
    root["candidate_urls"] = config.candidate_urls;
    root["probe_timeout_ms"] = config.probe_timeout_ms;
    root["log_level"] = config.log_level;
    root["log_file"] = config.log_file;
    root["log_json"] = config.log_json;
    root["log_remote"] = config.log_remote;
    root["log_queue_capacity"] = config.log_queue_capacity;
    root["log_drain_timeout_ms"] = config.log_drain_timeout_ms;
    root["log_synchronous"] = config.log_synchronous;
    root["state_path"] = config.state_path;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["candidate_urls"] && root["candidate_urls"].IsSequence()) {
                config.candidate_urls = root["candidate_urls"].as<std::vector<std::string>>();
            } else if (root["candidate_url"] && root["candidate_url"].IsScalar()) {
                config.candidate_urls.clear();
                config.candidate_urls.push_back(root["candidate_url"].as<std::string>());
            }
            read_positive(root, "probe_timeout_ms", config.probe_timeout_ms);
            if (root["log_level"]) config.log_level = root["log_level"].as<std::string>();
            if (root["log_file"]) config.log_file = root["log_file"].as<std::string>();
            if (root["log_json"]) config.log_json = root["log_json"].as<bool>();
            if (root["log_remote"]) config.log_remote = root["log_remote"].as<std::string>();
            read_positive(root, "log_queue_capacity", config.log_queue_capacity);
            read_positive(root, "log_drain_timeout_ms", config.log_drain_timeout_ms);
            if (root["log_synchronous"]) config.log_synchronous = root["log_synchronous"].as<bool>();
            if (root["state_path"]) config.state_path = root["state_path"].as<std::string>();
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
            std::string loaded = config.loaded_config_path;
            config = CliConfig{};
            config.loaded_config_path = loaded;
        }
    } else if (config_path == kDefaultConfigPath) {
        std::cout << "Configuration file '" << kDefaultConfigPath
                  << "' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, kDefaultConfigPath)) {
            config.loaded_config_path = fs::absolute(kDefaultConfigPath).string();
        }
    } else {
        std::cerr << "Warning: config file '" << config_path
                  << "' not found. Using default settings." << std::endl;
    }
}

std::string agent_home_dir() {
    if (const char* home = std::getenv("CODEX_HOME"); home && *home) return home;
    const char* user_home = std::getenv("HOME");
    fs::path base = (user_home && *user_home) ? fs::path(user_home) : fs::current_path();
    return (base / ".codex").string();
}

std::string resolve_state_path(const CliConfig& config) {
    if (!config.state_path.empty()) return config.state_path;
    return (fs::path(agent_home_dir()) / "linker_state.json").string();
}

} // namespace ll
