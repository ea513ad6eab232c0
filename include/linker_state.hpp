// Last choices made by the linker, persisted as JSON between runs
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ll {

struct LinkerState {
  std::string base_url;
  std::string provider;
  std::string profile;
  std::string model;
  int context_window = 0;
};

void to_json(nlohmann::json& j, const LinkerState& state);
void from_json(const nlohmann::json& j, LinkerState& state);

// std::nullopt when the file is missing or unreadable (a warning is logged).
std::optional<LinkerState> load_state(const std::string& path);

// Creates parent directories. Throws LinkError(Io) on failure.
void save_state(const LinkerState& state, const std::string& path);

}  // namespace ll
