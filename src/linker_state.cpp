// LinkerState JSON persistence
#include "linker_state.hpp"

#include <fstream>
#include <iomanip>

#include "ll_types.hpp"
#include "log/logger.hpp"

namespace ll {

void to_json(nlohmann::json& j, const LinkerState& state) {
    j = nlohmann::json{{"base_url", state.base_url},
                         {"provider", state.provider},
                         {"profile", state.profile},
                         {"model", state.model},
                         {"context_window", state.context_window}};
}

void from_json(const nlohmann::json& j, LinkerState& state) {
    state.base_url = j.value("base_url", std::string{});
    state.provider = j.value("provider", std::string{});
    state.profile = j.value("profile", std::string{});
    state.model = j.value("model", std::string{});
    state.context_window = j.value("context_window", 0);
}

std::optional<LinkerState> load_state(const std::string& path) {
    if (!fs::exists(path)) return std::nullopt;
    std::ifstream in(path);
    if (!in) {
        Logger::instance().warn("Could not open " + path);
        return std::nullopt;
    }
    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) {
            Logger::instance().warn("Could not load " + path + ": not a JSON object");
            return std::nullopt;
        }
        return j.get<LinkerState>();
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().warn("Could not load " + path + ": " + e.what());
        return std::nullopt;
    }
}

void save_state(const LinkerState& state, const std::string& path) {
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw LinkError(LinkErrc::Io, "Cannot create " + target.parent_path().string() + ": " + ec.message());
    }
    std::ofstream out(path);
    if (!out) throw LinkError(LinkErrc::Io, "Cannot write " + path);
    out << std::setw(2) << nlohmann::json(state) << std::endl;
    if (!out) throw LinkError(LinkErrc::Io, "Failed writing " + path);
}

}  // namespace ll
