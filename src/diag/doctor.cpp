// llmlink diag: Doctor implementation
#include "diag/doctor.hpp"

#include <exception>
#include <fstream>
#include <ostream>
#include <utility>

#include "diag/model_catalog.hpp"
#include "diag/probe.hpp"
#include "ll_types.hpp"
#include "log/logger.hpp"

namespace ll {

namespace {
constexpr const char* kDoctorPrompt = "ping";
constexpr const char* kProbeFileName = ".llmlink_doctor_probe";
}  // namespace

bool DoctorReport::all_passed() const {
    for (const auto& c : checks)
        if (!c.success) return false;
    return !checks.empty();
}

Doctor::Doctor(DetectFn detect, JsonFetcher fetch, JsonPoster post)
    : detect_(std::move(detect)), fetch_(std::move(fetch)), post_(std::move(post)) {}

CheckResult Doctor::probe_base_url(const std::string& base_url,
                                   const HttpRequestOptions& opts) const {
    CheckResult c{"Probe base URL", false, ""};
    try {
        JsonFetchResult r = fetch_(base_url, opts);
        if (r.status > 0) {
            // Any HTTP answer, 4xx/5xx included, proves the server is reachable.
            c.success = true;
            c.detail = "HTTP " + std::to_string(r.status);
        } else {
            c.detail = r.error.empty() ? "no response" : r.error;
        }
    } catch (const std::exception& e) {
        c.detail = e.what();
    }
    return c;
}

CheckResult Doctor::fetch_models(const std::string& base_url, const HttpRequestOptions& opts,
                                 std::vector<std::string>& models) const {
    CheckResult c{"Fetch /models", false, ""};
    try {
        models = list_models(base_url, fetch_, opts);
        if (models.empty()) {
            c.detail = "Server returned no models";
        } else {
            c.success = true;
            c.detail = std::to_string(models.size()) + " model(s), first: " + models.front();
        }
    } catch (const std::exception& e) {
        c.detail = e.what();
    }
    return c;
}

CheckResult Doctor::chat_echo(const std::string& base_url, const std::string& model,
                              const HttpRequestOptions& opts) const {
    CheckResult c{"Chat completion echo", false, ""};
    nlohmann::json body = {
        {"model", model},
        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", kDoctorPrompt}}})},
        {"max_tokens", 8},
    };
    try {
        JsonFetchResult r = post_(join_url(base_url, "/chat/completions"), body, opts);
        if (!r.data) {
            c.detail = r.error.empty() ? "no response" : r.error;
        } else if (r.data->is_object() && r.data->contains("choices")) {
            c.success = true;
            c.detail = "model " + model + " replied";
        } else {
            c.detail = "response has no \"choices\"";
        }
    } catch (const std::exception& e) {
        c.detail = e.what();
    }
    return c;
}

CheckResult check_filesystem(const std::string& home_dir) {
    CheckResult c{"Filesystem write access", false, ""};
    if (home_dir.empty()) {
        c.detail = "No home directory configured";
        return c;
    }
    std::error_code ec;
    fs::create_directories(home_dir, ec);
    if (ec) {
        c.detail = "Cannot create " + home_dir + ": " + ec.message();
        return c;
    }
    fs::path probe = fs::path(home_dir) / kProbeFileName;
    {
        std::ofstream out(probe);
        out << "ok\n";
        if (!out) {
            c.detail = "Cannot write in " + home_dir;
            return c;
        }
    }
    fs::remove(probe, ec);
    c.success = true;
    c.detail = home_dir + " is writable";
    return c;
}

DoctorReport Doctor::run(const DoctorInputs& in) const {
    DoctorReport report;
    Logger::instance().info("Running doctor preflight checks");

    std::string source;
    std::string base_url = in.base_url;
    if (!base_url.empty()) {
        source = "command line";
    } else if (!in.saved_base_url.empty()) {
        base_url = in.saved_base_url;
        source = "saved state";
    } else if (detect_) {
        if (auto detected = detect_()) {
            base_url = *detected;
            source = "auto-detected";
        }
    }
    report.base_url = base_url;
    if (!base_url.empty())
        report.checks.push_back({"Resolve base URL", true, source + ": " + base_url});
    else
        report.checks.push_back({"Resolve base URL", false,
                                 "Provide --base-url, save a state, or start an auto-detectable server"});

    HttpRequestOptions opts;
    opts.timeout = in.timeout;
    Probe::Options probe_opts;
    Probe::attach_bearer(probe_opts, in.api_key);
    opts.headers = probe_opts.headers;

    CheckResult reach{"Probe base URL", false, "Skipped (no base URL)"};
    if (!base_url.empty()) reach = probe_base_url(base_url, opts);
    report.checks.push_back(reach);

    CheckResult models{"Fetch /models", false, "Skipped (base URL check failed)"};
    if (reach.success) models = fetch_models(base_url, opts, report.models);
    report.checks.push_back(models);

    std::string chat_model = !in.model.empty()         ? in.model
                             : !in.saved_model.empty() ? in.saved_model
                             : report.models.empty()   ? std::string{}
                                                       : report.models.front();
    if (!models.success)
        report.checks.push_back({"Chat completion echo", false, "Skipped (no models)"});
    else if (chat_model.empty())
        report.checks.push_back({"Chat completion echo", false, "No model available for chat completion"});
    else
        report.checks.push_back(chat_echo(base_url, chat_model, opts));

    report.checks.push_back(check_filesystem(in.home_dir));

    for (const auto& c : report.checks) {
        LogFields fields;
        fields.path = base_url;
        if (!c.success) fields.error_type = c.detail;
        log_event("doctor_check:" + c.name, c.success ? LogLevel::Debug : LogLevel::Warning, fields);
    }
    return report;
}

void print_report(const DoctorReport& report, std::ostream& os) {
    for (const auto& c : report.checks) {
        os << (c.success ? "  [ok]   " : "  [fail] ") << c.name;
        if (!c.detail.empty()) os << " - " << c.detail;
        os << "\n";
    }
    if (report.all_passed())
        os << "Doctor checks passed. You're ready to generate configs.\n";
    else
        os << "Doctor detected issues. See checklist above for details.\n";
}

}  // namespace ll
