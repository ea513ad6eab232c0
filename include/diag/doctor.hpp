// llmlink diag: connectivity and filesystem preflight checks
#pragma once

#include <chrono>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "diag/endpoint_race.hpp"
#include "net/http_client.hpp"

namespace ll {

struct CheckResult {
  std::string name;
  bool success = false;
  std::string detail;
};

struct DoctorInputs {
  std::string base_url;        // from the command line
  std::string saved_base_url;  // from linker state
  std::string model;           // from the command line
  std::string saved_model;     // from linker state
  std::string api_key;
  std::string home_dir;        // agent home, checked for write access
  std::chrono::milliseconds timeout{3000};
};

struct DoctorReport {
  std::vector<CheckResult> checks;
  std::string base_url;
  std::vector<std::string> models;

  bool all_passed() const;
  int exit_code() const { return all_passed() ? 0 : 1; }
};

// Runs the checks in order, skipping those whose prerequisite failed.
// Never throws; network access goes through the injected functions.
class Doctor {
public:
  using DetectFn = std::function<RaceResult()>;

  explicit Doctor(DetectFn detect, JsonFetcher fetch = &http_get_json,
                  JsonPoster post = &http_post_json);

  DoctorReport run(const DoctorInputs& in) const;

private:
  CheckResult probe_base_url(const std::string& base_url, const HttpRequestOptions& opts) const;
  CheckResult fetch_models(const std::string& base_url, const HttpRequestOptions& opts,
                           std::vector<std::string>& models) const;
  CheckResult chat_echo(const std::string& base_url, const std::string& model,
                        const HttpRequestOptions& opts) const;

  DetectFn detect_;
  JsonFetcher fetch_;
  JsonPoster post_;
};

CheckResult check_filesystem(const std::string& home_dir);

void print_report(const DoctorReport& report, std::ostream& os);

}  // namespace ll
