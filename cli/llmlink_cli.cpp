// FILE: cli/llmlink_cli.cpp
#include <getopt.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "cli/ask.hpp"
#include "cli/print_cli_help.hpp"
#include "cli_config.hpp"
#include "diag/doctor.hpp"
#include "diag/endpoint_race.hpp"
#include "diag/model_catalog.hpp"
#include "diag/probe.hpp"
#include "diag/provider.hpp"
#include "linker_state.hpp"
#include "ll_types.hpp"
#include "log/log_dispatcher.hpp"
#include "log/log_transport.hpp"
#include "log/logger.hpp"

using namespace ll;

namespace {

struct CliOptions {
    bool auto_detect = false;
    bool list_models = false;
    bool doctor = false;
    bool verbose = false;
    std::string base_url;
    std::string model;
    std::string provider;
    std::string profile;
    std::string api_key;
};

std::vector<std::string> split_csv(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto b = item.find_first_not_of(" \t");
        auto e = item.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

void configure_logging(const CliConfig& config, bool verbose) {
    LoggingConfig lc;
    lc.verbose = verbose;
    lc.level = config.log_level;
    lc.file_path = config.log_file;
    lc.json = config.log_json;

    std::unique_ptr<LogDispatcher> remote;
    if (!config.log_remote.empty()) {
        DispatcherOptions opts;
        opts.capacity = static_cast<std::size_t>(config.log_queue_capacity);
        opts.drain_timeout = std::chrono::milliseconds(config.log_drain_timeout_ms);
        opts.synchronous = config.log_synchronous;
        remote = std::make_unique<LogDispatcher>(
            std::make_unique<HttpLogTransport>(config.log_remote), opts);
    }
    Logger::instance().configure(lc, std::move(remote));
}

RaceResult detect_base_url(const CliConfig& config, const std::string& api_key) {
    std::cout << "Auto-detecting OpenAI-compatible servers..." << std::endl;
    Probe::Options probe_opts;
    Probe::attach_bearer(probe_opts, api_key);
    EndpointRace race(make_probe_fn(Probe(probe_opts)));
    race.set_observer([](const ProbeOutcome& o) {
        Logger::instance().debug("No response from " + o.candidate + ": " + o.error);
        std::cout << "  - " << o.candidate << " not responding to /models (" << o.error << ")\n";
    });

    auto start = std::chrono::steady_clock::now();
    RaceResult winner =
        race.race(config.candidate_urls, std::chrono::milliseconds(config.probe_timeout_ms));
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
                    .count();

    LogFields fields;
    fields.duration_ms = ms;
    if (winner) {
        fields.path = *winner;
        log_event("detect_base_url", LogLevel::Info, fields);
        std::cout << "Detected server: " << *winner << std::endl;
    } else {
        fields.error_type = "no_server";
        log_event("detect_base_url", LogLevel::Warning, fields);
        std::cout << "No server auto-detected." << std::endl;
    }
    return winner;
}

HttpRequestOptions request_options(const CliConfig& config, const std::string& api_key) {
    HttpRequestOptions opts;
    opts.timeout = std::chrono::milliseconds(config.probe_timeout_ms);
    Probe::Options probe_opts;
    Probe::attach_bearer(probe_opts, api_key);
    opts.headers = probe_opts.headers;
    return opts;
}

int run_doctor(const CliConfig& config, const CliOptions& cli) {
    auto saved = load_state(resolve_state_path(config));
    DoctorInputs in;
    in.base_url = cli.base_url;
    in.model = cli.model;
    if (saved) {
        in.saved_base_url = saved->base_url;
        in.saved_model = saved->model;
    }
    in.api_key = cli.api_key;
    in.home_dir = agent_home_dir();
    in.timeout = std::chrono::milliseconds(config.probe_timeout_ms);

    Doctor doctor([&config, &cli] { return detect_base_url(config, cli.api_key); });
    std::cout << "Running doctor preflight checks..." << std::endl;
    DoctorReport report = doctor.run(in);
    print_report(report, std::cout);
    return report.exit_code();
}

// Flag, then saved state (unless --auto), then auto-detection.
std::optional<std::string> resolve_base_url(const CliConfig& config, const CliOptions& cli,
                                            const std::optional<LinkerState>& saved) {
    if (!cli.base_url.empty()) return cli.base_url;
    if (!cli.auto_detect && saved && !saved->base_url.empty()) {
        std::cout << "Using saved base URL: " << saved->base_url << std::endl;
        return saved->base_url;
    }
    return detect_base_url(config, cli.api_key);
}

std::string choose_model(const CliOptions& cli, const std::vector<std::string>& models,
                         const std::optional<LinkerState>& saved) {
    if (!cli.model.empty()) return cli.model;
    if (models.empty()) return "";
    std::size_t def = 0;
    if (saved) {
        for (std::size_t i = 0; i < models.size(); ++i)
            if (models[i] == saved->model) def = i;
    }
    if (models.size() > 1 && ::isatty(STDIN_FILENO))
        return models[ask_choice("Available models:", models, def, std::cin, std::cout)];
    return models[def];
}

int run_link(const CliConfig& config, const CliOptions& cli) {
    const std::string state_path = resolve_state_path(config);
    auto saved = load_state(state_path);

    auto base_url = resolve_base_url(config, cli, saved);
    if (!base_url) {
        std::cerr << "No server available. Start a local server or pass --base-url." << std::endl;
        return 1;
    }

    const HttpRequestOptions opts = request_options(config, cli.api_key);
    auto models = list_models(*base_url, &http_get_json, opts);
    if (cli.list_models) {
        for (const auto& m : models) std::cout << m << "\n";
        return 0;
    }

    std::string model = choose_model(cli, models, saved);
    if (model.empty()) {
        std::cerr << "Server at " << *base_url << " reported no models; pass --model." << std::endl;
        return 1;
    }

    LinkerState state;
    state.base_url = *base_url;
    state.provider = cli.provider.empty() ? resolve_provider(*base_url) : cli.provider;
    state.profile = cli.profile.empty() ? state.provider : cli.profile;
    state.model = model;
    state.context_window = try_auto_context_window(*base_url, model, &http_get_json, opts);

    save_state(state, state_path);
    LogFields fields;
    fields.provider = state.provider;
    fields.model = state.model;
    fields.path = state_path;
    log_event("state_saved", LogLevel::Info, fields);

    std::cout << "\nProvider: " << provider_label(state.provider) << " (" << state.provider << ")\n"
              << "Base URL: " << state.base_url << "\n"
              << "Model:    " << state.model << "\n"
              << "Profile:  " << state.profile << "\n";
    if (state.context_window > 0)
        std::cout << "Context:  " << state.context_window << " tokens\n";
    std::cout << "Saved linker state: " << state_path << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    // Fast path: help needs no config or logging.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    CliConfig config;
    CliOptions cli;
    std::string custom_config_path;

    const char* const short_opts = "hab:m:P:p:lv";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"auto", no_argument, nullptr, 'a'},
        {"base-url", required_argument, nullptr, 'b'}, {"model", required_argument, nullptr, 'm'},
        {"provider", required_argument, nullptr, 'P'}, {"profile", required_argument, nullptr, 'p'},
        {"list-models", no_argument, nullptr, 'l'}, {"verbose", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 2001}, {"candidates", required_argument, nullptr, 2002},
        {"timeout", required_argument, nullptr, 2003}, {"api-key", required_argument, nullptr, 2004},
        {"doctor", no_argument, nullptr, 2005}, {"log-level", required_argument, nullptr, 2006},
        {"log-file", required_argument, nullptr, 2007}, {"log-json", no_argument, nullptr, 2008},
        {"log-remote", required_argument, nullptr, 2009}, {"log-sync", no_argument, nullptr, 2010},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    opterr = 0;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) { custom_config_path = optarg; }
    }
    optind = 1;
    opterr = 1;

    load_or_create_config(custom_config_path.empty() ? kDefaultConfigPath : custom_config_path, config);

    try {
        while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
            switch (opt) {
            case 'a': cli.auto_detect = true; break;
            case 'b': cli.base_url = optarg; break;
            case 'm': cli.model = optarg; break;
            case 'P': cli.provider = optarg; break;
            case 'p': cli.profile = optarg; break;
            case 'l': cli.list_models = true; break;
            case 'v': cli.verbose = true; break;
            case 2001: break;
            case 2002: config.candidate_urls = split_csv(optarg); break;
            case 2003: {
                int ms = std::stoi(optarg);
                if (ms <= 0) { std::cerr << "--timeout must be positive.\n"; return 1; }
                config.probe_timeout_ms = ms;
                break; }
            case 2004: cli.api_key = optarg; break;
            case 2005: cli.doctor = true; break;
            case 2006:
                if (!parse_log_level(optarg)) { std::cerr << "Unknown log level '" << optarg << "'.\n"; return 1; }
                config.log_level = optarg;
                break;
            case 2007: config.log_file = optarg; break;
            case 2008: config.log_json = true; break;
            case 2009: config.log_remote = optarg; break;
            case 2010: config.log_synchronous = true; break;
            default: print_cli_help(); return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n"; return 2;
    }

    int rc = 0;
    try {
        configure_logging(config, cli.verbose);
        if (cli.doctor)
            rc = run_doctor(config, cli);
        else
            rc = run_link(config, cli);
    } catch (const LinkError& e) {
        Logger::instance().error(e.what());
        LogFields fields;
        fields.error_type = errc_name(e.code());
        log_event("link_failed", LogLevel::Error, fields);
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 2;
    }

    // Drains the remote log queue within the configured deadline.
    Logger::instance().shutdown();
    return rc;
}
