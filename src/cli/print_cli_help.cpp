// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: llmlink [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "  -a, --auto                 Auto-detect a local OpenAI-compatible server\n"
      << "  -b, --base-url <url>       Use this server base URL (e.g. "
         "http://localhost:1234/v1)\n"
      << "  -m, --model <id>           Model id to use\n"
      << "  -P, --provider <id>        Provider id (default: inferred from base URL)\n"
      << "  -p, --profile <name>       Profile name (default: provider id)\n"
      << "      --candidates <urls>    Comma-separated base URLs for auto-detection\n"
      << "      --timeout <ms>         Per-probe timeout in milliseconds\n"
      << "      --api-key <key>        Bearer token sent to the server\n"
      << "  -l, --list-models          List the server's models and exit\n"
      << "      --doctor               Run connectivity and filesystem checks\n"
      << "  -v, --verbose              Debug logging\n"
      << "      --log-level <lvl>      debug, info, warning or error\n"
      << "      --log-file <path>      Also append logs to a file\n"
      << "      --log-json             Also emit JSON log lines on stdout\n"
      << "      --log-remote <url>     POST log records to this URL\n"
      << "      --log-sync             Ship remote logs on the calling thread\n"
      << std::endl;
}
