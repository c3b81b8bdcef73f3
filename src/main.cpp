// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "app/cli.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <command> [args]\n"
      << "\n"
      << "Commands:\n"
      << "  status               Show processed block and job counts\n"
      << "  jobs [state]         List jobs (created, active, completed, failed)\n"
      << "  models               List indexed models\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.anchorsync)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: sync, queue, chain, index, app, all\n"
      << "                       Can be comma-separated: --debug=sync,queue\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    anchorsync::app::AppConfig config;
    config.datadir = anchorsync::util::get_default_datadir();

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << anchorsync::GetFullVersionString() << std::endl;
        std::cout << anchorsync::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg == "--verbose") {
        config.verbose = true;
        config.log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=sync,queue
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            config.debug_components.push_back(components.substr(pos));
            break;
          }
          config.debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      } else if (config.command.empty()) {
        config.command = arg;
      } else {
        config.command_args.push_back(arg);
      }
    }

    if (config.command.empty()) {
      print_usage(argv[0]);
      return 1;
    }

    // Console logging goes to stderr, stdout carries the JSON
    anchorsync::util::LogManager::Initialize(config.log_level, false);

    for (const auto &component : config.debug_components) {
      if (component == "all") {
        anchorsync::util::LogManager::SetLogLevel("trace");
      } else {
        anchorsync::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    LOG_DEBUG("Using data directory {}", config.datadir.string());
    const int rc = anchorsync::app::RunCommand(config);

    anchorsync::util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    anchorsync::util::LogManager::Shutdown();
    return 1;
  }
}
