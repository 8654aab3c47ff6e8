/**
 * @file conductor_example.cc
 * @brief Command-line front end for the service manager
 *
 * Loads a services file, starts the auto-start services, prints their
 * status, tools and manager statistics, and optionally calls one tool.
 * With --serve it keeps running (health checks included) until SIGINT or
 * SIGTERM.
 */

#include <signal.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "conductor/json/json_bridge.h"
#include "conductor/logging/log_sink.h"
#include "conductor/logging/logger_registry.h"
#include "conductor/manager/service_manager.h"

using namespace conductor;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) { g_shutdown = true; }

struct ExampleOptions {
  manager::ManagerConfig config;
  std::string tool;
  std::string arguments{"{}"};
  int timeout_ms{0};
  bool serve{false};
  bool discover{false};
  bool verbose{false};
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program << " [options] [config-file]\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --call <tool>          Call a tool after startup\n";
  std::cerr << "  --args <json>          Tool arguments (default: {})\n";
  std::cerr << "  --timeout <ms>         Tool call timeout\n";
  std::cerr << "  --health-interval <s>  Health check interval (default: 60)\n";
  std::cerr << "  --discover             List known MCP servers on PATH\n";
  std::cerr << "  --serve                Keep running until interrupted\n";
  std::cerr << "  --verbose              Enable debug logging\n";
  std::cerr << "  --help                 Show this help message\n";
}

bool parseArguments(int argc, char* argv[], ExampleOptions& options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--call" && i + 1 < argc) {
      options.tool = argv[++i];
    } else if (arg == "--args" && i + 1 < argc) {
      options.arguments = argv[++i];
    } else if (arg == "--timeout" && i + 1 < argc) {
      options.timeout_ms = std::atoi(argv[++i]);
    } else if (arg == "--health-interval" && i + 1 < argc) {
      options.config.health_check_interval =
          std::chrono::seconds(std::atoi(argv[++i]));
    } else if (arg == "--discover") {
      options.discover = true;
    } else if (arg == "--serve") {
      options.serve = true;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else if (!arg.empty() && arg[0] != '-') {
      options.config.config_path = arg;
    } else {
      std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
      printUsage(argv[0]);
      return false;
    }
  }
  return true;
}

void printStatus(manager::ServiceManager& services) {
  std::cerr << "\n[STATUS]" << std::endl;
  std::cerr << services.getServiceStatus().toString(true) << std::endl;

  std::cerr << "\n[TOOLS]" << std::endl;
  for (const auto& tool : services.listTools()) {
    std::cerr << "  " << tool.name << " (" << tool.service_id << ")";
    if (!tool.description.empty()) {
      std::cerr << " - " << tool.description;
    }
    std::cerr << std::endl;
  }

  std::cerr << "\n[STATS]" << std::endl;
  std::cerr << services.getManagerStats().toJson().toString(true) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  ExampleOptions options;
  if (!parseArguments(argc, argv, options)) {
    return 1;
  }

  auto& logs = logging::LoggerRegistry::instance();
  logs.setDefaultSink(logging::SinkFactory::createStdioSink(true));
  logs.setGlobalLevel(options.verbose ? logging::LogLevel::Debug
                                      : logging::LogLevel::Info);

  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  manager::ServiceManager services(options.config);

  if (options.discover) {
    std::cerr << "[DISCOVER]" << std::endl;
    for (const auto& found : services.discoverServices()) {
      std::cerr << "  " << found.toJson().toString() << std::endl;
    }
  }

  std::cerr << "[INFO] Loading services from " << options.config.config_path
            << std::endl;
  if (!services.initialize()) {
    std::cerr << "[ERROR] Failed to initialize service manager" << std::endl;
    return 1;
  }
  printStatus(services);

  int exit_code = 0;
  if (!options.tool.empty()) {
    json::JsonValue arguments;
    try {
      arguments = json::JsonValue::parse(options.arguments);
    } catch (const json::JsonException& e) {
      std::cerr << "[ERROR] Invalid --args: " << e.what() << std::endl;
      return 1;
    }

    optional<std::chrono::milliseconds> timeout;
    if (options.timeout_ms > 0) {
      timeout = std::chrono::milliseconds(options.timeout_ms);
    }

    auto result = services.callTool(options.tool, arguments, timeout);
    if (isError(result)) {
      std::cerr << "[ERROR] " << errorOf(result).toString() << std::endl;
      exit_code = 1;
    } else {
      std::cout << valueOf(result).toString(true) << std::endl;
    }
  }

  if (options.serve) {
    std::cerr << "\n[INFO] Serving, press Ctrl+C to stop" << std::endl;
    while (!g_shutdown) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cerr << "\n[INFO] Shutting down..." << std::endl;
  }

  services.shutdown();
  return exit_code;
}
