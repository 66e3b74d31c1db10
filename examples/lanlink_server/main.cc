/**
 * @file main.cc
 * @brief LAN discovery server
 *
 * Answers discovery broadcasts on the local network, tracks connected
 * clients and logs every connection and disconnection together with the
 * current registry.
 *
 * USAGE:
 *   lanlink_server [options]
 *
 * OPTIONS:
 *   --config <file>               JSON or YAML configuration file
 *   --address <ip>                Listen address (default: 0.0.0.0)
 *   --port <port>                 Listen port (default: 8090)
 *   --monitor-interval <ms>       Liveness sweep period (default: 1000)
 *   --disconnect-timeout <ms>     Evict clients silent for longer
 *                                 (default: 4000)
 *   --verbose                     Enable debug logging
 *   --help                        Show this help message
 *
 * Command line options override values from the configuration file.
 */

#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "lanlink/config/config_loader.h"
#include "lanlink/event/libevent_dispatcher.h"
#include "lanlink/logging/log_macros.h"
#include "lanlink/server/discovery_server.h"

using namespace lanlink;

namespace {

struct ServerOptions {
  std::string config_file;
  optional<std::string> address;
  optional<long> port;
  optional<long> monitor_interval_ms;
  optional<long> disconnect_timeout_ms;
  bool verbose = false;
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program << " [options]\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --config <file>            JSON or YAML configuration file\n";
  std::cerr << "  --address <ip>             "
               "Listen address (default: 0.0.0.0)\n";
  std::cerr << "  --port <port>              Listen port (default: 8090)\n";
  std::cerr << "  --monitor-interval <ms>    "
               "Liveness sweep period (default: 1000)\n";
  std::cerr << "  --disconnect-timeout <ms>  "
               "Evict silent clients after (default: 4000)\n";
  std::cerr << "  --verbose                  Enable debug logging\n";
  std::cerr << "  --help                     Show this help message\n";
}

long parseNumber(const char* program, const std::string& option,
                 const char* value) {
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0' || parsed < 0) {
    std::cerr << "[ERROR] Invalid value for " << option << ": " << value
              << std::endl;
    printUsage(program);
    exit(1);
  }
  return parsed;
}

ServerOptions parseArguments(int argc, char* argv[]) {
  ServerOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_file = argv[++i];
    } else if (arg == "--address" && i + 1 < argc) {
      options.address = std::string(argv[++i]);
    } else if (arg == "--port" && i + 1 < argc) {
      options.port = parseNumber(argv[0], arg, argv[++i]);
    } else if (arg == "--monitor-interval" && i + 1 < argc) {
      options.monitor_interval_ms = parseNumber(argv[0], arg, argv[++i]);
    } else if (arg == "--disconnect-timeout" && i + 1 < argc) {
      options.disconnect_timeout_ms = parseNumber(argv[0], arg, argv[++i]);
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else {
      std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
      printUsage(argv[0]);
      exit(1);
    }
  }

  return options;
}

config::LanlinkConfig buildConfig(const ServerOptions& options) {
  config::LanlinkConfig cfg;
  if (!options.config_file.empty()) {
    cfg = config::loadConfigFile(options.config_file);
  }

  if (options.address) {
    cfg.server.listen_address = *options.address;
  }
  if (options.port) {
    if (*options.port > 65535) {
      throw config::ConfigValidationError("server.listen_port",
                                          "value out of range");
    }
    cfg.server.listen_port = static_cast<uint16_t>(*options.port);
  }
  if (options.monitor_interval_ms) {
    cfg.server.monitor_interval =
        std::chrono::milliseconds(*options.monitor_interval_ms);
  }
  if (options.disconnect_timeout_ms) {
    cfg.server.disconnect_timeout =
        std::chrono::milliseconds(*options.disconnect_timeout_ms);
  }
  if (options.verbose) {
    cfg.logging.level = "debug";
  }

  cfg.validate();
  return cfg;
}

std::string describeRegistry(const server::ClientRegistry& clients) {
  std::string list;
  for (const auto& entry : clients) {
    if (!list.empty()) {
      list += ", ";
    }
    list += entry.first;
  }
  return "[" + list + "]";
}

// Logs server events
class ServerEventLogger : public server::DiscoveryServerCallbacks {
 public:
  void onConnection(const server::ClientRecord& record,
                    const server::ClientRegistry& clients) override {
    LOG_INFO("connection {} payload={} clients={}", record.key,
             record.payload.dump(), describeRegistry(clients));
  }

  void onClose(const server::ClientRecord& record,
               const server::ClientRegistry& clients) override {
    LOG_INFO("close {} clients={}", record.key, describeRegistry(clients));
  }

  void onMessage(const network::Address::InstanceConstSharedPtr& from,
                 const std::string& raw) override {
    LOG_INFO("message from {}: {}", from->asString(), raw);
  }
};

}  // namespace

int main(int argc, char* argv[]) {
  ServerOptions options = parseArguments(argc, argv);

  config::LanlinkConfig cfg;
  try {
    cfg = buildConfig(options);
    config::applyLoggingConfig(cfg.logging);
  } catch (const std::exception& e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  signal(SIGPIPE, SIG_IGN);

  event::LibeventDispatcher dispatcher("server");

  try {
    server::DiscoveryServer discovery_server(dispatcher, cfg.server);
    ServerEventLogger event_logger;
    discovery_server.addCallbacks(event_logger);

    auto result = discovery_server.start();
    if (!result.ok()) {
      LOG_ERROR("Failed to start server: {}", result.error_message());
      return 1;
    }

    auto shutdown = [&]() {
      LOG_INFO("Shutting down");
      discovery_server.stop();
      dispatcher.exit();
    };
    auto sigint = dispatcher.listenForSignal(SIGINT, shutdown);
    auto sigterm = dispatcher.listenForSignal(SIGTERM, shutdown);

    dispatcher.run(event::RunType::RunUntilExit);

    discovery_server.removeCallbacks(event_logger);
  } catch (const config::ConfigValidationError& e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  return 0;
}
