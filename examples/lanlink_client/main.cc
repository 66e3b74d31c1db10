/**
 * @file main.cc
 * @brief LAN discovery client
 *
 * Finds a lanlink_server on the local network, connects to it and keeps the
 * connection alive until interrupted.
 *
 * USAGE:
 *   lanlink_client [options]
 *
 * OPTIONS:
 *   --config <file>               JSON or YAML configuration file
 *   --port <port>                 Local port (default: ephemeral)
 *   --broadcast-port <port>       Server port (default: 8090)
 *   --broadcast-address <ip>      Discovery target (default: 255.255.255.255)
 *   --payload <json>              JSON object sent with connect/keepalive
 *   --verbose                     Enable debug logging
 *   --help                        Show this help message
 */

#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "lanlink/client/discovery_client.h"
#include "lanlink/config/config_loader.h"
#include "lanlink/event/libevent_dispatcher.h"
#include "lanlink/logging/log_macros.h"

using namespace lanlink;

namespace {

struct ClientOptions {
  std::string config_file;
  optional<long> port;
  optional<long> broadcast_port;
  optional<std::string> broadcast_address;
  optional<std::string> payload;
  bool verbose = false;
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program << " [options]\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --config <file>            JSON or YAML configuration file\n";
  std::cerr << "  --port <port>              Local port (default: ephemeral)\n";
  std::cerr << "  --broadcast-port <port>    Server port (default: 8090)\n";
  std::cerr << "  --broadcast-address <ip>   "
               "Discovery target (default: 255.255.255.255)\n";
  std::cerr << "  --payload <json>           "
               "JSON sent with connect/keepalive\n";
  std::cerr << "  --verbose                  Enable debug logging\n";
  std::cerr << "  --help                     Show this help message\n";
}

long parsePort(const char* program, const std::string& option,
               const char* value) {
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0' || parsed < 0 || parsed > 65535) {
    std::cerr << "[ERROR] Invalid value for " << option << ": " << value
              << std::endl;
    printUsage(program);
    exit(1);
  }
  return parsed;
}

ClientOptions parseArguments(int argc, char* argv[]) {
  ClientOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_file = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      options.port = parsePort(argv[0], arg, argv[++i]);
    } else if (arg == "--broadcast-port" && i + 1 < argc) {
      options.broadcast_port = parsePort(argv[0], arg, argv[++i]);
    } else if (arg == "--broadcast-address" && i + 1 < argc) {
      options.broadcast_address = std::string(argv[++i]);
    } else if (arg == "--payload" && i + 1 < argc) {
      options.payload = std::string(argv[++i]);
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

config::LanlinkConfig buildConfig(const ClientOptions& options) {
  config::LanlinkConfig cfg;
  if (!options.config_file.empty()) {
    cfg = config::loadConfigFile(options.config_file);
  }

  if (options.port) {
    cfg.client.local_port = static_cast<uint16_t>(*options.port);
  }
  if (options.broadcast_port) {
    cfg.client.broadcast_port = static_cast<uint16_t>(*options.broadcast_port);
  }
  if (options.broadcast_address) {
    cfg.client.broadcast_address = *options.broadcast_address;
  }
  if (options.payload) {
    auto payload = nlohmann::json::parse(*options.payload, nullptr, false);
    if (payload.is_discarded()) {
      throw config::ConfigValidationError("--payload", "invalid JSON");
    }
    cfg.client.payload = payload;
  }
  if (options.verbose) {
    cfg.logging.level = "debug";
  }

  cfg.validate();
  return cfg;
}

// Logs client events
class ClientEventLogger : public client::DiscoveryClientCallbacks {
 public:
  void onConnection(
      const network::Address::InstanceConstSharedPtr& server) override {
    LOG_INFO("connection {}", server->asString());
  }

  void onClose() override { LOG_INFO("close"); }

  void onMessage(const network::Address::InstanceConstSharedPtr& from,
                 const std::string& raw) override {
    LOG_INFO("message from {}: {}", from->asString(), raw);
  }
};

}  // namespace

int main(int argc, char* argv[]) {
  ClientOptions options = parseArguments(argc, argv);

  config::LanlinkConfig cfg;
  try {
    cfg = buildConfig(options);
    config::applyLoggingConfig(cfg.logging);
  } catch (const std::exception& e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  signal(SIGPIPE, SIG_IGN);

  event::LibeventDispatcher dispatcher("client");

  try {
    client::DiscoveryClient discovery_client(dispatcher, cfg.client);
    ClientEventLogger event_logger;
    discovery_client.addCallbacks(event_logger);

    auto result = discovery_client.start();
    if (!result.ok()) {
      LOG_ERROR("Failed to start client: {}", result.error_message());
      return 1;
    }

    auto shutdown = [&]() {
      LOG_INFO("Shutting down");
      discovery_client.stop();
      dispatcher.exit();
    };
    auto sigint = dispatcher.listenForSignal(SIGINT, shutdown);
    auto sigterm = dispatcher.listenForSignal(SIGTERM, shutdown);

    dispatcher.run(event::RunType::RunUntilExit);

    discovery_client.removeCallbacks(event_logger);
  } catch (const config::ConfigValidationError& e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  return 0;
}
