#include "core/client_config.h"
#include "core/logger.h"
#include "engines/http_transport.h"
#include "sync/remote_source.h"
#include "sync/replica_store.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

std::string readBootstrapFile(const std::string &path) {
  if (path.empty())
    return "";
  std::ifstream file(path);
  if (!file.is_open()) {
    Logger::warning(LogCategory::CONFIG, "main",
                    "Could not open bootstrap file '" + path +
                        "', starting without bootstrap values");
    return "";
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string newSessionId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::ostringstream oss;
  oss << std::hex << gen() << gen();
  return oss.str();
}
} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = argc > 1 ? argv[1] : "config.json";

  Logger::initialize();

  try {
    ClientConfig config;
    try {
      config = ClientConfig::loadFromFile(configPath);
    } catch (const std::invalid_argument &e) {
      std::cerr << "Error: invalid configuration in " << configPath << ": "
                << e.what() << std::endl;
      Logger::shutdown();
      return EXIT_CONFIG_ERROR;
    }

    Logger::configure(config.logging);

    if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
        std::signal(SIGTERM, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register signal handlers" << std::endl;
      Logger::shutdown();
      return EXIT_SIGNAL_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 "FlagSync started (API: " + config.server.apiUrl + ")");

    auto transport = std::make_shared<HttpTransport>(config.server.apiUrl);
    transport->setApiKey(config.server.apiKeyHeader,
                         config.server.serverSecret);
    transport->setTimeout(config.server.requestTimeoutSeconds);
    transport->setMaxRetries(config.server.maxRetries);

    ClientMetadata metadata;
    metadata.sessionId = newSessionId();

    auto remote = std::make_shared<HttpRemoteSource>(transport, metadata);
    auto errors = std::make_shared<LoggingErrorReporter>();

    ReplicaStore store(remote, errors, config.sync,
                       [](const std::string &rules, int64_t time) {
                         Logger::info(LogCategory::SNAPSHOT, "rulesUpdated",
                                      "Ruleset updated at " +
                                          std::to_string(time) + " (" +
                                          std::to_string(rules.size()) +
                                          " bytes)");
                       });

    try {
      store.start(readBootstrapFile(config.bootstrapFile));
    } catch (const std::exception &e) {
      Logger::critical(LogCategory::SYSTEM, "main",
                       "Exception during startup: " + std::string(e.what()));
      std::cerr << "Initialization error: " << e.what() << std::endl;
      Logger::shutdown();
      return EXIT_INIT_ERROR;
    }

    auto lastStatus = std::chrono::steady_clock::now();
    while (!g_shutdownRequested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      auto now = std::chrono::steady_clock::now();
      if (now - lastStatus >= config.sync.configSyncInterval) {
        lastStatus = now;
        Logger::info(
            LogCategory::SYSTEM, "main",
            "Status - reason: " + initReasonToString(store.initReason()) +
                " | last sync: " + std::to_string(store.lastSyncTime()) +
                " | gates: " +
                std::to_string(store.configCount(ConfigKind::GATE)) +
                " | configs: " +
                std::to_string(store.configCount(ConfigKind::DYNAMIC_CONFIG)) +
                " | layers: " +
                std::to_string(store.configCount(ConfigKind::LAYER)) +
                " | ID lists: " + std::to_string(store.idListCount()) +
                " | errors: " + std::to_string(errors->reportedCount()));
      }
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 "Shutdown requested, stopping poll loops");
    store.shutdown();
    Logger::info(LogCategory::SYSTEM, "main", "FlagSync stopped");
    Logger::shutdown();
    return EXIT_SUCCESS_CODE;

  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    Logger::shutdown();
    return EXIT_CRITICAL_ERROR;
  }
}
