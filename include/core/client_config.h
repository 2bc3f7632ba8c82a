#ifndef CLIENT_CONFIG_H
#define CLIENT_CONFIG_H

#include "core/logger.h"
#include "core/sync_config.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

struct ServerOptions {
  std::string apiUrl = "https://api.flagsync.io/v1";
  std::string serverSecret;
  std::string apiKeyHeader = "X-API-Key";
  int requestTimeoutSeconds = 30;
  int maxRetries = 3;
};

class ClientConfig {
public:
  ServerOptions server;
  SyncOptions sync;
  LoggingOptions logging;
  std::string bootstrapFile;

  // Reads configPath and then applies environment overrides. A missing or
  // malformed file keeps the defaults; invalid sync values in a readable
  // file throw std::invalid_argument, as do values of the wrong JSON type.
  static ClientConfig loadFromFile(const std::string &configPath = "config.json");

  void applyJson(const json &config);
  void loadFromEnv();

  bool isInitialized() const { return initialized_; }

private:
  void applySections(const json &config);

  bool initialized_ = false;
};

#endif
