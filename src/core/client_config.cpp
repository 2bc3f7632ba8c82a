#include "core/client_config.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace {
std::string envOrEmpty(const char *name) {
  const char *value = std::getenv(name);
  if (value && strlen(value) > 0)
    return value;
  return "";
}
} // namespace

// Loads client configuration from a JSON file. The expected layout has
// "server", "sync", "bootstrap" and "logging" objects; every key is optional.
// If the file cannot be opened or parsed, defaults are kept. Environment
// variables are applied last in either case.
ClientConfig ClientConfig::loadFromFile(const std::string &configPath) {
  ClientConfig config;

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "ClientConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
  } else {
    json parsed;
    try {
      configFile >> parsed;
    } catch (const json::exception &e) {
      Logger::error(LogCategory::CONFIG, "ClientConfig",
                    "Error parsing config file: " + std::string(e.what()) +
                        ", falling back to environment variables");
      parsed = json::object();
    }
    config.applyJson(parsed);
  }

  config.loadFromEnv();
  return config;
}

// Values of the wrong JSON type are reported as std::invalid_argument, the
// same as out-of-range sync values.
void ClientConfig::applyJson(const json &config) {
  if (!config.is_object())
    return;

  try {
    applySections(config);
  } catch (const json::exception &e) {
    throw std::invalid_argument("invalid configuration value: " +
                                std::string(e.what()));
  }
  initialized_ = true;
}

void ClientConfig::applySections(const json &config) {

  if (config.contains("server") && config["server"].is_object()) {
    const auto &s = config["server"];
    std::string url = s.value("api_url", "");
    if (!url.empty())
      server.apiUrl = url;
    server.serverSecret = s.value("server_secret", server.serverSecret);
    std::string header = s.value("api_key_header", "");
    if (!header.empty())
      server.apiKeyHeader = header;
    server.requestTimeoutSeconds =
        s.value("request_timeout_seconds", server.requestTimeoutSeconds);
    server.maxRetries = s.value("max_retries", server.maxRetries);
    if (server.requestTimeoutSeconds <= 0) {
      Logger::warning(LogCategory::CONFIG, "ClientConfig",
                      "Invalid request_timeout_seconds, using default: 30");
      server.requestTimeoutSeconds = 30;
    }
    if (server.maxRetries < 1) {
      Logger::warning(LogCategory::CONFIG, "ClientConfig",
                      "Invalid max_retries, using default: 3");
      server.maxRetries = 3;
    }
  }

  if (config.contains("sync") && config["sync"].is_object()) {
    const auto &s = config["sync"];
    if (s.contains("config_sync_interval_ms"))
      sync.setConfigSyncInterval(std::chrono::milliseconds(
          s["config_sync_interval_ms"].get<int64_t>()));
    if (s.contains("id_list_sync_interval_ms"))
      sync.setIdListSyncInterval(std::chrono::milliseconds(
          s["id_list_sync_interval_ms"].get<int64_t>()));
    if (s.contains("max_id_list_workers"))
      sync.setMaxIdListWorkers(s["max_id_list_workers"].get<size_t>());
  }

  if (config.contains("bootstrap") && config["bootstrap"].is_object()) {
    bootstrapFile = config["bootstrap"].value("file", bootstrapFile);
  }

  if (config.contains("logging") && config["logging"].is_object()) {
    const auto &l = config["logging"];
    logging.level = l.value("level", logging.level);
    logging.file = l.value("file", logging.file);
    logging.maxFileSize = l.value("max_file_size", logging.maxFileSize);
    logging.maxBackupFiles = l.value("max_backup_files", logging.maxBackupFiles);
    logging.showThreadId = l.value("show_thread_id", logging.showThreadId);
  }
}

// Environment overrides: FLAGSYNC_API_URL, FLAGSYNC_SERVER_SECRET,
// FLAGSYNC_LOG_LEVEL, FLAGSYNC_LOG_FILE and FLAGSYNC_BOOTSTRAP_FILE. Unset or
// empty variables keep the current value.
void ClientConfig::loadFromEnv() {
  std::string url = envOrEmpty("FLAGSYNC_API_URL");
  std::string secret = envOrEmpty("FLAGSYNC_SERVER_SECRET");
  std::string level = envOrEmpty("FLAGSYNC_LOG_LEVEL");
  std::string logFile = envOrEmpty("FLAGSYNC_LOG_FILE");
  std::string bootstrap = envOrEmpty("FLAGSYNC_BOOTSTRAP_FILE");

  if (!url.empty())
    server.apiUrl = url;
  if (!secret.empty())
    server.serverSecret = secret;
  if (!level.empty())
    logging.level = level;
  if (!logFile.empty())
    logging.file = logFile;
  if (!bootstrap.empty())
    bootstrapFile = bootstrap;

  if (server.serverSecret.empty()) {
    Logger::warning(LogCategory::CONFIG, "ClientConfig",
                    "server_secret not set in config file or "
                    "FLAGSYNC_SERVER_SECRET. Requests will be rejected.");
  }

  initialized_ = true;
}
