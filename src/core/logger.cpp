#include "core/logger.h"
#include <algorithm>
#include <cctype>
#include <iostream>

// Static member initialization for Logger class. writers_ holds every active
// sink, logMutex guards the writer list.
std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::showThreadId = false;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

// Formats the message once and hands it to every registered writer. Messages
// below the configured level are dropped before any formatting happens.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  LogLevel minLevel;
  bool withThreadId;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    minLevel = currentLogLevel;
    withThreadId = showThreadId;
  }

  if (level < minLevel) {
    return;
  }

  std::string line = formatLogMessage(
      getCurrentTimestamp(), getLevelString(level), getCategoryString(category),
      function, message, withThreadId);

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    if (writer && writer->isOpen()) {
      writer->write(line);
    }
  }
}

void Logger::initialize() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (writers_.empty()) {
    writers_.push_back(std::make_unique<ConsoleLogWriter>());
  }
}

// Applies level and thread-id settings and, when options.file is set, adds a
// rotating file writer next to the console writer. A file that cannot be
// opened is reported on stderr and skipped.
void Logger::configure(const LoggingOptions &options) {
  initialize();
  setLogLevel(options.level);
  {
    std::lock_guard<std::mutex> lock(configMutex);
    showThreadId = options.showThreadId;
  }

  if (!options.file.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(
        options.file, options.maxFileSize, options.maxBackupFiles);
    if (!fileWriter->isOpen()) {
      std::cerr << "Warning: could not open log file '" << options.file
                << "', logging to console only" << std::endl;
      return;
    }
    addWriter(std::move(fileWriter));
  }
}

void Logger::addWriter(std::unique_ptr<ILogWriter> writer) {
  std::lock_guard<std::mutex> lock(logMutex);
  writers_.push_back(std::move(writer));
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    if (writer) {
      writer->flush();
      writer->close();
    }
  }
  writers_.clear();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts "DEBUG", "INFO", "WARN"/"WARNING", "ERROR", "FATAL"/"CRITICAL"
// in any case. Unknown or empty strings leave the level unchanged.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}
