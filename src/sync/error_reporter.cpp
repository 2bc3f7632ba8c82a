#include "sync/error_reporter.h"
#include "core/logger.h"

void LoggingErrorReporter::logException(const std::string &source,
                                        const std::string &message) {
  reported_++;
  Logger::error(LogCategory::SYSTEM, source, message);
}
