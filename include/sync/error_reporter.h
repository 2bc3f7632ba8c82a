#ifndef ERROR_REPORTER_H
#define ERROR_REPORTER_H

#include <atomic>
#include <cstddef>
#include <exception>
#include <string>

// Sink for failures the sync engine absorbs instead of propagating.
class IErrorReporter {
public:
  virtual ~IErrorReporter() = default;

  virtual void logException(const std::string &source,
                            const std::string &message) = 0;

  void logException(const std::string &source, const std::exception &e) {
    logException(source, std::string(e.what()));
  }
};

class LoggingErrorReporter : public IErrorReporter {
  std::atomic<size_t> reported_{0};

public:
  using IErrorReporter::logException;

  void logException(const std::string &source,
                    const std::string &message) override;

  size_t reportedCount() const { return reported_.load(); }
};

#endif
