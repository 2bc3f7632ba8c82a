#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <fstream>
#include <mutex>
#include <string>

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const std::string &formattedMessage) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

class ConsoleLogWriter : public ILogWriter {
private:
  std::mutex mutex_;

public:
  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override {}
  bool isOpen() const override { return true; }
};

// Appends to fileName and rolls it over to fileName.1 .. fileName.N once
// maxFileSize bytes have been written.
class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  size_t bytesWritten_ = 0;
  mutable std::mutex mutex_;

public:
  FileLogWriter(const std::string &fileName,
                size_t maxFileSize = 10 * 1024 * 1024, int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  FileLogWriter(const FileLogWriter &) = delete;
  FileLogWriter &operator=(const FileLogWriter &) = delete;

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;

private:
  void rotateUnlocked();
};

#endif
