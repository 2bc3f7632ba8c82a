#include "core/log_writer.h"
#include <filesystem>
#include <iostream>

bool ConsoleLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << formattedMessage << '\n';
  return static_cast<bool>(std::cerr);
}

void ConsoleLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

// Opens fileName in append mode. The current file size seeds the rotation
// counter so a restarted process keeps rolling at the same threshold.
FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  std::error_code ec;
  auto existing = std::filesystem::file_size(fileName_, ec);
  if (!ec) {
    bytesWritten_ = static_cast<size_t>(existing);
  }
  file_.open(fileName_, std::ios::app);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  if (maxFileSize_ > 0 && bytesWritten_ >= maxFileSize_) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << formattedMessage << '\n';
  bytesWritten_ += formattedMessage.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

// Shifts fileName.(i) to fileName.(i+1), dropping the oldest backup, then
// moves the live file to fileName.1 and reopens an empty one. Filesystem
// errors are ignored so a failed rotation never stops logging.
void FileLogWriter::rotateUnlocked() {
  namespace fs = std::filesystem;
  std::error_code ec;

  file_.flush();
  file_.close();

  if (maxBackupFiles_ > 0) {
    fs::remove(fileName_ + "." + std::to_string(maxBackupFiles_), ec);
    for (int i = maxBackupFiles_ - 1; i > 0; --i) {
      std::string from = fileName_ + "." + std::to_string(i);
      if (fs::exists(from, ec)) {
        fs::rename(from, fileName_ + "." + std::to_string(i + 1), ec);
      }
    }
    fs::rename(fileName_, fileName_ + ".1", ec);
  } else {
    fs::remove(fileName_, ec);
  }

  file_.open(fileName_, std::ios::trunc);
  bytesWritten_ = 0;
}
