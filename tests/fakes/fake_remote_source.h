#ifndef FAKE_REMOTE_SOURCE_H
#define FAKE_REMOTE_SOURCE_H

#include "sync/error_reporter.h"
#include "sync/remote_source.h"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Scripted remote source. Snapshots are served in queue order and an empty
// queue answers "no updates". Range bodies are served per URL.
class FakeRemoteSource : public IRemoteSource {
public:
  using RangeHandler =
      std::function<RangeResponse(const std::string &url, int64_t offset)>;

  void queueSnapshot(const SyncSnapshot &snapshot) {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshots_.push_back(snapshot);
  }

  void failNextSnapshot(RemoteSourceError::Kind kind) {
    std::lock_guard<std::mutex> lock(mtx_);
    snapshotFailures_.push_back(kind);
  }

  void setCatalog(const IDListCatalog &catalog) {
    std::lock_guard<std::mutex> lock(mtx_);
    catalog_ = catalog;
    catalogFails_ = false;
  }

  void failCatalog() {
    std::lock_guard<std::mutex> lock(mtx_);
    catalogFails_ = true;
  }

  // Serves body with content-length equal to its size.
  void setRange(const std::string &url, const std::string &body) {
    setRange(url, body, static_cast<int64_t>(body.size()));
  }

  void setRange(const std::string &url, const std::string &body,
                int64_t contentLength) {
    std::lock_guard<std::mutex> lock(mtx_);
    ranges_[url] = RangeResponse{body, contentLength};
  }

  void setRangeHandler(RangeHandler handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    rangeHandler_ = std::move(handler);
  }

  SyncSnapshot fetchConfigSnapshot(int64_t sinceTime) override {
    std::lock_guard<std::mutex> lock(mtx_);
    sinceTimes_.push_back(sinceTime);
    if (!snapshotFailures_.empty()) {
      RemoteSourceError::Kind kind = snapshotFailures_.front();
      snapshotFailures_.pop_front();
      throw RemoteSourceError(kind, "scripted snapshot failure");
    }
    if (snapshots_.empty()) {
      return SyncSnapshot{};
    }
    SyncSnapshot next = snapshots_.front();
    snapshots_.pop_front();
    return next;
  }

  IDListCatalog fetchIDListCatalog() override {
    std::lock_guard<std::mutex> lock(mtx_);
    catalogCalls_++;
    if (catalogFails_) {
      throw RemoteSourceError(RemoteSourceError::Kind::DECODE,
                              "scripted catalog failure");
    }
    return catalog_;
  }

  RangeResponse fetchRange(const std::string &url,
                           int64_t byteOffset) override {
    RangeHandler handler;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      rangeRequests_.emplace_back(url, byteOffset);
      handler = rangeHandler_;
      if (!handler) {
        auto it = ranges_.find(url);
        if (it == ranges_.end()) {
          throw RemoteSourceError(RemoteSourceError::Kind::TRANSPORT,
                                  "no scripted range for " + url);
        }
        return it->second;
      }
    }
    return handler(url, byteOffset);
  }

  std::vector<int64_t> sinceTimes() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sinceTimes_;
  }

  std::vector<std::pair<std::string, int64_t>> rangeRequests() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return rangeRequests_;
  }

  size_t catalogCalls() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return catalogCalls_;
  }

private:
  mutable std::mutex mtx_;
  std::deque<SyncSnapshot> snapshots_;
  std::deque<RemoteSourceError::Kind> snapshotFailures_;
  IDListCatalog catalog_;
  bool catalogFails_ = false;
  std::map<std::string, RangeResponse> ranges_;
  RangeHandler rangeHandler_;
  std::vector<int64_t> sinceTimes_;
  std::vector<std::pair<std::string, int64_t>> rangeRequests_;
  size_t catalogCalls_ = 0;
};

class RecordingErrorReporter : public IErrorReporter {
public:
  using IErrorReporter::logException;

  void logException(const std::string &source,
                    const std::string &message) override {
    std::lock_guard<std::mutex> lock(mtx_);
    reports_.push_back(source + ": " + message);
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return reports_.size();
  }

private:
  mutable std::mutex mtx_;
  std::vector<std::string> reports_;
};

inline ConfigSpec makeSpec(const std::string &name, bool enabled,
                           const std::string &type = "feature_gate") {
  ConfigSpec spec;
  spec.name = name;
  spec.type = type;
  spec.enabled = enabled;
  spec.salt = name + "_salt";
  spec.idType = "userID";
  return spec;
}

inline IDListMetadata makeListMeta(const std::string &name, int64_t size,
                                   int64_t creationTime,
                                   const std::string &fileID) {
  IDListMetadata meta;
  meta.name = name;
  meta.size = size;
  meta.creationTime = creationTime;
  meta.url = "https://cdn.example.com/" + name + "/" + fileID;
  meta.fileID = fileID;
  return meta;
}

#endif
