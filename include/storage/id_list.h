#ifndef ID_LIST_H
#define ID_LIST_H

#include "storage/concurrent_id_set.h"
#include <atomic>
#include <cstdint>
#include <string>

// One generation of a named membership list. Identity fields are fixed at
// construction; a new content version is installed as a new IDList object.
// size() counts the bytes already ingested from the backing file and only
// grows.
class IDList {
public:
  explicit IDList(std::string name);
  IDList(std::string name, int64_t creationTime, std::string url,
         std::string fileID);

  IDList(const IDList &) = delete;
  IDList &operator=(const IDList &) = delete;

  const std::string &name() const { return name_; }
  int64_t creationTime() const { return creationTime_; }
  const std::string &url() const { return url_; }
  const std::string &fileID() const { return fileID_; }

  int64_t size() const { return size_.load(); }
  void addSize(int64_t bytes) { size_.fetch_add(bytes); }

  void addId(const std::string &id) { ids_.add(id); }
  void removeId(const std::string &id) { ids_.remove(id); }
  bool contains(const std::string &id) const { return ids_.contains(id); }
  size_t idCount() const { return ids_.size(); }

private:
  const std::string name_;
  const int64_t creationTime_;
  const std::string url_;
  const std::string fileID_;
  std::atomic<int64_t> size_{0};
  ConcurrentIdSet ids_;
};

#endif
