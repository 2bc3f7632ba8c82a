#ifndef CONCURRENT_ID_SET_H
#define CONCURRENT_ID_SET_H

#include <array>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

// Set of opaque string ids safe for concurrent add/remove/contains. Ids are
// spread over a fixed number of shards, each with its own mutex, so writers
// on different shards never contend.
class ConcurrentIdSet {
public:
  static constexpr size_t SHARD_COUNT = 16;

  ConcurrentIdSet() = default;
  ConcurrentIdSet(const ConcurrentIdSet &) = delete;
  ConcurrentIdSet &operator=(const ConcurrentIdSet &) = delete;

  void add(const std::string &id);
  void remove(const std::string &id);
  bool contains(const std::string &id) const;
  size_t size() const;
  void clear();

private:
  struct Shard {
    mutable std::mutex mtx;
    std::unordered_set<std::string> ids;
  };

  Shard &shardFor(const std::string &id) {
    return shards_[std::hash<std::string>{}(id) % SHARD_COUNT];
  }
  const Shard &shardFor(const std::string &id) const {
    return shards_[std::hash<std::string>{}(id) % SHARD_COUNT];
  }

  std::array<Shard, SHARD_COUNT> shards_;
};

#endif
