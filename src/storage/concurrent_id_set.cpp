#include "storage/concurrent_id_set.h"

void ConcurrentIdSet::add(const std::string &id) {
  Shard &shard = shardFor(id);
  std::lock_guard<std::mutex> lock(shard.mtx);
  shard.ids.insert(id);
}

void ConcurrentIdSet::remove(const std::string &id) {
  Shard &shard = shardFor(id);
  std::lock_guard<std::mutex> lock(shard.mtx);
  shard.ids.erase(id);
}

bool ConcurrentIdSet::contains(const std::string &id) const {
  const Shard &shard = shardFor(id);
  std::lock_guard<std::mutex> lock(shard.mtx);
  return shard.ids.count(id) > 0;
}

// Not a point-in-time count when writers are active; each shard is sampled
// under its own lock.
size_t ConcurrentIdSet::size() const {
  size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mtx);
    total += shard.ids.size();
  }
  return total;
}

void ConcurrentIdSet::clear() {
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mtx);
    shard.ids.clear();
  }
}
