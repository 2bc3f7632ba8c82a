#ifndef ID_LIST_REGISTRY_H
#define ID_LIST_REGISTRY_H

#include "storage/id_list.h"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// name -> IDList map guarded by its own reader/writer lock. Lists are handed
// out as shared_ptr so a sync task keeps its generation alive after the
// registry drops or replaces it.
class IDListRegistry {
public:
  std::shared_ptr<IDList> get(const std::string &name) const;
  void put(const std::string &name, std::shared_ptr<IDList> list);
  bool remove(const std::string &name);

  // Returns the existing list, or registers and returns an empty placeholder.
  std::shared_ptr<IDList> getOrCreate(const std::string &name);

  std::vector<std::string> names() const;
  size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<IDList>> lists_;
};

#endif
