#include "storage/id_list_registry.h"
#include <mutex>

std::shared_ptr<IDList> IDListRegistry::get(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = lists_.find(name);
  if (it == lists_.end())
    return nullptr;
  return it->second;
}

void IDListRegistry::put(const std::string &name,
                         std::shared_ptr<IDList> list) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  lists_[name] = std::move(list);
}

bool IDListRegistry::remove(const std::string &name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return lists_.erase(name) > 0;
}

std::shared_ptr<IDList> IDListRegistry::getOrCreate(const std::string &name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = lists_.find(name);
  if (it != lists_.end())
    return it->second;
  auto placeholder = std::make_shared<IDList>(name);
  lists_.emplace(name, placeholder);
  return placeholder;
}

std::vector<std::string> IDListRegistry::names() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(lists_.size());
  for (const auto &entry : lists_) {
    result.push_back(entry.first);
  }
  return result;
}

size_t IDListRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return lists_.size();
}
