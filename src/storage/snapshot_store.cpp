#include "storage/snapshot_store.h"
#include "core/logger.h"
#include <mutex>

namespace {
SnapshotStore::SpecMap indexByName(const std::vector<ConfigSpec> &specs) {
  SnapshotStore::SpecMap indexed;
  indexed.reserve(specs.size());
  for (const auto &spec : specs) {
    indexed[spec.name] = spec;
  }
  return indexed;
}
} // namespace

const SnapshotStore::SpecMap &SnapshotStore::mapFor(ConfigKind kind) const {
  switch (kind) {
  case ConfigKind::DYNAMIC_CONFIG:
    return dynamicConfigs_;
  case ConfigKind::LAYER:
    return layerConfigs_;
  case ConfigKind::GATE:
  default:
    return featureGates_;
  }
}

std::optional<ConfigSpec> SnapshotStore::get(ConfigKind kind,
                                             const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const SpecMap &specs = mapFor(kind);
  auto it = specs.find(name);
  if (it == specs.end())
    return std::nullopt;
  return it->second;
}

bool SnapshotStore::applySnapshot(const SyncSnapshot &snapshot,
                                  InitReason reason) {
  if (!snapshot.hasUpdates) {
    return false;
  }

  SpecMap newGates = indexByName(snapshot.featureGates);
  SpecMap newConfigs = indexByName(snapshot.dynamicConfigs);
  SpecMap newLayers = indexByName(snapshot.layerConfigs);

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    featureGates_.swap(newGates);
    dynamicConfigs_.swap(newConfigs);
    layerConfigs_.swap(newLayers);
    lastSyncTime_ = snapshot.time;
    initReason_ = reason;
  }

  Logger::debug(LogCategory::SNAPSHOT, "applySnapshot",
                "Committed snapshot at time " + std::to_string(snapshot.time) +
                    " (gates: " + std::to_string(snapshot.featureGates.size()) +
                    ", configs: " +
                    std::to_string(snapshot.dynamicConfigs.size()) +
                    ", layers: " +
                    std::to_string(snapshot.layerConfigs.size()) + ")");
  return true;
}

int64_t SnapshotStore::lastSyncTime() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return lastSyncTime_;
}

InitReason SnapshotStore::initReason() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return initReason_;
}

size_t SnapshotStore::count(ConfigKind kind) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return mapFor(kind).size();
}
