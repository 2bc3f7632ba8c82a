#ifndef SNAPSHOT_STORE_H
#define SNAPSHOT_STORE_H

#include "model/config_spec.h"
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

enum class InitReason { UNINITIALIZED = 0, BOOTSTRAP = 1, NETWORK = 2 };

inline std::string initReasonToString(InitReason reason) {
  switch (reason) {
  case InitReason::UNINITIALIZED:
    return "Uninitialized";
  case InitReason::BOOTSTRAP:
    return "Bootstrap";
  case InitReason::NETWORK:
    return "Network";
  default:
    return "Unknown";
  }
}

// Holds the gates, dynamic configs and layers of the most recently committed
// snapshot. The three maps, the last sync time and the init reason change
// together in a single exclusive section, so readers never see a mix of two
// snapshots.
class SnapshotStore {
public:
  using SpecMap = std::unordered_map<std::string, ConfigSpec>;

  std::optional<ConfigSpec> get(ConfigKind kind,
                                const std::string &name) const;

  // No-op returning false when snapshot.hasUpdates is false. Otherwise the
  // new maps are built before the lock is taken and then swapped in.
  bool applySnapshot(const SyncSnapshot &snapshot,
                     InitReason reason = InitReason::NETWORK);

  int64_t lastSyncTime() const;
  InitReason initReason() const;
  size_t count(ConfigKind kind) const;

private:
  const SpecMap &mapFor(ConfigKind kind) const;

  mutable std::shared_mutex mutex_;
  SpecMap featureGates_;
  SpecMap dynamicConfigs_;
  SpecMap layerConfigs_;
  int64_t lastSyncTime_ = 0;
  InitReason initReason_ = InitReason::UNINITIALIZED;
};

#endif
