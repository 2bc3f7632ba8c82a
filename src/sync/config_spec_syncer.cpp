#include "sync/config_spec_syncer.h"
#include "core/logger.h"

ConfigSpecSyncer::ConfigSpecSyncer(SnapshotStore &store, IRemoteSource &remote,
                                   IErrorReporter &errors,
                                   RulesUpdatedCallback onRulesUpdated)
    : store_(store), remote_(remote), errors_(errors),
      onRulesUpdated_(std::move(onRulesUpdated)) {}

bool ConfigSpecSyncer::fullResync() {
  SyncSnapshot snapshot;
  try {
    snapshot = remote_.fetchConfigSnapshot(store_.lastSyncTime());
  } catch (const std::exception &e) {
    errors_.logException("ConfigSpecSyncer::fullResync", e);
    return false;
  }

  if (!store_.applySnapshot(snapshot)) {
    Logger::debug(LogCategory::SNAPSHOT, "fullResync",
                  "Server reported no updates");
    return false;
  }

  Logger::info(LogCategory::SNAPSHOT, "fullResync",
               "Committed config snapshot at time " +
                   std::to_string(snapshot.time));

  if (onRulesUpdated_) {
    try {
      onRulesUpdated_(json(snapshot).dump(), snapshot.time);
    } catch (const std::exception &e) {
      errors_.logException("ConfigSpecSyncer::rulesUpdatedCallback", e);
    }
  }
  return true;
}

// A blob that does not decode, or decodes with has_updates=false, leaves the
// store uninitialized.
bool ConfigSpecSyncer::seedFromBootstrap(const std::string &bootstrapValues) {
  if (bootstrapValues.empty()) {
    return false;
  }

  SyncSnapshot snapshot;
  try {
    snapshot = json::parse(bootstrapValues).get<SyncSnapshot>();
  } catch (const std::exception &e) {
    errors_.logException("ConfigSpecSyncer::seedFromBootstrap",
                         "Could not decode bootstrap values: " +
                             std::string(e.what()));
    return false;
  }

  if (!store_.applySnapshot(snapshot, InitReason::BOOTSTRAP)) {
    Logger::warning(LogCategory::SNAPSHOT, "seedFromBootstrap",
                    "Bootstrap values carry no updates, ignoring them");
    return false;
  }

  Logger::info(LogCategory::SNAPSHOT, "seedFromBootstrap",
               "Seeded store from bootstrap values (time " +
                   std::to_string(snapshot.time) + ")");
  return true;
}
