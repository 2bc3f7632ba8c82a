#ifndef CONFIG_SPEC_SYNCER_H
#define CONFIG_SPEC_SYNCER_H

#include "storage/snapshot_store.h"
#include "sync/error_reporter.h"
#include "sync/remote_source.h"
#include <cstdint>
#include <functional>
#include <string>

using RulesUpdatedCallback =
    std::function<void(const std::string &rules, int64_t time)>;

class ConfigSpecSyncer {
public:
  ConfigSpecSyncer(SnapshotStore &store, IRemoteSource &remote,
                   IErrorReporter &errors,
                   RulesUpdatedCallback onRulesUpdated = nullptr);

  // Pulls a snapshot newer than the store's last sync time and commits it.
  // Returns true only when new data was committed. Failures are reported and
  // leave the store as it was.
  bool fullResync();

  // Decodes a serialized snapshot and applies it as bootstrap data.
  bool seedFromBootstrap(const std::string &bootstrapValues);

private:
  SnapshotStore &store_;
  IRemoteSource &remote_;
  IErrorReporter &errors_;
  RulesUpdatedCallback onRulesUpdated_;
};

#endif
