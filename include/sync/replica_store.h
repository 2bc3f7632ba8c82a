#ifndef REPLICA_STORE_H
#define REPLICA_STORE_H

#include "core/sync_config.h"
#include "storage/id_list_registry.h"
#include "storage/snapshot_store.h"
#include "sync/config_spec_syncer.h"
#include "sync/error_reporter.h"
#include "sync/id_list_syncer.h"
#include "sync/poll_loop.h"
#include "sync/remote_source.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// In-process mirror of the server's configuration and ID lists. start()
// seeds and syncs synchronously, then two poll loops keep both halves fresh
// until shutdown(). All lookups are lock-protected in-memory reads.
class ReplicaStore {
public:
  ReplicaStore(std::shared_ptr<IRemoteSource> remote,
               std::shared_ptr<IErrorReporter> errors, SyncOptions options,
               RulesUpdatedCallback onRulesUpdated = nullptr);
  ~ReplicaStore();

  ReplicaStore(const ReplicaStore &) = delete;
  ReplicaStore &operator=(const ReplicaStore &) = delete;

  void start(const std::string &bootstrapValues = "");
  void shutdown();

  std::optional<ConfigSpec> lookupGate(const std::string &name) const;
  std::optional<ConfigSpec> lookupDynamicConfig(const std::string &name) const;
  std::optional<ConfigSpec> lookupLayer(const std::string &name) const;
  std::shared_ptr<IDList> lookupIDList(const std::string &name) const;
  bool isInIDList(const std::string &listName, const std::string &id) const;

  // Manual sync triggers. Both return false without contacting the server
  // once shutdown() has been called.
  bool fullResync();
  bool syncIDLists();

  InitReason initReason() const { return snapshots_.initReason(); }
  int64_t lastSyncTime() const { return snapshots_.lastSyncTime(); }
  int64_t initialSyncTime() const { return initialSyncTime_.load(); }
  size_t configCount(ConfigKind kind) const { return snapshots_.count(kind); }
  size_t idListCount() const { return idLists_.size(); }

private:
  std::shared_ptr<IRemoteSource> remote_;
  std::shared_ptr<IErrorReporter> errors_;
  SyncOptions options_;

  SnapshotStore snapshots_;
  IDListRegistry idLists_;
  ConfigSpecSyncer configSyncer_;
  IDListSyncer idListSyncer_;

  std::unique_ptr<PollLoop> configPoller_;
  std::unique_ptr<PollLoop> idListPoller_;

  std::atomic<int64_t> initialSyncTime_{0};
  std::mutex lifecycleMutex_;
  bool started_ = false;
  std::atomic<bool> stopped_{false};
};

#endif
