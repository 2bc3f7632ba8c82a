#include "sync/replica_store.h"
#include "core/logger.h"

ReplicaStore::ReplicaStore(std::shared_ptr<IRemoteSource> remote,
                           std::shared_ptr<IErrorReporter> errors,
                           SyncOptions options,
                           RulesUpdatedCallback onRulesUpdated)
    : remote_(std::move(remote)),
      errors_(errors ? std::move(errors)
                     : std::shared_ptr<IErrorReporter>(
                           std::make_shared<LoggingErrorReporter>())),
      options_(options),
      configSyncer_(snapshots_, *remote_, *errors_, std::move(onRulesUpdated)),
      idListSyncer_(idLists_, *remote_, *errors_, options_.maxIdListWorkers) {}

ReplicaStore::~ReplicaStore() { shutdown(); }

// Seeds from bootstrapValues when given, runs one config sync and one ID
// list sync on the calling thread, then launches both poll loops. Calling it
// a second time, or after shutdown(), does nothing. A shutdown() that lands
// during the initial syncs keeps the poll loops from being launched.
void ReplicaStore::start(const std::string &bootstrapValues) {
  {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_.load() || started_) {
      return;
    }
    started_ = true;
  }

  Logger::info(LogCategory::SYSTEM, "ReplicaStore", "Starting replica store");

  if (!bootstrapValues.empty()) {
    configSyncer_.seedFromBootstrap(bootstrapValues);
  }

  fullResync();
  initialSyncTime_ = snapshots_.lastSyncTime();
  syncIDLists();

  {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_.load()) {
      Logger::info(LogCategory::SYSTEM, "ReplicaStore",
                   "Shutdown requested during startup, poll loops not started");
      return;
    }
    configPoller_ = std::make_unique<PollLoop>(
        "config", options_.configSyncInterval, [this]() { fullResync(); });
    idListPoller_ = std::make_unique<PollLoop>(
        "id_list", options_.idListSyncInterval, [this]() { syncIDLists(); });
    configPoller_->start();
    idListPoller_->start();
  }

  Logger::info(LogCategory::SYSTEM, "ReplicaStore",
               "Replica store running (init reason: " +
                   initReasonToString(snapshots_.initReason()) +
                   ", gates: " +
                   std::to_string(snapshots_.count(ConfigKind::GATE)) +
                   ", ID lists: " + std::to_string(idLists_.size()) + ")");
}

// Signals both loops and waits for them. A sync already in flight completes
// and commits before the loop exits; no sync starts afterwards. Idempotent.
void ReplicaStore::shutdown() {
  {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_.exchange(true)) {
      return;
    }
  }

  if (configPoller_)
    configPoller_->requestStop();
  if (idListPoller_)
    idListPoller_->requestStop();
  if (configPoller_)
    configPoller_->join();
  if (idListPoller_)
    idListPoller_->join();

  Logger::info(LogCategory::SYSTEM, "ReplicaStore", "Replica store stopped");
}

std::optional<ConfigSpec>
ReplicaStore::lookupGate(const std::string &name) const {
  return snapshots_.get(ConfigKind::GATE, name);
}

std::optional<ConfigSpec>
ReplicaStore::lookupDynamicConfig(const std::string &name) const {
  return snapshots_.get(ConfigKind::DYNAMIC_CONFIG, name);
}

std::optional<ConfigSpec>
ReplicaStore::lookupLayer(const std::string &name) const {
  return snapshots_.get(ConfigKind::LAYER, name);
}

std::shared_ptr<IDList>
ReplicaStore::lookupIDList(const std::string &name) const {
  return idLists_.get(name);
}

bool ReplicaStore::isInIDList(const std::string &listName,
                              const std::string &id) const {
  auto list = idLists_.get(listName);
  return list && list->contains(id);
}

bool ReplicaStore::fullResync() {
  if (stopped_.load()) {
    return false;
  }
  return configSyncer_.fullResync();
}

bool ReplicaStore::syncIDLists() {
  if (stopped_.load()) {
    return false;
  }
  return idListSyncer_.reconcileCatalog();
}
