#ifndef ID_LIST_SYNCER_H
#define ID_LIST_SYNCER_H

#include "storage/id_list_registry.h"
#include "sync/error_reporter.h"
#include "sync/remote_source.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

struct ReconcileStats {
  size_t catalogEntries = 0;
  size_t skipped = 0;
  size_t resets = 0;
  size_t fetched = 0;
  size_t discarded = 0;
  size_t pruned = 0;
};

// Brings the ID list registry in line with the server catalog, fetching only
// the bytes each list has not ingested yet.
class IDListSyncer {
public:
  IDListSyncer(IDListRegistry &registry, IRemoteSource &remote,
               IErrorReporter &errors, size_t maxWorkers);

  // Returns false when the catalog could not be fetched; the registry is left
  // untouched in that case. Concurrent calls are serialized.
  bool reconcileCatalog();

  ReconcileStats lastStats() const;

  // Applies one fetched range of "+id" / "-id" lines to list. Returns false,
  // without touching the list, when the body is too short or does not start
  // with a sign character.
  static bool applyDelta(IDList &list, const std::string &content);

private:
  enum class FetchOutcome { APPLIED, FAILED, DISCARDED };

  FetchOutcome syncList(const std::string &name,
                        const std::shared_ptr<IDList> &list);

  IDListRegistry &registry_;
  IRemoteSource &remote_;
  IErrorReporter &errors_;
  size_t maxWorkers_;

  std::mutex reconcileMutex_;
  mutable std::mutex statsMutex_;
  ReconcileStats lastStats_;
};

#endif
