#include "sync/id_list_syncer.h"
#include "core/logger.h"
#include "sync/sync_task_pool.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <atomic>
#include <vector>

IDListSyncer::IDListSyncer(IDListRegistry &registry, IRemoteSource &remote,
                           IErrorReporter &errors, size_t maxWorkers)
    : registry_(registry), remote_(remote), errors_(errors),
      maxWorkers_(std::max<size_t>(1, maxWorkers)) {}

ReconcileStats IDListSyncer::lastStats() const {
  std::lock_guard<std::mutex> lock(statsMutex_);
  return lastStats_;
}

bool IDListSyncer::applyDelta(IDList &list, const std::string &content) {
  if (content.size() <= 1 || (content[0] != '+' && content[0] != '-')) {
    return false;
  }

  for (const auto &rawLine : StringUtils::splitLines(content)) {
    std::string line = StringUtils::trim(rawLine);
    if (line.size() <= 1) {
      continue;
    }
    std::string id = line.substr(1);
    if (line[0] == '+') {
      list.addId(id);
    } else if (line[0] == '-') {
      list.removeId(id);
    }
  }
  return true;
}

// Fetches [list.size(), end) and applies it. A transport failure leaves the
// list as it was; an invalid body or content-length discards the whole list.
IDListSyncer::FetchOutcome
IDListSyncer::syncList(const std::string &name,
                       const std::shared_ptr<IDList> &list) {
  RangeResponse response;
  try {
    response = remote_.fetchRange(list->url(), list->size());
  } catch (const std::exception &e) {
    errors_.logException("IDListSyncer::syncList", e);
    return FetchOutcome::FAILED;
  }

  if (response.contentLength <= 0) {
    errors_.logException("IDListSyncer::syncList",
                         "Invalid content-length " +
                             std::to_string(response.contentLength) +
                             " for ID list " + name + ", discarding list");
    registry_.remove(name);
    return FetchOutcome::DISCARDED;
  }

  if (!applyDelta(*list, response.content)) {
    Logger::warning(LogCategory::ID_LIST, "syncList",
                    "Unexpected content for ID list " + name +
                        " at offset " + std::to_string(list->size()) +
                        ", discarding list");
    registry_.remove(name);
    return FetchOutcome::DISCARDED;
  }

  list->addSize(response.contentLength);
  Logger::debug(LogCategory::ID_LIST, "syncList",
                "Applied " + std::to_string(response.contentLength) +
                    " bytes to ID list " + name + " (size now " +
                    std::to_string(list->size()) + ")");
  return FetchOutcome::APPLIED;
}

bool IDListSyncer::reconcileCatalog() {
  std::lock_guard<std::mutex> reconcileLock(reconcileMutex_);

  IDListCatalog catalog;
  try {
    catalog = remote_.fetchIDListCatalog();
  } catch (const std::exception &e) {
    errors_.logException("IDListSyncer::reconcileCatalog", e);
    return false;
  }

  ReconcileStats stats;
  stats.catalogEntries = catalog.size();

  std::vector<std::pair<std::string, std::shared_ptr<IDList>>> pending;

  for (const auto &entry : catalog) {
    const std::string &name = entry.first;
    const IDListMetadata &server = entry.second;

    std::shared_ptr<IDList> local = registry_.getOrCreate(name);

    if (server.url.empty() || server.fileID.empty() ||
        server.creationTime < local->creationTime()) {
      Logger::debug(LogCategory::ID_LIST, "reconcileCatalog",
                    "Skipping stale or incomplete catalog entry for " + name);
      stats.skipped++;
      continue;
    }

    if (server.fileID != local->fileID() &&
        server.creationTime >= local->creationTime()) {
      local = std::make_shared<IDList>(name, server.creationTime, server.url,
                                       server.fileID);
      registry_.put(name, local);
      stats.resets++;
    }

    if (server.size <= local->size()) {
      continue;
    }

    pending.emplace_back(name, local);
  }

  if (!pending.empty()) {
    std::atomic<size_t> fetched{0};
    std::atomic<size_t> discarded{0};
    {
      SyncTaskPool pool(std::min(maxWorkers_, pending.size()));
      Logger::debug(LogCategory::ID_LIST, "reconcileCatalog",
                    "Fetching " + std::to_string(pending.size()) +
                        " ID lists with " +
                        std::to_string(pool.totalWorkers()) + " workers");
      for (const auto &job : pending) {
        std::string name = job.first;
        std::shared_ptr<IDList> list = job.second;
        pool.submitTask(name, [this, name, list, &fetched, &discarded]() {
          FetchOutcome outcome = syncList(name, list);
          if (outcome == FetchOutcome::APPLIED)
            fetched++;
          else if (outcome == FetchOutcome::DISCARDED)
            discarded++;
        });
      }
      pool.waitForCompletion();
    }
    stats.fetched = fetched.load();
    stats.discarded = discarded.load();
  }

  for (const auto &name : registry_.names()) {
    if (catalog.find(name) == catalog.end()) {
      if (registry_.remove(name))
        stats.pruned++;
    }
  }

  Logger::info(LogCategory::ID_LIST, "reconcileCatalog",
               "ID list sync finished - catalog: " +
                   std::to_string(stats.catalogEntries) +
                   " | fetched: " + std::to_string(stats.fetched) +
                   " | reset: " + std::to_string(stats.resets) +
                   " | discarded: " + std::to_string(stats.discarded) +
                   " | pruned: " + std::to_string(stats.pruned));

  {
    std::lock_guard<std::mutex> lock(statsMutex_);
    lastStats_ = stats;
  }
  return true;
}
