#ifndef SYNC_CONFIG_H
#define SYNC_CONFIG_H

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

struct SyncOptions {
  static constexpr std::chrono::milliseconds DEFAULT_CONFIG_SYNC_INTERVAL{
      10000};
  static constexpr std::chrono::milliseconds DEFAULT_ID_LIST_SYNC_INTERVAL{
      60000};
  static constexpr size_t DEFAULT_MAX_ID_LIST_WORKERS = 8;

  static constexpr std::chrono::milliseconds MIN_SYNC_INTERVAL{10};
  static constexpr std::chrono::milliseconds MAX_SYNC_INTERVAL{3600000};
  static constexpr size_t MIN_ID_LIST_WORKERS = 1;
  static constexpr size_t MAX_ID_LIST_WORKERS = 64;

  std::chrono::milliseconds configSyncInterval = DEFAULT_CONFIG_SYNC_INTERVAL;
  std::chrono::milliseconds idListSyncInterval = DEFAULT_ID_LIST_SYNC_INTERVAL;
  size_t maxIdListWorkers = DEFAULT_MAX_ID_LIST_WORKERS;

  void setConfigSyncInterval(std::chrono::milliseconds interval) {
    checkInterval("config_sync_interval_ms", interval);
    configSyncInterval = interval;
  }

  void setIdListSyncInterval(std::chrono::milliseconds interval) {
    checkInterval("id_list_sync_interval_ms", interval);
    idListSyncInterval = interval;
  }

  void setMaxIdListWorkers(size_t workers) {
    if (workers < MIN_ID_LIST_WORKERS || workers > MAX_ID_LIST_WORKERS) {
      throw std::invalid_argument("max_id_list_workers must be between " +
                                  std::to_string(MIN_ID_LIST_WORKERS) +
                                  " and " +
                                  std::to_string(MAX_ID_LIST_WORKERS));
    }
    maxIdListWorkers = workers;
  }

private:
  static void checkInterval(const std::string &name,
                            std::chrono::milliseconds interval) {
    if (interval < MIN_SYNC_INTERVAL || interval > MAX_SYNC_INTERVAL) {
      throw std::invalid_argument(name + " must be between " +
                                  std::to_string(MIN_SYNC_INTERVAL.count()) +
                                  " and " +
                                  std::to_string(MAX_SYNC_INTERVAL.count()));
    }
  }
};

#endif
