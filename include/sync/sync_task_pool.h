#ifndef SYNC_TASK_POOL_H
#define SYNC_TASK_POOL_H

#include "utils/thread_safe_queue.h"
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

struct SyncTask {
  std::string name;
  std::function<void()> work;
};

// Fixed-size worker pool for one fan-out/join round. Submit every task, then
// waitForCompletion() drains the queue and joins the workers. A pool is not
// reused after it has been joined.
class SyncTaskPool {
private:
  std::vector<std::thread> workers_;
  ThreadSafeQueue<SyncTask> tasks_;
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};
  std::atomic<bool> shutdown_{false};

  void workerThread(size_t workerId);

public:
  explicit SyncTaskPool(size_t numWorkers);
  ~SyncTaskPool();

  SyncTaskPool(const SyncTaskPool &) = delete;
  SyncTaskPool &operator=(const SyncTaskPool &) = delete;

  bool submitTask(const std::string &name, std::function<void()> work);

  void waitForCompletion();

  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
  size_t totalWorkers() const { return workers_.size(); }
};

#endif
