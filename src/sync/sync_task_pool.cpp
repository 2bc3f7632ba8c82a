#include "sync/sync_task_pool.h"
#include "core/logger.h"
#include <algorithm>

// Constructs a pool with numWorkers threads. A value of 0 falls back to the
// hardware concurrency.
SyncTaskPool::SyncTaskPool(size_t numWorkers) {
  if (numWorkers == 0) {
    numWorkers = std::max<size_t>(1, std::thread::hardware_concurrency());
    Logger::warning(LogCategory::ID_LIST, "SyncTaskPool",
                    "numWorkers was 0, using hardware_concurrency: " +
                        std::to_string(numWorkers));
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&SyncTaskPool::workerThread, this, i);
  }
}

SyncTaskPool::~SyncTaskPool() { waitForCompletion(); }

// Pops tasks until the queue is finished and empty. A task that throws is
// counted as failed and logged; the worker keeps going.
void SyncTaskPool::workerThread(size_t workerId) {
  SyncTask task;
  while (tasks_.popBlocking(task)) {
    try {
      task.work();
      completedTasks_++;
    } catch (const std::exception &e) {
      failedTasks_++;
      Logger::error(LogCategory::ID_LIST, "SyncTaskPool",
                    "Worker #" + std::to_string(workerId) + " failed task " +
                        task.name + ": " + std::string(e.what()));
    }
  }
}

bool SyncTaskPool::submitTask(const std::string &name,
                              std::function<void()> work) {
  if (shutdown_.load()) {
    Logger::warning(LogCategory::ID_LIST, "submitTask",
                    "Cannot submit task - pool already joined: " + name);
    return false;
  }

  tasks_.push(SyncTask{name, std::move(work)});
  return true;
}

// Lets the workers drain the queue and joins them. Idempotent.
void SyncTaskPool::waitForCompletion() {
  if (shutdown_.exchange(true)) {
    return;
  }

  tasks_.finish();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  Logger::debug(LogCategory::ID_LIST, "SyncTaskPool",
                "All tasks completed - Completed: " +
                    std::to_string(completedTasks_.load()) +
                    " | Failed: " + std::to_string(failedTasks_.load()));
}
