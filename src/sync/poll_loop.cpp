#include "sync/poll_loop.h"
#include "core/logger.h"

PollLoop::PollLoop(std::string name, std::chrono::milliseconds interval,
                   std::function<void()> action)
    : name_(std::move(name)), interval_(interval), action_(std::move(action)) {}

PollLoop::~PollLoop() {
  requestStop();
  join();
}

// Restarting after a stop joins the previous thread first. A start() while
// the loop is still running does nothing.
void PollLoop::start() {
  if (running_.exchange(true)) {
    return;
  }
  join();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = false;
  }
  thread_ = std::thread(&PollLoop::threadMain, this);
}

void PollLoop::requestStop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = true;
  }
  cv_.notify_all();
}

void PollLoop::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

// Waits one interval, checks the stop flag, runs the action, repeats.
// Exceptions from the action are logged and the loop carries on with the
// next interval.
void PollLoop::threadMain() {
  Logger::info(LogCategory::SCHEDULER, name_,
               "Poll loop started (interval " +
                   std::to_string(interval_.count()) + " ms)");
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, interval_, [this] { return stopRequested_; });
      if (stopRequested_) {
        break;
      }
    }

    try {
      action_();
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SCHEDULER, name_,
                    "Poll cycle failed: " + std::string(e.what()));
    }
    completedRuns_++;
  }
  running_ = false;
  Logger::info(LogCategory::SCHEDULER, name_, "Poll loop stopped");
}
