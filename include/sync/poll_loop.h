#ifndef POLL_LOOP_H
#define POLL_LOOP_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Background thread that runs action once per interval until stopped. The
// stop flag is checked after every wait, so a stop takes effect at the next
// wake at the latest; an action already running is allowed to finish.
class PollLoop {
public:
  PollLoop(std::string name, std::chrono::milliseconds interval,
           std::function<void()> action);
  ~PollLoop();

  PollLoop(const PollLoop &) = delete;
  PollLoop &operator=(const PollLoop &) = delete;

  void start();
  void requestStop();
  void join();

  bool isRunning() const { return running_.load(); }
  size_t completedRuns() const { return completedRuns_.load(); }

private:
  void threadMain();

  std::string name_;
  std::chrono::milliseconds interval_;
  std::function<void()> action_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopRequested_ = false;
  std::atomic<bool> running_{false};
  std::atomic<size_t> completedRuns_{0};
};

#endif
