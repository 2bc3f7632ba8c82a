#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <condition_variable>
#include <mutex>
#include <queue>

// Blocking FIFO. After finish() the queue drains what it holds and then
// popBlocking() returns false.
template <typename T> class ThreadSafeQueue {
private:
  std::mutex mtx;
  std::queue<T> queue;
  std::condition_variable cv;
  bool finished = false;

public:
  void push(T item) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      queue.push(std::move(item));
    }
    cv.notify_one();
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lock(mtx);
      finished = true;
    }
    cv.notify_all();
  }

  bool popBlocking(T &item) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return !queue.empty() || finished; });

    if (queue.empty()) {
      return false;
    }

    item = std::move(queue.front());
    queue.pop();
    return true;
  }
};

#endif
