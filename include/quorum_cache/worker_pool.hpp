#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace quorum_cache {

// Fixed-size FIFO thread pool. With zero threads work runs inline in
// submit(). Work still queued when the pool is destroyed is dropped.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void submit(std::function<void()> work);
  std::size_t thread_count() const { return threads_.size(); }
  std::size_t pending() const;

private:
  void run();

  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> queue_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
};

} // namespace quorum_cache
