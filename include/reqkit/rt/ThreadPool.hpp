// File: include/reqkit/rt/ThreadPool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace reqkit::rt {

class ThreadPool {
public:
  explicit ThreadPool(unsigned nThreads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue work. Dropped once shutdown() has begun.
  void post(std::function<void()> fn);

  // Waits until the queue is empty and no task is running. Tasks that post
  // more tasks are waited for as well.
  void drain();

  // Runs what is queued, then joins the workers. Idempotent.
  void shutdown();

  std::size_t size() const noexcept { return threads_.size(); }

private:
  void workerLoop();

private:
  std::vector<std::thread>           threads_;
  std::mutex                         mx_;
  std::condition_variable            cv_;
  std::condition_variable            idle_;
  std::queue<std::function<void()>>  q_;
  std::size_t                        active_{0};
  std::atomic<bool>                  stopping_{false};
};

} // namespace reqkit::rt
