#include "reqkit/rt/ThreadPool.hpp"
#include "reqkit/util/Logger.hpp"

#include <exception>

namespace reqkit::rt {

ThreadPool::ThreadPool(unsigned nThreads) {
  if (nThreads == 0) nThreads = 1;
  threads_.reserve(nThreads);
  for (unsigned i = 0; i < nThreads; ++i) {
    threads_.emplace_back([this]{ workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::post(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopping_) return;
    q_.push(std::move(fn));
  }
  cv_.notify_one();
}

void ThreadPool::drain() {
  std::unique_lock<std::mutex> lk(mx_);
  idle_.wait(lk, [this]{ return q_.empty() && active_ == 0; });
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
  }
}

void ThreadPool::workerLoop() {
  for (;;) {
    std::function<void()> fn;
    {
      std::unique_lock<std::mutex> lk(mx_);
      cv_.wait(lk, [this]{ return stopping_ || !q_.empty(); });
      if (stopping_ && q_.empty()) return;
      fn = std::move(q_.front()); q_.pop();
      ++active_;
    }
    try {
      fn();
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "thread pool task threw", {{"err", ex.what()}});
    }
    {
      std::lock_guard<std::mutex> lk(mx_);
      --active_;
    }
    idle_.notify_all();
  }
}

} // namespace reqkit::rt
