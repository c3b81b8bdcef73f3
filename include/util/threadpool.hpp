// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_UTIL_THREADPOOL_HPP
#define ANCHORSYNC_UTIL_THREADPOOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace anchorsync {
namespace util {

/**
 * Fixed-size worker pool
 *
 * Runs job handlers for the queue. Two ways in:
 *   pool.post([]{ ... });                   // fire and forget, errors logged
 *   auto f = pool.enqueue([]{ return 42; }); // result or exception via future
 *
 * shutdown() drains what is already queued before joining.
 */
class ThreadPool {
public:
  // num_threads == 0 means hardware concurrency
  explicit ThreadPool(size_t num_threads = 0, std::string name = "pool");
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  // Throws std::runtime_error once the pool has been shut down
  void post(std::function<void()> task);

  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Idempotent. A worker calling this does not join itself.
  void shutdown();

  size_t size() const { return workers_.size(); }

  // Tasks waiting for a free worker
  size_t pending() const;

  const std::string &name() const { return name_; }

private:
  void WorkerLoop();

  std::string name_;
  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> tasks_;

  mutable std::mutex mutex_;
  std::mutex join_mutex_; // serializes shutdown()
  std::condition_variable cv_;
  bool stopped_{false};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using R = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<R()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));
  std::future<R> result = task->get_future();

  // packaged_task stores any exception in the future
  post([task]() { (*task)(); });
  return result;
}

} // namespace util
} // namespace anchorsync

#endif // ANCHORSYNC_UTIL_THREADPOOL_HPP
