// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace anchorsync {
namespace util {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
  if (num_threads == 0) {
    num_threads = std::max(1u, std::thread::hardware_concurrency());
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this);
  }
  LOG_DEBUG("Thread pool '{}' started with {} worker(s)", name_, num_threads);
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      throw std::runtime_error("thread pool '" + name_ + "' is shut down");
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

size_t ThreadPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void ThreadPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopped_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        return; // stopped and drained
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }

    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR("Unhandled exception in thread pool '{}': {}", name_, e.what());
    }
  }
}

void ThreadPool::shutdown() {
  std::lock_guard<std::mutex> join_lock(join_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();

  const auto self = std::this_thread::get_id();
  for (std::thread &worker : workers_) {
    if (!worker.joinable()) {
      continue;
    }
    if (worker.get_id() == self) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  workers_.clear();
}

} // namespace util
} // namespace anchorsync
