// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_UTIL_PERIODIC_TASK_HPP
#define ANCHORSYNC_UTIL_PERIODIC_TASK_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace anchorsync {
namespace util {

/**
 * PeriodicTask - runs a callback on a fixed interval on its own thread
 *
 * Owns a private io_context and steady_timer. The handle is the only way to
 * stop it: Cancel() (or destruction) stops the timer and joins the thread,
 * waiting for a run already in progress.
 *
 * The task may cancel or destroy its own handle. The io thread then detaches
 * and keeps the timer state alive until the loop has returned.
 *
 * Exceptions thrown by the task are logged and the schedule continues.
 */
class PeriodicTask {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               std::function<void()> task, bool run_immediately = false);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask &) = delete;
  PeriodicTask &operator=(const PeriodicTask &) = delete;

  void Cancel();

  bool running() const;
  const std::string &name() const;

private:
  struct State;

  static void ScheduleNext(State *state, std::chrono::milliseconds delay);
  static void RunOnce(State *state);

  // Shared with the io thread
  std::shared_ptr<State> state_;
  std::thread thread_;
};

} // namespace util
} // namespace anchorsync

#endif // ANCHORSYNC_UTIL_PERIODIC_TASK_HPP
