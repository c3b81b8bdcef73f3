// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "util/periodic_task.hpp"
#include "util/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace anchorsync {
namespace util {

struct PeriodicTask::State {
  State(std::string n, std::chrono::milliseconds i, std::function<void()> t)
      : name(std::move(n)), interval(i), task(std::move(t)), timer(io_context) {}

  std::string name;
  std::chrono::milliseconds interval;
  std::function<void()> task;

  boost::asio::io_context io_context;
  boost::asio::steady_timer timer;
  std::atomic<bool> running{false};
};

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> task, bool run_immediately)
    : state_(std::make_shared<State>(std::move(name), interval, std::move(task))) {
  state_->running.store(true, std::memory_order_release);
  ScheduleNext(state_.get(), run_immediately ? std::chrono::milliseconds(0)
                                             : state_->interval);

  // The thread's copy is released only after run() returns
  thread_ = std::thread([state = state_]() { state->io_context.run(); });
  LOG_DEBUG("Periodic task '{}' started (every {} ms)", state_->name,
            state_->interval.count());
}

PeriodicTask::~PeriodicTask() { Cancel(); }

void PeriodicTask::Cancel() {
  const bool was_running =
      state_->running.exchange(false, std::memory_order_acq_rel);
  if (was_running) {
    State *state = state_.get();
    boost::asio::post(state->io_context, [state]() { state->timer.cancel(); });
    state->io_context.stop();
  }

  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      // Called from the task itself
      thread_.detach();
    } else {
      thread_.join();
    }
  }

  if (was_running) {
    LOG_DEBUG("Periodic task '{}' cancelled", state_->name);
  }
}

bool PeriodicTask::running() const {
  return state_->running.load(std::memory_order_acquire);
}

const std::string &PeriodicTask::name() const { return state_->name; }

void PeriodicTask::ScheduleNext(State *state, std::chrono::milliseconds delay) {
  if (!state->running.load(std::memory_order_acquire)) {
    return;
  }

  state->timer.expires_after(delay);
  state->timer.async_wait([state](const boost::system::error_code &ec) {
    if (!ec && state->running.load(std::memory_order_acquire)) {
      RunOnce(state);
      ScheduleNext(state, state->interval);
    }
  });
}

void PeriodicTask::RunOnce(State *state) {
  try {
    state->task();
  } catch (const std::exception &e) {
    LOG_WARN("Periodic task '{}' failed: {}", state->name, e.what());
  }
}

} // namespace util
} // namespace anchorsync
