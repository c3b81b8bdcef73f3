// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/block_subscription.hpp"
#include "util/logging.hpp"

namespace anchorsync {
namespace sync {

BlockSubscription::BlockSubscription(std::unique_ptr<BlockListener> listener,
                                     BlockEventCallback handler)
    : listener_(std::move(listener)), handler_(std::move(handler)) {
  active_.store(true, std::memory_order_release);
  delivery_thread_ = std::thread(&BlockSubscription::DeliveryLoop, this);
  try {
    listener_->Start([this](const BlockConfirmationEvent &event) { Enqueue(event); });
  } catch (const std::exception &) {
    // Never subscribed: drop anything queued and join before unwinding
    active_.store(false, std::memory_order_release);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.clear();
      stopping_ = true;
    }
    cv_.notify_all();
    delivery_thread_.join();
    throw;
  }
}

BlockSubscription::~BlockSubscription() { Unsubscribe(); }

void BlockSubscription::Unsubscribe() {
  if (!active_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  // No new events after this returns
  try {
    listener_->Stop();
  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Block listener failed to stop cleanly: {}", e.what());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (delivery_thread_.joinable()) {
    delivery_thread_.join();
  }
  LOG_CHAIN_DEBUG("Block subscription closed after {} event(s)", delivered());
}

void BlockSubscription::Enqueue(const BlockConfirmationEvent &event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      LOG_CHAIN_DEBUG("Dropping block {} received after unsubscribe", event.block.number);
      return;
    }
    pending_.push_back(event);
  }
  cv_.notify_one();
}

void BlockSubscription::DeliveryLoop() {
  while (true) {
    BlockConfirmationEvent event;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      event = std::move(pending_.front());
      pending_.pop_front();
    }

    try {
      handler_(event);
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Block event handler failed for block {}: {}",
                      event.block.number, e.what());
    }
    delivered_.fetch_add(1, std::memory_order_acq_rel);
  }
}

} // namespace sync
} // namespace anchorsync
