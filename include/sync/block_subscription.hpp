// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_BLOCK_SUBSCRIPTION_HPP
#define ANCHORSYNC_SYNC_BLOCK_SUBSCRIPTION_HPP

#include "sync/chain_provider.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace anchorsync {
namespace sync {

/**
 * A block reaching the confirmation depth.
 *
 * reorganized == true means the canonical chain changed below this block;
 * expected_parent_hash then carries the new canonical parent.
 */
struct BlockConfirmationEvent {
  BlockInfo block;
  bool reorganized{false};
  std::optional<std::string> expected_parent_hash;
};

using BlockEventCallback = std::function<void(const BlockConfirmationEvent &)>;

struct BlockListenerParams {
  int confirmations{0};
  std::string chain_id;
  ChainProvider *provider{nullptr};
  // Hash of the last block already accounted for; events start after it
  std::string expected_parent_hash;
  // Number of that block, when known
  std::optional<int64_t> start_block_number;
};

/**
 * BlockListener - source of block confirmation events
 *
 * Start() may invoke the callback from any thread, in chain order.
 * After Stop() returns no further callbacks are made.
 */
class BlockListener {
public:
  virtual ~BlockListener() = default;

  virtual void Start(BlockEventCallback callback) = 0;
  virtual void Stop() = 0;
};

using BlockListenerFactory =
    std::function<std::unique_ptr<BlockListener>(const BlockListenerParams &)>;

/**
 * BlockSubscription - ordered, non-overlapping delivery of listener events
 *
 * Events from the listener are queued and handed to the handler one at a
 * time on a dedicated thread, in arrival order, so a slow handler never
 * runs concurrently with itself.
 *
 * Unsubscribe() stops the listener first, then lets the delivery thread
 * finish the events already received. Destruction unsubscribes.
 */
class BlockSubscription {
public:
  BlockSubscription(std::unique_ptr<BlockListener> listener,
                    BlockEventCallback handler);
  ~BlockSubscription();

  BlockSubscription(const BlockSubscription &) = delete;
  BlockSubscription &operator=(const BlockSubscription &) = delete;

  void Unsubscribe();

  bool active() const { return active_.load(std::memory_order_acquire); }

  // Number of events handed to the handler so far
  uint64_t delivered() const { return delivered_.load(std::memory_order_acquire); }

private:
  void Enqueue(const BlockConfirmationEvent &event);
  void DeliveryLoop();

  std::unique_ptr<BlockListener> listener_;
  BlockEventCallback handler_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<BlockConfirmationEvent> pending_;
  bool stopping_{false};

  std::thread delivery_thread_;
  std::atomic<bool> active_{false};
  std::atomic<uint64_t> delivered_{0};
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_BLOCK_SUBSCRIPTION_HPP
