// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_POLLING_BLOCK_LISTENER_HPP
#define ANCHORSYNC_SYNC_POLLING_BLOCK_LISTENER_HPP

#include "sync/block_subscription.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace anchorsync {

namespace util {
class PeriodicTask;
}

namespace sync {

/**
 * PollingBlockListener - confirmation events derived from provider polling
 *
 * Every poll reads the confirmed tip (GetBlock(-confirmations)) and walks
 * each block between the last emitted one and that tip by number. A block
 * whose parent hash matches the previously emitted hash is a forward
 * advance; a mismatch is reported as a reorganization carrying the block's
 * parent as the new expected parent hash.
 *
 * Provider errors abort the current poll only; the next poll resumes from
 * the last emitted block.
 */
class PollingBlockListener : public BlockListener {
public:
  struct Options {
    std::chrono::milliseconds poll_interval{5000};
    // Bound on blocks emitted by a single poll
    int max_blocks_per_poll{100};
  };

  PollingBlockListener(const BlockListenerParams &params, const Options &options);
  ~PollingBlockListener() override;

  void Start(BlockEventCallback callback) override;
  void Stop() override;

  // Run one poll synchronously (used by Start's timer and by tests)
  void PollOnce();

  // Factory suitable for SyncApi
  static BlockListenerFactory Factory(const Options &options);

private:
  BlockListenerParams params_;
  Options options_;
  BlockEventCallback callback_;

  std::mutex poll_mutex_;
  std::optional<BlockInfo> last_;

  std::unique_ptr<util::PeriodicTask> timer_;
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_POLLING_BLOCK_LISTENER_HPP
