// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/polling_block_listener.hpp"
#include "util/logging.hpp"
#include "util/periodic_task.hpp"

namespace anchorsync {
namespace sync {

PollingBlockListener::PollingBlockListener(const BlockListenerParams &params,
                                           const Options &options)
    : params_(params), options_(options) {
  if (params_.start_block_number) {
    last_ = BlockInfo{params_.expected_parent_hash, *params_.start_block_number, ""};
  }
}

PollingBlockListener::~PollingBlockListener() { Stop(); }

void PollingBlockListener::Start(BlockEventCallback callback) {
  {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    callback_ = std::move(callback);
  }
  timer_ = std::make_unique<util::PeriodicTask>(
      "block-poll", options_.poll_interval, [this]() { PollOnce(); },
      /*run_immediately=*/true);
  LOG_CHAIN_INFO("Polling {} for blocks with {} confirmations every {} ms",
                 params_.chain_id, params_.confirmations,
                 options_.poll_interval.count());
}

void PollingBlockListener::Stop() {
  if (timer_) {
    timer_->Cancel();
    timer_.reset();
  }
  std::lock_guard<std::mutex> lock(poll_mutex_);
  callback_ = nullptr;
}

void PollingBlockListener::PollOnce() {
  std::lock_guard<std::mutex> lock(poll_mutex_);
  if (!callback_ || !params_.provider) {
    return;
  }

  try {
    BlockInfo tip = params_.provider->GetBlock(-params_.confirmations);

    if (!last_) {
      // Start block number unknown: anchor on the first confirmed tip
      if (tip.hash != params_.expected_parent_hash) {
        LOG_CHAIN_WARN("Confirmed tip {} ({}) differs from expected start {}",
                       tip.number, tip.hash, params_.expected_parent_hash);
      }
      last_ = tip;
      return;
    }

    int emitted = 0;
    for (int64_t number = last_->number + 1;
         number <= tip.number && emitted < options_.max_blocks_per_poll; ++number) {
      BlockInfo block =
          (number == tip.number) ? tip : params_.provider->GetBlockByNumber(number);

      BlockConfirmationEvent event;
      event.block = block;
      if (block.parent_hash != last_->hash) {
        event.reorganized = true;
        event.expected_parent_hash = block.parent_hash;
        LOG_CHAIN_WARN("Reorganization detected at block {}: parent {} != {}",
                       block.number, block.parent_hash, last_->hash);
      }

      callback_(event);
      last_ = block;
      ++emitted;
    }
  } catch (const std::exception &e) {
    LOG_CHAIN_WARN("Block poll failed, will retry: {}", e.what());
  }
}

BlockListenerFactory PollingBlockListener::Factory(const Options &options) {
  return [options](const BlockListenerParams &params) -> std::unique_ptr<BlockListener> {
    return std::make_unique<PollingBlockListener>(params, options);
  };
}

} // namespace sync
} // namespace anchorsync
