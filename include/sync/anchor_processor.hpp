// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_ANCHOR_PROCESSOR_HPP
#define ANCHORSYNC_SYNC_ANCHOR_PROCESSOR_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace anchorsync {
namespace sync {

/**
 * AnchorApplier - fetches anchor commitments in a block range and applies
 * them to the stream state of the given models.
 *
 * Provided by the node. Must be idempotent: the same range may be applied
 * more than once (retries, reorg recovery, overlapping catch-up jobs).
 * Throws on failure; the job queue decides whether to retry.
 */
class AnchorApplier {
public:
  virtual ~AnchorApplier() = default;

  virtual void ApplyAnchors(int64_t from_block, int64_t to_block,
                            const std::vector<std::string> &models) = 0;
};

/**
 * AnchorRebuilder - re-derives stored anchor state for models (admin)
 */
class AnchorRebuilder {
public:
  virtual ~AnchorRebuilder() = default;

  virtual void RebuildAnchors(const std::vector<std::string> &models) = 0;
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_ANCHOR_PROCESSOR_HPP
