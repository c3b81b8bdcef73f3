// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_SYNC_QUERY_API_HPP
#define ANCHORSYNC_SYNC_SYNC_QUERY_API_HPP

#include <string>

namespace anchorsync {
namespace sync {

/**
 * Readiness predicate consulted by the index before serving a model.
 * Must be safe to call from any thread.
 */
class SyncQueryApi {
public:
  virtual ~SyncQueryApi() = default;

  // True when no historical sync for the model is outstanding
  virtual bool SyncComplete(const std::string &model) const = 0;
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_SYNC_QUERY_API_HPP
