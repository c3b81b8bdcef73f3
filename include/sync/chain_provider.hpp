// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_CHAIN_PROVIDER_HPP
#define ANCHORSYNC_SYNC_CHAIN_PROVIDER_HPP

#include <cstdint>
#include <string>

namespace anchorsync {
namespace sync {

struct BlockInfo {
  std::string hash;
  int64_t number{0};
  std::string parent_hash;
};

struct NetworkInfo {
  int64_t chain_id{0};
};

/**
 * ChainProvider - read access to the anchoring blockchain
 *
 * Implemented outside this library (an RPC client). Methods throw
 * std::runtime_error (or a subclass) when the chain cannot be reached.
 */
class ChainProvider {
public:
  virtual ~ChainProvider() = default;

  // offset_from_head <= 0; -N selects the block N behind the current head
  virtual BlockInfo GetBlock(int64_t offset_from_head) = 0;

  virtual BlockInfo GetBlockByNumber(int64_t number) = 0;

  virtual NetworkInfo GetNetwork() = 0;
};

// CAIP-2 chain id for an EVM network, e.g. "eip155:1337"
inline std::string ToCaip2ChainId(const NetworkInfo &network) {
  return "eip155:" + std::to_string(network.chain_id);
}

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_CHAIN_PROVIDER_HPP
