// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_SYNC_STATE_STORE_HPP
#define ANCHORSYNC_SYNC_SYNC_STATE_STORE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace anchorsync {

namespace store {
class Database;
}

namespace sync {

/**
 * Last fully processed block. Both fields empty means never synced, which
 * is distinct from "synced to block 0".
 */
struct SyncProgress {
  std::optional<std::string> processed_block_hash;
  std::optional<int64_t> processed_block_number;

  bool IsUnset() const { return !processed_block_number.has_value(); }

  bool operator==(const SyncProgress &other) const {
    return processed_block_hash == other.processed_block_hash &&
           processed_block_number == other.processed_block_number;
  }
};

// Table holding the single progress row
constexpr const char *STATE_TABLE_NAME = "anchor_sync_state";

/**
 * SyncStateStore - durable single-row sync progress
 *
 * Throws store::DatabaseError on storage failures.
 */
class SyncStateStore {
public:
  explicit SyncStateStore(const std::string &db_path);
  ~SyncStateStore();

  SyncStateStore(const SyncStateStore &) = delete;
  SyncStateStore &operator=(const SyncStateStore &) = delete;

  // Creates the table and its NULL row on first use
  SyncProgress Load();

  // Overwrites the singleton row
  void Save(const SyncProgress &progress);

private:
  void EnsureTable();

  std::unique_ptr<store::Database> db_;
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_SYNC_STATE_STORE_HPP
