// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/sync_state_store.hpp"
#include "store/database.hpp"
#include "util/logging.hpp"

namespace anchorsync {
namespace sync {

SyncStateStore::SyncStateStore(const std::string &db_path)
    : db_(std::make_unique<store::Database>(db_path)) {}

SyncStateStore::~SyncStateStore() = default;

void SyncStateStore::EnsureTable() {
  // The id column pins the table to one row
  db_->Exec(std::string("CREATE TABLE IF NOT EXISTS ") + STATE_TABLE_NAME +
            " (id INTEGER PRIMARY KEY CHECK (id = 1), "
            "processed_block_hash VARCHAR(1024), "
            "processed_block_number INTEGER)");
  db_->Exec(std::string("INSERT OR IGNORE INTO ") + STATE_TABLE_NAME +
            " (id, processed_block_hash, processed_block_number) "
            "VALUES (1, NULL, NULL)");
}

SyncProgress SyncStateStore::Load() {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  EnsureTable();

  auto stmt = db_->Prepare(std::string("SELECT processed_block_hash, "
                                       "processed_block_number FROM ") +
                           STATE_TABLE_NAME + " WHERE id = 1");
  SyncProgress progress;
  if (stmt.Step()) {
    progress.processed_block_hash = stmt.ColumnOptionalText(0);
    progress.processed_block_number = stmt.ColumnOptionalInt64(1);
  }

  if (progress.IsUnset()) {
    LOG_SYNC_DEBUG("No sync progress stored yet");
  } else {
    LOG_SYNC_DEBUG("Loaded sync progress: block {} ({})",
                   *progress.processed_block_number,
                   progress.processed_block_hash.value_or("<no hash>"));
  }
  return progress;
}

void SyncStateStore::Save(const SyncProgress &progress) {
  std::lock_guard<std::recursive_mutex> lock(db_->mutex());
  EnsureTable();

  auto stmt = db_->Prepare(std::string("UPDATE ") + STATE_TABLE_NAME +
                           " SET processed_block_hash = ?, "
                           "processed_block_number = ? WHERE id = 1");
  stmt.Bind(1, progress.processed_block_hash)
      .Bind(2, progress.processed_block_number);
  stmt.Run();
}

} // namespace sync
} // namespace anchorsync
