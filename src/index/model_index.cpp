// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "index/model_index.hpp"
#include "store/database.hpp"
#include "sync/sync_query_api.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace anchorsync {
namespace index {

ModelIndexRegistry::ModelIndexRegistry(const std::string &db_path,
                                       bool allow_queries_before_historical_sync)
    : db_(std::make_unique<store::Database>(db_path)),
      allow_queries_before_historical_sync_(allow_queries_before_historical_sync) {}

ModelIndexRegistry::~ModelIndexRegistry() = default;

void ModelIndexRegistry::EnsureTable() {
  db_->Exec(std::string("CREATE TABLE IF NOT EXISTS ") +
            INDEXED_MODEL_CONFIG_TABLE_NAME +
            " (model VARCHAR(1024) PRIMARY KEY, "
            "is_indexed INTEGER NOT NULL DEFAULT 1, "
            "created_at INTEGER NOT NULL, "
            "updated_at INTEGER NOT NULL)");
}

void ModelIndexRegistry::Init() {
  std::set<std::string> loaded;
  {
    std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
    EnsureTable();
    auto stmt = db_->Prepare(std::string("SELECT model FROM ") +
                             INDEXED_MODEL_CONFIG_TABLE_NAME +
                             " WHERE is_indexed = 1");
    while (stmt.Step()) {
      loaded.insert(stmt.ColumnText(0));
    }
  }

  LOG_INDEX_INFO("Loaded {} indexed model(s)", loaded.size());
  std::lock_guard<std::mutex> lock(mutex_);
  indexed_ = std::move(loaded);
}

void ModelIndexRegistry::IndexModels(const std::vector<std::string> &models) {
  if (models.empty()) {
    return;
  }

  const auto stopped = ModelsNoLongerIndexed();
  for (const auto &model : models) {
    for (const auto &old : stopped) {
      if (old == model) {
        throw std::runtime_error("Cannot re-index model " + model +
                                 ", data may not be up-to-date");
      }
    }
  }

  const int64_t now = util::GetTimeMillis();
  {
    std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
    store::Transaction tx(*db_);
    for (const auto &model : models) {
      auto stmt = db_->Prepare(
          std::string("INSERT INTO ") + INDEXED_MODEL_CONFIG_TABLE_NAME +
          " (model, is_indexed, created_at, updated_at) VALUES (?, 1, ?, ?) "
          "ON CONFLICT(model) DO UPDATE SET is_indexed = 1, "
          "updated_at = excluded.updated_at");
      stmt.Bind(1, model).Bind(2, now).Bind(3, now);
      stmt.Run();
    }
    tx.Commit();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &model : models) {
    if (indexed_.insert(model).second) {
      LOG_INDEX_INFO("Starting indexing for model {}", model);
    }
  }
}

void ModelIndexRegistry::StopIndexingModels(const std::vector<std::string> &models) {
  if (models.empty()) {
    return;
  }

  const int64_t now = util::GetTimeMillis();
  {
    std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
    EnsureTable();
    store::Transaction tx(*db_);
    for (const auto &model : models) {
      auto stmt = db_->Prepare(
          std::string("INSERT INTO ") + INDEXED_MODEL_CONFIG_TABLE_NAME +
          " (model, is_indexed, created_at, updated_at) VALUES (?, 0, ?, ?) "
          "ON CONFLICT(model) DO UPDATE SET is_indexed = 0, "
          "updated_at = excluded.updated_at");
      stmt.Bind(1, model).Bind(2, now).Bind(3, now);
      stmt.Run();
    }
    tx.Commit();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &model : models) {
    indexed_.erase(model);
  }
  LOG_INDEX_INFO("Stopped indexing {} model(s)", models.size());
}

std::vector<std::string> ModelIndexRegistry::IndexedModels() {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(indexed_.begin(), indexed_.end());
}

std::vector<std::string> ModelIndexRegistry::ModelsNoLongerIndexed() {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  EnsureTable();
  auto stmt = db_->Prepare(std::string("SELECT model FROM ") +
                           INDEXED_MODEL_CONFIG_TABLE_NAME +
                           " WHERE is_indexed = 0 ORDER BY model");
  std::vector<std::string> models;
  while (stmt.Step()) {
    models.push_back(stmt.ColumnText(0));
  }
  return models;
}

void ModelIndexRegistry::SetSyncQueryApi(const sync::SyncQueryApi *sync_api) {
  std::lock_guard<std::mutex> lock(mutex_);
  sync_api_ = sync_api;
}

void ModelIndexRegistry::AssertModelQueryable(const std::string &model) const {
  AssertModelIsIndexed(model);
  AssertNoOngoingSyncForModel(model);
}

void ModelIndexRegistry::AssertModelIsIndexed(const std::string &model) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (indexed_.count(model) == 0) {
    throw ModelNotIndexedError(model);
  }
}

void ModelIndexRegistry::AssertNoOngoingSyncForModel(const std::string &model) const {
  if (allow_queries_before_historical_sync_) {
    return;
  }

  const sync::SyncQueryApi *sync_api;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sync_api = sync_api_;
  }
  if (sync_api != nullptr && !sync_api->SyncComplete(model)) {
    LOG_INDEX_DEBUG("Refusing query for model {} during historical sync", model);
    throw IndexQueryNotAvailableError(model);
  }
}

} // namespace index
} // namespace anchorsync
