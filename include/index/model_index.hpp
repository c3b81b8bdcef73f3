// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_INDEX_MODEL_INDEX_HPP
#define ANCHORSYNC_INDEX_MODEL_INDEX_HPP

#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace anchorsync {

namespace store {
class Database;
}

namespace sync {
class SyncQueryApi;
}

namespace index {

// Table tracking which models this node indexes
constexpr const char *INDEXED_MODEL_CONFIG_TABLE_NAME = "indexed_model_config";

class ModelNotIndexedError : public std::runtime_error {
public:
  explicit ModelNotIndexedError(const std::string &model)
      : std::runtime_error("Query failed: Model " + model +
                           " is not indexed on this node") {}
};

class IndexQueryNotAvailableError : public std::runtime_error {
public:
  explicit IndexQueryNotAvailableError(const std::string &model)
      : std::runtime_error("Query failed: Model " + model +
                           " is still being synced, queries are not available "
                           "until historical sync completes") {}
};

/**
 * Source of the models the node currently indexes
 */
class ModelIndex {
public:
  virtual ~ModelIndex() = default;

  virtual std::vector<std::string> IndexedModels() = 0;
};

/**
 * ModelIndexRegistry - persistent indexed-model configuration plus the
 * query gate
 *
 * A model stays in the table after StopIndexingModels with is_indexed = 0.
 * Such a model cannot be indexed again: the anchors it missed while not
 * indexed were never applied.
 *
 * Storage errors surface as store::DatabaseError.
 */
class ModelIndexRegistry : public ModelIndex {
public:
  explicit ModelIndexRegistry(const std::string &db_path,
                              bool allow_queries_before_historical_sync = false);
  ~ModelIndexRegistry() override;

  ModelIndexRegistry(const ModelIndexRegistry &) = delete;
  ModelIndexRegistry &operator=(const ModelIndexRegistry &) = delete;

  // Create the table and load the indexed set
  void Init();

  // Throws std::runtime_error if any model was indexed before and then
  // stopped; nothing is written in that case
  void IndexModels(const std::vector<std::string> &models);
  void StopIndexingModels(const std::vector<std::string> &models);

  std::vector<std::string> IndexedModels() override;
  std::vector<std::string> ModelsNoLongerIndexed();

  // Readiness source for AssertNoOngoingSyncForModel; may be null when
  // sync is disabled
  void SetSyncQueryApi(const sync::SyncQueryApi *sync_api);

  // Throw unless the model may be served right now
  void AssertModelQueryable(const std::string &model) const;
  void AssertModelIsIndexed(const std::string &model) const;
  void AssertNoOngoingSyncForModel(const std::string &model) const;

private:
  void EnsureTable();

  std::unique_ptr<store::Database> db_;
  const bool allow_queries_before_historical_sync_;

  mutable std::mutex mutex_;
  std::set<std::string> indexed_;
  const sync::SyncQueryApi *sync_api_{nullptr};
};

} // namespace index
} // namespace anchorsync

#endif // ANCHORSYNC_INDEX_MODEL_INDEX_HPP
