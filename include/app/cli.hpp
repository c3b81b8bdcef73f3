// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_APP_CLI_HPP
#define ANCHORSYNC_APP_CLI_HPP

#include "sync/job_queue.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace anchorsync {
namespace app {

struct AppConfig {
  std::filesystem::path datadir;
  std::string log_level{"warn"};
  std::vector<std::string> debug_components;
  bool verbose{false};

  std::string command;
  std::vector<std::string> command_args;
};

/**
 * Offline inspection of a sync database
 *
 * Each report opens the database read-mostly (tables are created if absent)
 * and returns a JSON document for printing. Storage errors propagate as
 * store::DatabaseError.
 */

// {"progress": {...}, "jobs": {"created": {queue: n}, "active": {...}, ...}}
nlohmann::json StatusReport(const std::string &db_path);

// All jobs in the given state (every state when empty), grouped by queue
nlohmann::json JobsReport(const std::string &db_path,
                          std::optional<sync::JobState> state);

// {"indexed": [...], "noLongerIndexed": [...]}
nlohmann::json ModelsReport(const std::string &db_path);

nlohmann::json JobToJson(const sync::QueuedJob &job);

// Dispatch config.command; prints to stdout and returns the exit code
int RunCommand(const AppConfig &config);

} // namespace app
} // namespace anchorsync

#endif // ANCHORSYNC_APP_CLI_HPP
