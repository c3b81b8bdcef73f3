// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "app/cli.hpp"
#include "index/model_index.hpp"
#include "sync/sqlite_job_queue.hpp"
#include "sync/sync_state_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <iostream> // Command output goes to stdout, not the log

namespace anchorsync {
namespace app {

namespace {

const std::vector<sync::QueueName> kAllQueues{
    sync::QueueName::Historical, sync::QueueName::Continuous,
    sync::QueueName::Rebuild};

const std::vector<sync::JobState> kAllStates{
    sync::JobState::Created, sync::JobState::Active, sync::JobState::Completed,
    sync::JobState::Failed};

nlohmann::json OptionalMillis(const std::optional<int64_t> &millis) {
  if (!millis) {
    return nullptr;
  }
  return util::FormatIso8601Millis(*millis);
}

} // namespace

nlohmann::json JobToJson(const sync::QueuedJob &job) {
  nlohmann::json j{{"id", job.id},
                   {"queue", sync::QueueNameToString(job.queue)},
                   {"state", sync::JobStateToString(job.state)},
                   {"data", job.data},
                   {"retryCount", job.retry_count},
                   {"createdOn", util::FormatIso8601Millis(job.created_on)},
                   {"startedOn", OptionalMillis(job.started_on)},
                   {"completedOn", OptionalMillis(job.completed_on)}};
  j["currentBlock"] = job.current_block ? nlohmann::json(*job.current_block)
                                        : nlohmann::json(nullptr);
  if (!job.last_error.empty()) {
    j["lastError"] = job.last_error;
  }
  return j;
}

nlohmann::json StatusReport(const std::string &db_path) {
  sync::SyncStateStore state_store(db_path);
  const auto progress = state_store.Load();

  nlohmann::json report;
  report["progress"] = {
      {"processedBlockHash", progress.processed_block_hash
                                 ? nlohmann::json(*progress.processed_block_hash)
                                 : nlohmann::json(nullptr)},
      {"processedBlockNumber", progress.processed_block_number
                                   ? nlohmann::json(*progress.processed_block_number)
                                   : nlohmann::json(nullptr)}};

  sync::SqliteJobQueue queue(db_path);
  nlohmann::json counts = nlohmann::json::object();
  for (auto state : kAllStates) {
    nlohmann::json per_queue = nlohmann::json::object();
    for (const auto &[name, jobs] : queue.GetJobs(state, kAllQueues)) {
      per_queue[sync::QueueNameToString(name)] = jobs.size();
    }
    counts[sync::JobStateToString(state)] = per_queue;
  }
  report["jobs"] = counts;
  return report;
}

nlohmann::json JobsReport(const std::string &db_path,
                          std::optional<sync::JobState> state) {
  sync::SqliteJobQueue queue(db_path);
  nlohmann::json report = nlohmann::json::object();

  for (auto s : kAllStates) {
    if (state && *state != s) {
      continue;
    }
    nlohmann::json per_queue = nlohmann::json::object();
    for (const auto &[name, jobs] : queue.GetJobs(s, kAllQueues)) {
      nlohmann::json list = nlohmann::json::array();
      for (const auto &job : jobs) {
        list.push_back(JobToJson(job));
      }
      per_queue[sync::QueueNameToString(name)] = list;
    }
    report[sync::JobStateToString(s)] = per_queue;
  }
  return report;
}

nlohmann::json ModelsReport(const std::string &db_path) {
  index::ModelIndexRegistry registry(db_path);
  registry.Init();
  return nlohmann::json{{"indexed", registry.IndexedModels()},
                        {"noLongerIndexed", registry.ModelsNoLongerIndexed()}};
}

int RunCommand(const AppConfig &config) {
  const std::string db_path = util::sync_db_path(config.datadir).string();

  if (!std::filesystem::exists(db_path)) {
    std::cerr << "No sync database at " << db_path << std::endl;
    return 1;
  }

  try {
    nlohmann::json output;
    if (config.command == "status") {
      output = StatusReport(db_path);
    } else if (config.command == "jobs") {
      std::optional<sync::JobState> state;
      if (!config.command_args.empty()) {
        state = sync::JobStateFromString(config.command_args[0]);
        if (!state) {
          std::cerr << "Unknown job state: " << config.command_args[0] << std::endl;
          return 1;
        }
      }
      output = JobsReport(db_path, state);
    } else if (config.command == "models") {
      output = ModelsReport(db_path);
    } else {
      std::cerr << "Unknown command: " << config.command << std::endl;
      return 1;
    }

    std::cout << output.dump(2) << std::endl;
    return 0;
  } catch (const std::exception &e) {
    LOG_ERROR("Command '{}' failed: {}", config.command, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace app
} // namespace anchorsync
