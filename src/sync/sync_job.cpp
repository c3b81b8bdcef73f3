// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/sync_job.hpp"
#include <stdexcept>

namespace anchorsync {
namespace sync {

const char *QueueNameToString(QueueName queue) {
  switch (queue) {
  case QueueName::Historical:
    return "historySync";
  case QueueName::Continuous:
    return "continuousSync";
  case QueueName::Rebuild:
    return "rebuildAnchor";
  }
  return "unknown";
}

std::optional<QueueName> QueueNameFromString(const std::string &name) {
  if (name == "historySync") return QueueName::Historical;
  if (name == "continuousSync") return QueueName::Continuous;
  if (name == "rebuildAnchor") return QueueName::Rebuild;
  return std::nullopt;
}

const char *SyncJobKindToString(SyncJobKind kind) {
  switch (kind) {
  case SyncJobKind::Catchup:
    return "catchup";
  case SyncJobKind::Full:
    return "full";
  case SyncJobKind::Continuous:
    return "continuous";
  }
  return "unknown";
}

std::optional<SyncJobKind> SyncJobKindFromString(const std::string &name) {
  if (name == "catchup") return SyncJobKind::Catchup;
  if (name == "full") return SyncJobKind::Full;
  if (name == "continuous") return SyncJobKind::Continuous;
  return std::nullopt;
}

std::string JoinModels(const std::vector<std::string> &models) {
  std::string out;
  for (const auto &model : models) {
    if (!out.empty()) {
      out += ", ";
    }
    out += model;
  }
  return out;
}

void to_json(nlohmann::json &j, const SyncJobRequest &req) {
  j = nlohmann::json{{"jobType", SyncJobKindToString(req.job_type)},
                     {"fromBlock", req.from_block},
                     {"toBlock", req.to_block},
                     {"models", req.models}};
}

void from_json(const nlohmann::json &j, SyncJobRequest &req) {
  auto kind = SyncJobKindFromString(j.at("jobType").get<std::string>());
  if (!kind) {
    throw std::invalid_argument("unknown jobType: " +
                                j.at("jobType").get<std::string>());
  }
  req.job_type = *kind;
  req.from_block = j.at("fromBlock").get<int64_t>();
  req.to_block = j.at("toBlock").get<int64_t>();
  req.models = j.at("models").get<std::vector<std::string>>();
}

void to_json(nlohmann::json &j, const RebuildAnchorRequest &req) {
  j = nlohmann::json{{"models", req.models}};
}

void from_json(const nlohmann::json &j, RebuildAnchorRequest &req) {
  req.models = j.at("models").get<std::vector<std::string>>();
}

} // namespace sync
} // namespace anchorsync
