// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/job_queue.hpp"

namespace anchorsync {
namespace sync {

const char *JobStateToString(JobState state) {
  switch (state) {
  case JobState::Created:
    return "created";
  case JobState::Active:
    return "active";
  case JobState::Completed:
    return "completed";
  case JobState::Failed:
    return "failed";
  }
  return "unknown";
}

std::optional<JobState> JobStateFromString(const std::string &name) {
  if (name == "created") return JobState::Created;
  if (name == "active") return JobState::Active;
  if (name == "completed") return JobState::Completed;
  if (name == "failed") return JobState::Failed;
  return std::nullopt;
}

} // namespace sync
} // namespace anchorsync
