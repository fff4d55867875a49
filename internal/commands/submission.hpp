#pragma once

#include <optional>
#include <string>
#include <utility>

#include "internal/db/model/demon.hpp"
#include "internal/db/model/player.hpp"
#include "internal/db/model/record.hpp"
#include "internal/db/model/submitter.hpp"
#include "internal/executor/database_executor.hpp"

namespace demonlist::commands {

using executor::DatabaseExecutor;

/*
  A claim of progress, not persisted as such. With verify_only set the
  claim is checked against every rule but nothing is written.
*/
struct Submission {
  int                        progress = 0;
  std::string                player;
  std::string                demon;
  std::optional<std::string> video;
  bool                       verify_only = false;
};

// Player (created if unknown) and demon (must exist) named by a submission.
struct ResolveSubmissionData {
  using Result                       = std::pair<db::model::Player, db::model::Demon>;
  static constexpr const char* kName = "ResolveSubmissionData";

  std::string player;
  std::string demon;

  Result Handle(DatabaseExecutor& executor) const;
};

/*
  Reconciles a submission against the records already stored.

  Returns the new Submitted record, or nullopt for a successful
  verify_only submission.
*/
struct ProcessSubmission {
  using Result                       = std::optional<db::model::Record>;
  static constexpr const char* kName = "ProcessSubmission";

  Submission           submission;
  db::model::Submitter submitter;

  Result Handle(DatabaseExecutor& executor) const;
};

} // namespace demonlist::commands
