#include "submission.hpp"

#include "internal/commands/lookups.hpp"
#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/video/video_validator.hpp"

namespace demonlist::commands {

using demonlist::model::RecordStatus;

ResolveSubmissionData::Result ResolveSubmissionData::Handle(DatabaseExecutor& executor) const {
  auto resolved_player = executor.Execute(PlayerByName{player});
  auto resolved_demon  = executor.Execute(DemonByName{demon});
  return {std::move(resolved_player), std::move(resolved_demon)};
}

ProcessSubmission::Result ProcessSubmission::Handle(DatabaseExecutor& executor) const {
  if (submitter.banned) {
    throw util::BannedFromSubmissions();
  }

  const auto [player, demon] = executor.Execute(ResolveSubmissionData{submission.player, submission.demon});

  std::optional<std::string> video;
  if (submission.video) {
    video = executor.Services().video_validator->Validate(*submission.video);
  }

  if (player.banned) {
    throw util::PlayerBanned();
  }

  const auto& services = executor.Services();
  if (demon.position > services.extended_list_size) {
    throw util::SubmitLegacy();
  }
  if (demon.position > services.list_size && submission.progress != 100) {
    throw util::Non100Extended();
  }
  if (submission.progress > 100 || submission.progress < demon.requirement) {
    throw util::InvalidProgress(demon.requirement);
  }

  auto& repo = executor.Repository();
  auto& conn = executor.Connection();

  const auto matches = repo.FindMatchingRecords(conn, player.id, demon.name, video);

  std::optional<db::model::Record> existing;
  if (!matches.empty()) {
    existing = matches.front();
    if (existing->status == RecordStatus::kRejected || existing->progress >= submission.progress) {
      throw util::SubmissionExists(existing->status, existing->id);
    }
  }

  if (submission.verify_only) {
    return std::nullopt;
  }

  db::model::Record record;
  record.progress  = submission.progress;
  record.video     = video;
  record.status    = RecordStatus::kSubmitted;
  record.player    = player.id;
  record.submitter = submitter.id;
  record.demon     = demon.name;

  auto tx = conn.Begin();
  if (existing && existing->status == RecordStatus::kSubmitted) {
    db::ThrowIfDbError(repo.DeleteRecord(conn, existing->id), "delete superseded record");
  }
  db::ThrowIfDbError(repo.InsertRecord(conn, record), "insert record");
  tx->Commit();

  DEMONLIST_LOG_INFO("record submitted", {observability::IntField("record", record.id),
                                          observability::StringField("demon", record.demon),
                                          observability::IntField("progress", record.progress)});
  return record;
}

} // namespace demonlist::commands
