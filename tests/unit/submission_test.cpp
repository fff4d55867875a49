#include "internal/commands/submission.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/commands/lookups.hpp"
#include "internal/context/request_context.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using demonlist::commands::DeleteRecordById;
using demonlist::commands::PlayerByName;
using demonlist::commands::ProcessSubmission;
using demonlist::commands::Submission;
using demonlist::commands::SubmitterByIp;
using demonlist::context::RequestData;
using demonlist::model::Permission;
using demonlist::model::PermissionSet;
using demonlist::model::RecordStatus;
using demonlist::testing::TestEnv;
using demonlist::testing::Throws;
namespace util = demonlist::util;

// list_size 3, extended_list_size 5 (see TestEnv)
void SeedDemons(TestEnv& env) {
  env.AddDemon("main", 1, 50);
  env.AddDemon("extended", 4, 100);
  env.AddDemon("legacy", 6, 50);
}

Submission Claim(const std::string& player, const std::string& demon, int progress) {
  Submission submission;
  submission.player   = player;
  submission.demon    = demon;
  submission.progress = progress;
  return submission;
}

void TestBannedSubmitterStopsBeforeAnyLookup() {
  TestEnv env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.1", true);

  auto claim  = Claim("newcomer", "main", 80);
  claim.video = "https://youtu.be/banned";

  assert(Throws<util::BannedFromSubmissions>([&] { env.executor.Execute(ProcessSubmission{claim, submitter}); }));
  assert(env.videos->calls == 0);
  assert(!env.Player("newcomer").has_value());
  assert(env.RecordCount() == 0);
}

void TestResolutionAndVideoOrder() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.2");

  // unknown demon is fatal, unknown player is created
  assert(Throws<util::ModelNotFound>([&] { env.executor.Execute(ProcessSubmission{Claim("fresh", "missing", 80), submitter}); }));
  assert(env.Player("fresh").has_value());
  assert(env.videos->calls == 0);

  // video errors come before the ban check on the player
  env.AddPlayer("banned player", true);
  auto claim  = Claim("banned player", "main", 80);
  claim.video = "not a url";
  assert(Throws<util::InvalidVideo>([&] { env.executor.Execute(ProcessSubmission{claim, submitter}); }));
  assert(env.videos->calls == 1);

  claim.video = "https://youtu.be/ok";
  assert(Throws<util::PlayerBanned>([&] { env.executor.Execute(ProcessSubmission{claim, submitter}); }));
}

void TestListBoundaries() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.3");

  assert(Throws<util::SubmitLegacy>([&] { env.executor.Execute(ProcessSubmission{Claim("p", "legacy", 100), submitter}); }));
  assert(Throws<util::SubmitLegacy>([&] { env.executor.Execute(ProcessSubmission{Claim("p", "legacy", 60), submitter}); }));
  assert(Throws<util::Non100Extended>([&] { env.executor.Execute(ProcessSubmission{Claim("p", "extended", 99), submitter}); }));
  assert(env.executor.Execute(ProcessSubmission{Claim("p", "extended", 100), submitter}).has_value());

  bool below = false;
  try {
    env.executor.Execute(ProcessSubmission{Claim("p", "main", 49), submitter});
  } catch (const util::InvalidProgress& e) {
    below = e.Requirement() == 50;
  }
  assert(below);
  assert(Throws<util::InvalidProgress>([&] { env.executor.Execute(ProcessSubmission{Claim("p", "main", 101), submitter}); }));
}

void TestVerifyOnlyNeverWrites() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.4");
  const auto player    = env.AddPlayer("verifier");
  const auto existing  = env.AddRecord(player.id, "main", 60, RecordStatus::kSubmitted, submitter.id);

  auto improve        = Claim("verifier", "main", 90);
  improve.verify_only = true;
  assert(!env.executor.Execute(ProcessSubmission{improve, submitter}).has_value());

  auto worse        = Claim("verifier", "main", 55);
  worse.verify_only = true;
  assert(Throws<util::SubmissionExists>([&] { env.executor.Execute(ProcessSubmission{worse, submitter}); }));

  assert(env.RecordCount() == 1);
  assert(env.Record(existing.id)->progress == 60);
  assert(env.repository->TransactionsBegun() == 0);
}

void TestSubmittedRecordIsReplaced() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.5");
  const auto player    = env.AddPlayer("improver");
  const auto old       = env.AddRecord(player.id, "main", 40, RecordStatus::kSubmitted, submitter.id);

  const auto record = env.executor.Execute(ProcessSubmission{Claim("improver", "main", 60), submitter});
  assert(record.has_value());
  assert(record->progress == 60);
  assert(record->status == RecordStatus::kSubmitted);
  assert(record->player == player.id);
  assert(record->submitter == submitter.id);

  assert(!env.Record(old.id).has_value());
  assert(env.Record(record->id).has_value());
  assert(env.RecordCount() == 1);
  assert(env.repository->TransactionsBegun() == 1);
}

void TestApprovedRecordIsKept() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.6");
  const auto player    = env.AddPlayer("approved");
  const auto old       = env.AddRecord(player.id, "main", 80, RecordStatus::kApproved, submitter.id);

  const auto record = env.executor.Execute(ProcessSubmission{Claim("approved", "main", 90), submitter});
  assert(record.has_value());
  assert(record->status == RecordStatus::kSubmitted);
  assert(env.Record(old.id)->status == RecordStatus::kApproved);
  assert(env.RecordCount() == 2);
}

void TestNoImprovementIsRejected() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.7");
  const auto player    = env.AddPlayer("steady");
  const auto old       = env.AddRecord(player.id, "main", 70, RecordStatus::kApproved, submitter.id);

  bool exists = false;
  try {
    env.executor.Execute(ProcessSubmission{Claim("steady", "main", 50), submitter});
  } catch (const util::SubmissionExists& e) {
    exists = e.Existing() == old.id && e.Status() == RecordStatus::kApproved;
  }
  assert(exists);
  assert(env.RecordCount() == 1);
}

void TestRejectedRecordBlocksAnyProgress() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.8");
  const auto player    = env.AddPlayer("rejected");
  env.AddRecord(player.id, "main", 55, RecordStatus::kRejected, submitter.id);

  bool exists = false;
  try {
    env.executor.Execute(ProcessSubmission{Claim("rejected", "main", 100), submitter});
  } catch (const util::SubmissionExists& e) {
    exists = e.Status() == RecordStatus::kRejected;
  }
  assert(exists);
}

void TestSameVideoMatchesAcrossPlayers() {
  TestEnv    env;
  SeedDemons(env);
  const auto submitter = env.AddSubmitter("203.0.113.9");
  const auto owner     = env.AddPlayer("owner");
  env.AddRecord(owner.id, "main", 90, RecordStatus::kApproved, submitter.id, std::string("https://youtu.be/same"));

  auto stolen  = Claim("thief", "main", 80);
  stolen.video = "https://youtu.be/same";
  assert(Throws<util::SubmissionExists>([&] { env.executor.Execute(ProcessSubmission{stolen, submitter}); }));
}

void TestLookupsAndDelete() {
  TestEnv env;
  SeedDemons(env);

  const auto first  = env.executor.Execute(SubmitterByIp{"203.0.113.10"});
  const auto second = env.executor.Execute(SubmitterByIp{"203.0.113.10"});
  assert(first.id == second.id);

  const auto player = env.executor.Execute(PlayerByName{"created"});
  assert(env.executor.Execute(PlayerByName{"created"}).id == player.id);

  const auto record = env.AddRecord(player.id, "main", 60, RecordStatus::kSubmitted, first.id);

  const auto helper = env.AddUser("helper", PermissionSet{Permission::kListHelper});
  assert(Throws<util::MissingPermissions>(
      [&] { env.executor.Execute(DeleteRecordById{RequestData::External("203.0.113.11").WithUser(helper), record.id}); }));

  env.executor.Execute(DeleteRecordById{RequestData::Internal(), record.id});
  assert(!env.Record(record.id).has_value());
  assert(Throws<util::ModelNotFound>([&] { env.executor.Execute(DeleteRecordById{RequestData::Internal(), record.id}); }));
}

} // namespace

int main() {
  TestBannedSubmitterStopsBeforeAnyLookup();
  TestResolutionAndVideoOrder();
  TestListBoundaries();
  TestVerifyOnlyNeverWrites();
  TestSubmittedRecordIsReplaced();
  TestApprovedRecordIsKept();
  TestNoImprovementIsRejected();
  TestRejectedRecordBlocksAnyProgress();
  TestSameVideoMatchesAcrossPlayers();
  TestLookupsAndDelete();

  std::cout << "demonlist_unit_submission: pass\n";
  return 0;
}
