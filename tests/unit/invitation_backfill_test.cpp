#include "internal/ingest/invitation_backfill.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace liveviewer::ingest;
using liveviewer::db::memory::MemoryRepository;
using liveviewer::db::model::ViewerRecord;
using liveviewer::model::ParticipantKind;
using liveviewer::testing::Find;
using liveviewer::testing::SeedSession;
using liveviewer::testing::Viewers;

ViewerRecord Row(const std::string& session, const std::string& pid, const std::string& name,
                 const std::string& inviter = "") {
  ViewerRecord v;
  v.session_id     = session;
  v.participant_id = pid;
  v.display_name   = name;
  if (!inviter.empty()) {
    v.inviter_id   = inviter;
    v.inviter_kind = ParticipantKind::kInternal;
    v.inviter_name = inviter;
  }
  return v;
}

void Insert(MemoryRepository& repo, std::vector<ViewerRecord> rows) {
  auto tx = repo.Begin();
  assert(repo.InsertViewers(*tx, rows));
  tx->Commit();
}

void Mark(UnresolvedInvitations& out, const std::string& session, const std::string& pid, const std::string& inviter) {
  UnresolvedInvitation u;
  u.viewer       = {session, ParticipantKind::kInternal, pid};
  u.inviter_id   = inviter;
  u.inviter_kind = ParticipantKind::kInternal;
  out[u.viewer.ToString()] = u;
}

void TestNamesComeFromEverySource() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedSession(*repo, "s1");
  SeedSession(*repo, "s0");

  Insert(*repo, {Row("s0", "u9", "Old Timer")});
  Insert(*repo, {Row("s1", "u1", "Alice", "u2"), Row("s1", "u2", "Bob"), Row("s1", "u3", "Carl", "c1"),
                 Row("s1", "u4", "Dora", "u9"), Row("s1", "u5", "Eve", "ghost"), Row("s1", "u6", "Finn", "host1")});
  {
    auto tx = repo->Begin();
    assert(repo->UpsertInviterNames(*tx, {{"c1", "Cached Name", 0}}));
    tx->Commit();
  }

  UnresolvedInvitations unresolved;
  Mark(unresolved, "s1", "u1", "u2");
  Mark(unresolved, "s1", "u3", "c1");
  Mark(unresolved, "s1", "u4", "u9");
  Mark(unresolved, "s1", "u5", "ghost");
  Mark(unresolved, "s1", "u6", "host1");

  IdentityCache identities("host1", "Host One", nullptr);
  const auto    updated = InvitationBackfill(repo, identities, "s1").Backfill(unresolved);
  assert(updated == 4);

  const auto rows = Viewers(*repo, "s1");
  assert(Find(rows, ParticipantKind::kInternal, "u1")->inviter_name == "Bob");
  assert(Find(rows, ParticipantKind::kInternal, "u3")->inviter_name == "Cached Name");
  assert(Find(rows, ParticipantKind::kInternal, "u4")->inviter_name == "Old Timer");
  // unnamed inviters keep the raw id
  assert(Find(rows, ParticipantKind::kInternal, "u5")->inviter_name == "ghost");

  const auto* u6 = Find(rows, ParticipantKind::kInternal, "u6");
  assert(u6->inviter_name == "Host One");
  assert(u6->invited_by_host);
}

void TestSessionNameBeatsCache() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedSession(*repo, "s1");
  Insert(*repo, {Row("s1", "u1", "Alice", "u2"), Row("s1", "u2", "Bob (this session)")});
  {
    auto tx = repo->Begin();
    assert(repo->UpsertInviterNames(*tx, {{"u2", "Bob (cache)", 0}}));
    tx->Commit();
  }

  UnresolvedInvitations unresolved;
  Mark(unresolved, "s1", "u1", "u2");

  IdentityCache identities("host1", "Host One", nullptr);
  assert(InvitationBackfill(repo, identities, "s1").Backfill(unresolved) == 1);
  assert(Find(Viewers(*repo, "s1"), ParticipantKind::kInternal, "u1")->inviter_name == "Bob (this session)");
}

void TestLargeBackfillSpansChunks() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedSession(*repo, "s1");

  const std::size_t         n = kBackfillChunkRows + 25;
  std::vector<ViewerRecord> rows{Row("s1", "inv", "Inviter")};
  UnresolvedInvitations     unresolved;
  for (std::size_t i = 0; i < n; ++i) {
    const auto pid = "u" + std::to_string(i);
    rows.push_back(Row("s1", pid, pid, "inv"));
    Mark(unresolved, "s1", pid, "inv");
  }
  Insert(*repo, rows);

  IdentityCache identities("host1", "Host One", nullptr);
  assert(InvitationBackfill(repo, identities, "s1").Backfill(unresolved) == n);

  for (const auto& row : Viewers(*repo, "s1")) {
    if (row.participant_id != "inv") assert(row.inviter_name == "Inviter");
  }
}

void TestEmptyInputTouchesNothing() {
  auto          repo = std::make_shared<MemoryRepository>();
  IdentityCache identities("host1", "Host One", nullptr);
  assert(InvitationBackfill(repo, identities, "s1").Backfill({}) == 0);
}

} // namespace

int main() {
  TestNamesComeFromEverySource();
  TestSessionNameBeatsCache();
  TestLargeBackfillSpansChunks();
  TestEmptyInputTouchesNothing();

  std::cout << "liveviewer_unit_invitation_backfill: pass\n";
  return 0;
}
