#include <cassert>
#include <cmath>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/viewer_ingestion.hpp"
#include "internal/reward/reward_rule_engine.hpp"
#include "support/fake_platform_api.hpp"
#include "support/fixtures.hpp"

#if LIVEVIEWER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using liveviewer::db::ErrorCode;
using liveviewer::db::Repository;
using liveviewer::db::memory::MemoryRepository;
using liveviewer::db::model::RewardRecord;
using liveviewer::db::model::ViewerRecord;
using liveviewer::model::ParticipantKind;
using liveviewer::model::RewardRuleType;
using liveviewer::testing::Find;
using liveviewer::testing::SeedSession;
using liveviewer::testing::Viewers;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // raw SQL against the backing file; empty for stores without one
  std::function<void(const std::string&)> exec_sql;
};

ViewerRecord Row(const std::string& session, const std::string& pid, ParticipantKind kind = ParticipantKind::kInternal) {
  ViewerRecord v;
  v.session_id     = session;
  v.participant_id = pid;
  v.kind           = kind;
  v.display_name   = "name-" + pid;
  return v;
}

void VerifySessionRoundTrip(Repository& repo, const std::string& sid) {
  liveviewer::db::model::SessionRecord s;
  s.session_id       = sid;
  s.theme            = "quarterly review";
  s.host_id          = "host1";
  s.host_name        = "Host One";
  s.start_time_ms    = 1700000000000;
  s.duration_seconds = 5400;

  auto tx = repo.Begin();
  assert(repo.UpsertSession(*tx, s));
  assert(s.id > 0);
  const auto first_id = s.id;

  s.host_name = "Host Renamed";
  assert(repo.UpsertSession(*tx, s));
  assert(s.id == first_id);

  auto loaded = repo.GetSession(*tx, sid);
  assert(loaded.has_value());
  assert(loaded->host_name == "Host Renamed");
  assert(loaded->duration_seconds == 5400);
  assert(loaded->start_time_ms == 1700000000000u);
  assert(!repo.GetSession(*tx, sid + "-missing").has_value());
  tx->Commit();
}

void VerifyViewerReadWrite(Repository& repo, const std::string& sid) {
  std::vector rows{Row(sid, "u1"), Row(sid, "u1", ParticipantKind::kExternal), Row(sid, "u2")};
  rows[0].watch_seconds     = 120;
  rows[0].watch_percentage  = 12.5;
  rows[0].commented         = true;
  rows[0].inviter_id        = "wm9";
  rows[0].inviter_kind      = ParticipantKind::kExternal;
  rows[0].inviter_name      = "wm9";
  rows[0].last_sign_time_ms = 1234;
  rows[0].first_enter_time_ms = 1700000000000;
  rows[0].last_leave_time_ms  = 1700000600000;
  rows[0].comment_count       = 4;
  rows[0].mic_seconds         = 75;

  {
    auto tx = repo.Begin();
    assert(repo.InsertViewers(*tx, rows));
    tx->Commit();
  }
  for (const auto& r : rows) assert(r.id > 0);

  // duplicate key
  {
    std::vector dup{Row(sid, "u2")};
    auto        tx = repo.Begin();
    auto        r  = repo.InsertViewers(*tx, dup);
    assert(!r);
    assert(r.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  auto stored = Viewers(repo, sid);
  assert(stored.size() == 3);
  const auto* u1 = Find(stored, ParticipantKind::kInternal, "u1");
  assert(u1->id == rows[0].id);
  assert(u1->watch_seconds == 120);
  assert(u1->watch_percentage == 12.5);
  assert(u1->commented && !u1->used_mic);
  assert(u1->inviter_id == "wm9");
  assert(u1->inviter_kind == ParticipantKind::kExternal);
  assert(u1->last_sign_time_ms == 1234u);
  assert(u1->first_enter_time_ms == 1700000000000u && u1->last_leave_time_ms == 1700000600000u);
  assert(u1->comment_count == 4 && u1->mic_seconds == 75);
  assert(!Find(stored, ParticipantKind::kInternal, "u2")->inviter_id.has_value());
  assert(!Find(stored, ParticipantKind::kInternal, "u2")->first_enter_time_ms.has_value());

  // full-row update
  auto changed          = *u1;
  changed.watch_seconds = 900;
  changed.display_name  = "Alice";
  changed.inviter_id.reset();
  changed.inviter_kind.reset();
  changed.inviter_name.reset();
  changed.last_leave_time_ms.reset();
  changed.comment_count = 5;
  {
    auto tx = repo.Begin();
    assert(repo.UpdateViewers(*tx, {changed}));
    tx->Commit();
  }
  stored = Viewers(repo, sid);
  u1     = Find(stored, ParticipantKind::kInternal, "u1");
  assert(u1->watch_seconds == 900 && u1->display_name == "Alice");
  assert(!u1->inviter_id.has_value() && !u1->inviter_kind.has_value());
  assert(!u1->last_leave_time_ms.has_value() && u1->comment_count == 5);

  auto tx  = repo.Begin();
  auto ids = repo.FindViewerIds(*tx, {{sid, ParticipantKind::kInternal, "u1"},
                                      {sid, ParticipantKind::kExternal, "u1"},
                                      {sid, ParticipantKind::kExternal, "u2"}});
  assert(ids.size() == 2);
  assert(ids.at(rows[1].Key().ToString()) == rows[1].id);

  auto names = repo.FindParticipantNames(*tx, sid, {"u1", "u2", "zz"});
  assert(names.size() == 2);
  assert(names.at("u2") == "name-u2");

  assert(repo.FindAnyParticipantName(*tx, "u2") == "name-u2");
  assert(!repo.FindAnyParticipantName(*tx, "zz").has_value());

  assert(repo.UpdateInvitations(*tx, {{rows[2].id, "Host One", true}}));
  tx->Commit();

  stored = Viewers(repo, sid);
  assert(Find(stored, ParticipantKind::kInternal, "u2")->inviter_name == "Host One");
  assert(Find(stored, ParticipantKind::kInternal, "u2")->invited_by_host);

  tx = repo.Begin();
  assert(repo.ListViewersBySessions(*tx, {sid, sid + "-none"}).size() == 3);
  tx->Commit();
}

void VerifySignAggregation(Repository& repo, const std::string& sid) {
  std::vector rows{Row(sid, "u1"), Row(sid, "u2")};
  auto        tx = repo.Begin();
  assert(repo.InsertViewers(*tx, rows));

  std::vector<liveviewer::db::model::SignRecord> signs;
  for (uint64_t t : {100, 300, 200}) {
    liveviewer::db::model::SignRecord r;
    r.session_id       = sid;
    r.viewer_record_id = rows[0].id;
    r.sign_time_ms     = t;
    r.sign_type        = "manual";
    signs.push_back(r);
  }
  signs.back().valid = false;
  assert(repo.InsertSignRecords(*tx, signs));

  const auto agg = repo.AggregateSignRecords(*tx, {sid});
  assert(agg.size() == 1);
  assert(agg.at(rows[0].id).count == 2);
  assert(agg.at(rows[0].id).last_sign_time_ms == 300u);

  assert(repo.UpdateSignSummaries(*tx, {{rows[0].id, true, 300, 2}}));
  tx->Commit();

  const auto stored = Viewers(repo, sid);
  assert(Find(stored, ParticipantKind::kInternal, "u1")->signed_in);
  assert(Find(stored, ParticipantKind::kInternal, "u1")->sign_count == 2);
}

void VerifyRewardReplacement(Repository& repo, const std::string& sid) {
  std::vector rows{Row(sid, "u1"), Row(sid, "u2"), Row(sid, "u3")};
  {
    auto tx = repo.Begin();
    assert(repo.InsertViewers(*tx, rows));
    tx->Commit();
  }

  auto write_batch = [&](const std::string& batch, RewardRuleType type) {
    std::vector<RewardRecord> rewards;
    for (const auto& v : rows) {
      RewardRecord r;
      r.session_id           = sid;
      r.viewer_record_id     = v.id;
      r.rule_type            = type;
      r.rule_sign_count      = 1;
      r.rule_watch_seconds   = 60;
      r.rule_watch_count     = 2;
      r.calculation_batch_id = batch;
      r.eligible             = v.participant_id == "u1";
      r.reward_amount        = r.eligible ? 8.8 : 0.0;
      rewards.push_back(r);
    }
    auto tx = repo.Begin();
    assert(repo.DeleteRewardsBySessions(*tx, {sid}));
    assert(repo.InsertRewards(*tx, rewards));
    tx->Commit();
    for (const auto& r : rewards) assert(r.id > 0);
  };

  write_batch("B1", RewardRuleType::kSignAndWatch);
  write_batch("B2", RewardRuleType::kAllOf);

  auto tx     = repo.Begin();
  auto stored = repo.ListRewardsBySession(*tx, sid);
  assert(stored.size() == 3);
  for (const auto& r : stored) {
    assert(r.calculation_batch_id == "B2");
    assert(r.rule_type == RewardRuleType::kAllOf);
    assert(r.rule_watch_count == 2);
  }
  assert(repo.SampleRewardsBySession(*tx, sid, 2).size() == 2);

  assert(repo.UpdateRewardSummaries(*tx, {{rows[0].id, true, 8.8, "pending"}}));
  tx->Commit();

  const auto viewers = Viewers(repo, sid);
  const auto* u1     = Find(viewers, ParticipantKind::kInternal, "u1");
  assert(u1->reward_eligible && u1->reward_amount == 8.8 && u1->reward_status == "pending");
}

void VerifyInviterCache(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertInviterNames(*tx, {{"inv-a", "First", 0}, {"inv-b", "Bee", 0}}));
    assert(repo.UpsertInviterNames(*tx, {{"inv-a", "Second", 0}}));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto names = repo.FindInviterNames(*tx, {"inv-a", "inv-b", "inv-c"});
  assert(names.size() == 2);
  assert(names.at("inv-a") == "Second");
  assert(repo.ListInviterNames(*tx).size() >= 2);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& sid) {
  {
    std::vector rows{Row(sid, "u1")};
    auto        tx = repo.Begin();
    assert(repo.InsertViewers(*tx, rows));
    tx->Rollback();
  }
  {
    std::vector rows{Row(sid, "u2")};
    auto        tx = repo.Begin();
    assert(repo.InsertViewers(*tx, rows));
    // destructor rolls back
  }
  assert(Viewers(repo, sid).empty());
}

// Same run against every backend: ingestion, sign sync, then rewards.
void VerifyEndToEnd(std::shared_ptr<Repository> repo, const std::string& sid) {
  using namespace liveviewer::testing;

  SeedSession(*repo, sid, "host1", "Host One", 1000);

  auto api = std::make_shared<FakePlatformApi>();
  api->SetUser("u-remote", "Remy");
  std::vector<liveviewer::platform::wire::WatchStatUser> page1;
  for (int i = 0; i < 40; ++i) page1.push_back(User("u" + std::to_string(i), "User " + std::to_string(i), i * 10, "host1"));
  api->AddPage(sid, page1, {External("wm1", "Carol@微信", 700, "", "u-remote")});
  api->AddPage(sid, {User("u0", "User 0", 650)}, {External("wm2", "Dan", 50, "wm1")});

  liveviewer::ingest::IngestionOptions options;
  options.queue_capacity    = 8;
  options.batch_size        = 7;
  options.pause_every_pages = 0;

  liveviewer::ingest::ViewerIngestion ingestion(repo, api, options);
  const auto                          outcome = ingestion.ProcessViewerInfo(sid);
  assert(outcome.success);
  assert(outcome.stats.total_viewers == 42);
  assert(outcome.stats.internal_viewers == 40);

  auto rows = Viewers(*repo, sid);
  assert(Find(rows, ParticipantKind::kInternal, "u0")->watch_seconds == 650);
  assert(std::abs(Find(rows, ParticipantKind::kInternal, "u0")->watch_percentage - 65.0) < 1e-9);
  assert(Find(rows, ParticipantKind::kExternal, "wm1")->inviter_name == "Remy");
  assert(Find(rows, ParticipantKind::kExternal, "wm2")->inviter_name == "Carol");
  assert(Find(rows, ParticipantKind::kInternal, "u7")->invited_by_host);

  // second run is idempotent
  assert(ingestion.ProcessViewerInfo(sid).success);
  assert(Viewers(*repo, sid).size() == 42);

  const auto* u0 = Find(rows, ParticipantKind::kInternal, "u0");
  {
    std::vector<liveviewer::db::model::SignRecord> signs(1);
    signs[0].session_id       = sid;
    signs[0].viewer_record_id = u0->id;
    signs[0].sign_time_ms     = 42;
    auto tx = repo->Begin();
    assert(repo->InsertSignRecords(*tx, signs));
    tx->Commit();
  }
  assert(ingestion.SyncSignInfo(sid).updated == 1);

  liveviewer::reward::RewardRuleEngine engine(repo);
  liveviewer::reward::RewardRequest    request;
  request.sessions  = {{sid, 1, 600, 5.0}};
  request.rule_type = RewardRuleType::kSignAndWatch;
  request.batch_id  = "E2E";
  const auto rewards = engine.ComputeRewards(request);
  assert(rewards.success);
  assert(rewards.processed == 42);
  assert(rewards.eligible_count == 1);
  assert(rewards.total_amount == 5.0);

  const auto report = engine.CheckRuleConsistency(request.sessions, RewardRuleType::kSignAndWatch, 0, 2);
  assert(report.consistent);
}

// A reward row left behind with a rule type this build cannot decode.
void VerifyUndecodableRewardIsReported(BackendFactory& backend, std::shared_ptr<Repository> repo,
                                       const std::string& sid) {
  if (!backend.exec_sql) {
    return;
  }

  SeedSession(*repo, sid);
  {
    std::vector rows{Row(sid, "u1")};
    auto        tx = repo->Begin();
    assert(repo->InsertViewers(*tx, rows));
    tx->Commit();
  }

  liveviewer::reward::RewardRuleEngine engine(repo);
  liveviewer::reward::RewardRequest    request;
  request.sessions  = {{sid, 0, 0, 1.0}};
  request.rule_type = RewardRuleType::kAllOf;
  request.batch_id  = "LEGACY";
  assert(engine.ComputeRewards(request).success);

  backend.exec_sql("UPDATE live_reward_records SET rule_type='legacy' WHERE session_id='" + sid + "';");

  const auto report = engine.CheckRuleConsistency(request.sessions, RewardRuleType::kAllOf, 0, 2);
  assert(!report.consistent);
  assert(report.error.empty());
  assert(report.mismatches.size() == 1);
  assert(report.mismatches[0].session_id == sid);
  assert(report.mismatches[0].field == "rule_type");
  assert(report.mismatches[0].expected == "all-and");
  assert(report.mismatches[0].actual.find("legacy") != std::string::npos);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& sid) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  SeedSession(*repo, sid);
  {
    std::vector rows{Row(sid, "u1")};
    auto        tx = repo->Begin();
    assert(repo->InsertViewers(*tx, rows));
    assert(repo->UpsertInviterNames(*tx, {{"inv-durable", "Dora", 0}}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetSession(*tx, sid).has_value());
  assert(repo->ListViewersBySession(*tx, sid).size() == 1);
  assert(repo->FindInviterNames(*tx, {"inv-durable"}).at("inv-durable") == "Dora");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .exec_sql         = {},
  };
}

#if LIVEVIEWER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = liveviewer::testing::TempDbPath("parity");

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<liveviewer::db::sqlite::SqlitePool>(db_path, 4);
    {
      auto conn = pool->Acquire();
      liveviewer::db::sqlite::BootstrapSqliteSchema(*conn);
    }
    return std::make_shared<liveviewer::db::sqlite::SqliteRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix);
          },
      .exec_sql =
          [db_path](const std::string& sql) {
            liveviewer::db::sqlite::SqliteDB raw(db_path);
            raw.Exec(sql);
          },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifySessionRoundTrip(*repo, backend.name + "-session");
  VerifyViewerReadWrite(*repo, backend.name + "-viewers");
  VerifySignAggregation(*repo, backend.name + "-signs");
  VerifyRewardReplacement(*repo, backend.name + "-rewards");
  VerifyInviterCache(*repo);
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyEndToEnd(repo, backend.name + "-e2e");
  VerifyUndecodableRewardIsReported(backend, repo, backend.name + "-legacy");

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LIVEVIEWER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "liveviewer_integration_repository_parity: pass\n";
  return 0;
}
