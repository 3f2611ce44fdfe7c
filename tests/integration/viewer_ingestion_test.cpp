#include "internal/ingest/viewer_ingestion.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_platform_api.hpp"
#include "support/faulty_repository.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace liveviewer::ingest;
using liveviewer::db::memory::MemoryRepository;
using liveviewer::model::ParticipantKind;
using liveviewer::testing::External;
using liveviewer::testing::FakePlatformApi;
using liveviewer::testing::FaultyRepository;
using liveviewer::testing::Find;
using liveviewer::testing::SeedSession;
using liveviewer::testing::User;
using liveviewer::testing::Viewers;

IngestionOptions FastOptions() {
  IngestionOptions options;
  options.queue_capacity    = 4;
  options.batch_size        = 2;
  options.pause_every_pages = 0;
  options.page_pause        = std::chrono::milliseconds(0);
  return options;
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakePlatformApi>  api  = std::make_shared<FakePlatformApi>();
  ViewerIngestion                   ingestion{repo, api, FastOptions()};

  Fixture() {
    SeedSession(*repo, "s1");
  }
};

void TestLaterPageOverwritesEarlierSighting() {
  Fixture f;
  f.api->AddPage("s1", {User("u1", "Alice", 120), User("u2", "Bob", 30)}, {External("wm1", "Carol@微信", 60)});
  f.api->AddPage("s1", {User("u1", "Alice", 400)});

  const auto outcome = f.ingestion.ProcessViewerInfo("s1");
  assert(outcome.success);
  assert(!outcome.partial);
  assert(outcome.collection.pages == 2);

  const auto rows = Viewers(*f.repo, "s1");
  assert(rows.size() == 3);
  const auto* u1 = Find(rows, ParticipantKind::kInternal, "u1");
  assert(u1->watch_seconds == 400);
  assert(Find(rows, ParticipantKind::kExternal, "wm1")->display_name == "Carol");

  assert(outcome.stats.total_viewers == 3);
  assert(outcome.stats.internal_viewers == 2);
  assert(outcome.stats.external_viewers == 1);
  assert(outcome.stats.total_watch_seconds == 490);
  assert(outcome.stats.success_count == 4);
  assert(outcome.stats.error_count == 0);
  assert(outcome.stats.last_sync_time_ms > 0);
}

void TestReingestionUpdatesInsteadOfDuplicating() {
  Fixture f;
  f.api->AddPage("s1", {User("u1", "Alice", 120), User("u2", "Bob", 30)}, {External("wm1", "Carol", 60)});

  auto first = f.ingestion.ProcessViewerInfo("s1");
  assert(first.success);
  const auto before = Viewers(*f.repo, "s1");

  auto second = f.ingestion.ProcessViewerInfo("s1");
  assert(second.success);
  assert(second.internal.created == 0 && second.internal.updated == 2);
  assert(second.external.created == 0 && second.external.updated == 1);

  const auto after = Viewers(*f.repo, "s1");
  assert(after.size() == before.size());
  for (const auto& row : before) {
    assert(Find(after, row.kind, row.participant_id)->id == row.id);
  }
}

void TestAttendanceWindowWidensAcrossPages() {
  Fixture f;
  auto first = User("u1", "Alice", 120);
  first.set_first_enter_time(1700000300);
  first.set_last_leave_time(1700000400);
  first.set_comment_count(1);
  auto again = User("u1", "Alice", 400);
  again.set_first_enter_time(1700000100);
  again.set_last_leave_time(1700000350);
  again.set_comment_count(2);
  again.set_mic_duration(30);
  f.api->AddPage("s1", {first});
  f.api->AddPage("s1", {again});

  assert(f.ingestion.ProcessViewerInfo("s1").success);
  const auto  rows = Viewers(*f.repo, "s1");
  const auto* u1   = Find(rows, ParticipantKind::kInternal, "u1");
  assert(u1->first_enter_time_ms == 1700000100000u);
  assert(u1->last_leave_time_ms == 1700000400000u);
  assert(u1->comment_count == 2);
  assert(u1->mic_seconds == 30);
}

void TestHostInviterNeedsNoLookup() {
  Fixture f;
  f.api->AddPage("s1", {User("u1", "Alice", 10, "host1")}, {External("wm1", "Carol", 10, "", "host1")});

  assert(f.ingestion.ProcessViewerInfo("s1").success);

  const auto rows = Viewers(*f.repo, "s1");
  for (const auto* row : {Find(rows, ParticipantKind::kInternal, "u1"), Find(rows, ParticipantKind::kExternal, "wm1")}) {
    assert(row->invited_by_host);
    assert(row->inviter_name == "Host One");
  }
  assert(f.api->UserLookups() == 0);
  assert(f.api->ContactLookups() == 0);
}

void TestPartialCollectionKeepsFirstPage() {
  Fixture f;
  f.api->AddPage("s1", {User("u1", "Alice", 10), User("u2", "Bob", 20)});
  f.api->AddPage("s1", {User("u3", "Carl", 30)});
  f.api->AddPage("s1", {User("u4", "Dora", 40)});
  f.api->FailPage("s1", 2);

  const auto outcome = f.ingestion.ProcessViewerInfo("s1");
  assert(outcome.success);
  assert(outcome.partial);
  assert(outcome.internal.processed == 2);
  assert(Viewers(*f.repo, "s1").size() == 2);
  assert(!outcome.stats.last_error.empty());
  assert(f.ingestion.LastStats().last_error == outcome.stats.last_error);
}

void TestFirstPageFailureFailsRun() {
  Fixture f;
  f.api->AddPage("s1", {User("u1", "Alice", 10)});
  f.api->BreakPage("s1", 1);

  const auto outcome = f.ingestion.ProcessViewerInfo("s1");
  assert(!outcome.success);
  assert(outcome.message.find("statistics collection failed") != std::string::npos);
  assert(Viewers(*f.repo, "s1").empty());
}

void TestUnknownSessionIsReported() {
  Fixture    f;
  const auto outcome = f.ingestion.ProcessViewerInfo("nope");
  assert(!outcome.success);
  assert(outcome.message.find("not found") != std::string::npos);
  assert(f.api->PageRequests() == 0);
  assert(f.ingestion.LastStats().last_error_time_ms > 0);
}

void TestRemoteNamesAreCachedAcrossRuns() {
  Fixture f;
  f.api->SetUser("u-remote", "Remy");
  f.api->AddPage("s1", {User("u1", "Alice", 10, "u-remote")});

  assert(f.ingestion.ProcessViewerInfo("s1").success);
  assert(Find(Viewers(*f.repo, "s1"), ParticipantKind::kInternal, "u1")->inviter_name == "Remy");
  assert(f.api->LookupsFor("u-remote") == 1);

  {
    auto tx      = f.repo->Begin();
    auto cached  = f.repo->FindInviterNames(*tx, {"u-remote"});
    tx->Commit();
    assert(cached.at("u-remote") == "Remy");
  }

  // a new session served from the cache
  SeedSession(*f.repo, "s2");
  f.api->AddPage("s2", {User("u7", "Gus", 10, "u-remote")});
  ViewerIngestion fresh(f.repo, f.api, FastOptions());
  assert(fresh.ProcessViewerInfo("s2").success);
  assert(Find(Viewers(*f.repo, "s2"), ParticipantKind::kInternal, "u7")->inviter_name == "Remy");
  assert(f.api->LookupsFor("u-remote") == 1);
}

void TestInviterSeenOnLaterPageIsBackfilled() {
  Fixture f;
  f.api->AddPage("s1", {User("u1", "Alice", 10, "u5")});
  f.api->AddPage("s1", {User("u5", "Uma", 10)});

  const auto outcome = f.ingestion.ProcessViewerInfo("s1");
  assert(outcome.success);
  const auto rows = Viewers(*f.repo, "s1");
  assert(Find(rows, ParticipantKind::kInternal, "u1")->inviter_name == "Uma");
  assert(!Find(rows, ParticipantKind::kInternal, "u1")->invited_by_host);
}

// Both reconcilers meet the same unknown inviter while one remote lookup is in flight.
void TestSharedInviterBehindSlowLookupIsNamedForBothKinds() {
  for (int attempt = 0; attempt < 3; ++attempt) {
    Fixture f;
    f.api->SetUser("boss", "Remy");
    f.api->SetLookupDelay(std::chrono::milliseconds(300));
    f.api->AddPage("s1", {User("u1", "Alice", 10, "boss")}, {External("wm1", "Carol", 10, "", "boss")});

    const auto outcome = f.ingestion.ProcessViewerInfo("s1");
    assert(outcome.success);

    const auto rows = Viewers(*f.repo, "s1");
    assert(Find(rows, ParticipantKind::kInternal, "u1")->inviter_name == "Remy");
    assert(Find(rows, ParticipantKind::kExternal, "wm1")->inviter_name == "Remy");
    assert(f.api->LookupsFor("boss") == 1);

    auto tx     = f.repo->Begin();
    auto cached = f.repo->FindInviterNames(*tx, {"boss"});
    tx->Commit();
    assert(cached.at("boss") == "Remy");
  }
}

void TestFailedReconcilerLeavesOtherKindBackfilled() {
  auto store = std::make_shared<MemoryRepository>();
  SeedSession(*store, "s1");
  auto repo = std::make_shared<FaultyRepository>(store);
  repo->FailInserts(ParticipantKind::kExternal);

  auto api = std::make_shared<FakePlatformApi>();
  api->AddPage("s1", {User("u1", "Alice", 10, "u5")}, {External("wm1", "Carol", 10)});
  api->AddPage("s1", {User("u5", "Uma", 10)});

  // u1 is reconciled well before the page naming u5 arrives
  auto options              = FastOptions();
  options.pause_every_pages = 1;
  options.page_pause        = std::chrono::milliseconds(200);

  ViewerIngestion ingestion(repo, api, options);
  const auto      outcome = ingestion.ProcessViewerInfo("s1");
  assert(!outcome.success);
  assert(outcome.external.failed);
  assert(!outcome.internal.failed);
  assert(outcome.backfilled == 1);

  const auto rows = Viewers(*store, "s1");
  assert(rows.size() == 2);
  assert(Find(rows, ParticipantKind::kExternal, "wm1") == nullptr);
  assert(Find(rows, ParticipantKind::kInternal, "u1")->inviter_name == "Uma");
}

void TestDeadlineStopsRun() {
  auto repo = std::make_shared<MemoryRepository>();
  auto api  = std::make_shared<FakePlatformApi>();
  SeedSession(*repo, "s1");
  for (int i = 0; i < 3; ++i) api->AddPage("s1", {User("u" + std::to_string(i), "n", 1)});

  auto options              = FastOptions();
  options.batch_size        = 1000;
  options.pause_every_pages = 1;
  options.page_pause        = std::chrono::milliseconds(300);
  options.run_timeout       = std::chrono::milliseconds(50);

  ViewerIngestion ingestion(repo, api, options);
  const auto      outcome = ingestion.ProcessViewerInfo("s1");
  assert(!outcome.success);
  assert(outcome.collection.cancelled);
  assert(outcome.message.find("deadline") != std::string::npos);
  assert(Viewers(*repo, "s1").empty());
}

void TestSignSync() {
  Fixture f;
  f.api->AddPage("s1", {User("u1", "Alice", 10), User("u2", "Bob", 20), User("u3", "Carl", 30)});
  assert(f.ingestion.ProcessViewerInfo("s1").success);

  auto       rows = Viewers(*f.repo, "s1");
  const auto u1   = *Find(rows, ParticipantKind::kInternal, "u1");
  const auto u2   = *Find(rows, ParticipantKind::kInternal, "u2");
  {
    std::vector<liveviewer::db::model::SignRecord> signs;
    for (uint64_t t : {1000, 5000}) {
      liveviewer::db::model::SignRecord r;
      r.session_id       = "s1";
      r.viewer_record_id = u1.id;
      r.sign_time_ms     = t;
      signs.push_back(r);
    }
    auto tx = f.repo->Begin();
    assert(f.repo->InsertSignRecords(*tx, signs));
    // stale summary with no backing records
    assert(f.repo->UpdateSignSummaries(*tx, {{u2.id, true, 42, 1}}));
    tx->Commit();
  }

  const auto result = f.ingestion.SyncSignInfo("s1");
  assert(result.success);
  assert(result.updated == 2);

  rows            = Viewers(*f.repo, "s1");
  const auto* s1  = Find(rows, ParticipantKind::kInternal, "u1");
  const auto* s2  = Find(rows, ParticipantKind::kInternal, "u2");
  assert(s1->signed_in && s1->sign_count == 2 && s1->last_sign_time_ms == 5000u);
  assert(!s2->signed_in && s2->sign_count == 0 && !s2->last_sign_time_ms);

  // nothing changed the second time
  assert(f.ingestion.SyncSignInfo("s1").updated == 0);
  assert(!f.ingestion.SyncSignInfo("nope").success);
}

void TestViewerStatistics() {
  Fixture f;
  auto    commenter = User("u1", "Alice", 1800, "host1");
  commenter.set_is_comment(1);
  commenter.set_comment_count(4);
  auto talker = External("wm1", "Carol", 900, "", "u1");
  talker.set_is_mic(1);
  talker.set_mic_duration(120);
  talker.set_comment_count(1);
  f.api->AddPage("s1", {commenter, User("u2", "Bob", 0)}, {talker});
  assert(f.ingestion.ProcessViewerInfo("s1").success);

  const auto s = f.ingestion.GetViewerStatistics("s1");
  assert(s.total_viewers == 3);
  assert(s.internal_viewers == 2 && s.external_viewers == 1);
  assert(s.total_watch_seconds == 2700);
  assert(s.average_watch_seconds == 900.0);
  assert(s.average_watch_percentage == 25.0);
  assert(s.comment_count == 1 && s.mic_count == 1);
  assert(s.total_comments == 5 && s.total_mic_seconds == 120);
  assert(s.signed_in_count == 0 && s.sign_rate == 0.0);
  assert(s.invited_count == 2);
  assert(s.invited_by_host_count == 1);

  bool threw = false;
  try {
    f.ingestion.GetViewerStatistics("nope");
  } catch (const liveviewer::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingPlatformIsReported() {
  auto repo = std::make_shared<MemoryRepository>();
  SeedSession(*repo, "s1");
  ViewerIngestion ingestion(repo, nullptr, FastOptions());

  const auto outcome = ingestion.ProcessViewerInfo("s1");
  assert(!outcome.success);
  assert(outcome.message.find("platform") != std::string::npos);
}

} // namespace

int main() {
  TestLaterPageOverwritesEarlierSighting();
  TestReingestionUpdatesInsteadOfDuplicating();
  TestAttendanceWindowWidensAcrossPages();
  TestHostInviterNeedsNoLookup();
  TestPartialCollectionKeepsFirstPage();
  TestFirstPageFailureFailsRun();
  TestUnknownSessionIsReported();
  TestRemoteNamesAreCachedAcrossRuns();
  TestInviterSeenOnLaterPageIsBackfilled();
  TestSharedInviterBehindSlowLookupIsNamedForBothKinds();
  TestFailedReconcilerLeavesOtherKindBackfilled();
  TestDeadlineStopsRun();
  TestSignSync();
  TestViewerStatistics();
  TestMissingPlatformIsReported();

  std::cout << "liveviewer_integration_viewer_ingestion: pass\n";
  return 0;
}
