#include "viewer_ingestion.hpp"

#include <stdexcept>
#include <utility>

#include "identity_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "invitation_backfill.hpp"
#include "worker_group.hpp"

namespace liveviewer::ingest {

using liveviewer::model::ParticipantKind;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

// A reconciler that dies unexpectedly must not leave the collector blocked on its queue.
void RunReconciler(BatchReconciler& reconciler, SightingQueue& queue, ReconcileResult& out) {
  try {
    out = reconciler.Reconcile();
  } catch (const std::exception&) {
    queue.Abandon();
    throw;
  }
}

void Merge(UnresolvedInvitations& dst, const UnresolvedInvitations& src) {
  for (const auto& [key, value] : src) dst.emplace(key, value);
}

} // namespace

ViewerIngestion::ViewerIngestion(std::shared_ptr<db::Repository> repo, std::shared_ptr<platform::LivePlatformApi> api,
                                 IngestionOptions options)
    : repo_(std::move(repo)), api_(std::move(api)), options_(options) {
}

IngestionOutcome ViewerIngestion::ProcessViewerInfo(const std::string& session_id) {
  std::lock_guard run_lock(run_mutex_);

  IngestionOutcome outcome;
  try {
    Run(session_id, outcome);
  } catch (const std::exception& e) {
    outcome.success = false;
    RecordError(outcome, e.what());
  }
  outcome.stats.last_sync_time_ms = util::NowMillis();

  {
    std::lock_guard lock(state_mutex_);
    if (outcome.stats.last_error.empty()) {
      outcome.stats.last_error         = last_stats_.last_error;
      outcome.stats.last_error_time_ms = last_stats_.last_error_time_ms;
    }
    last_stats_ = outcome.stats;
    current_.reset();
  }

  if (outcome.message.empty()) {
    outcome.message = outcome.partial ? "viewer data partially synchronized" : "viewer data synchronized";
  }

  const auto level = outcome.success ? spdlog::level::info : spdlog::level::err;
  observability::Log(level, "viewer ingestion finished",
                     {StringField("session", session_id), BoolField("success", outcome.success),
                      BoolField("partial", outcome.partial),
                      IntField("viewers", static_cast<int64_t>(outcome.stats.total_viewers)),
                      IntField("errors", static_cast<int64_t>(outcome.stats.error_count)),
                      StringField("message", outcome.message)});
  return outcome;
}

void ViewerIngestion::Run(const std::string& session_id, IngestionOutcome& outcome) {
  if (!api_) throw std::runtime_error("no live platform configured");

  auto ctx = options_.run_timeout.count() > 0 ? std::make_shared<RunContext>(options_.run_timeout)
                                              : std::make_shared<RunContext>();
  {
    std::lock_guard lock(state_mutex_);
    current_ = ctx;
  }

  // preload
  db::model::SessionRecord               session;
  std::vector<db::model::ViewerRecord>   existing;
  std::vector<db::model::InviterCacheRecord> inviters;
  {
    auto tx    = repo_->Begin();
    auto found = repo_->GetSession(*tx, session_id);
    if (!found) {
      tx->Rollback();
      throw util::NotFound("session " + session_id + " not found");
    }
    session  = *found;
    existing = repo_->ListViewersBySession(*tx, session_id);
    inviters = repo_->ListInviterNames(*tx);
    tx->Commit();
  }

  IdentityCache     identities(session.host_id, session.host_name, api_);
  ExistingPartition internal_rows;
  ExistingPartition external_rows;
  for (auto& row : existing) {
    if (row.display_name != row.participant_id) identities.PreloadLocal(row.participant_id, row.display_name);
    if (row.inviter_id && row.inviter_name && *row.inviter_name != *row.inviter_id) {
      identities.PreloadLocal(*row.inviter_id, *row.inviter_name);
    }
    auto& partition = row.kind == ParticipantKind::kInternal ? internal_rows : external_rows;
    auto  id        = row.participant_id;
    partition.emplace(std::move(id), std::move(row));
  }
  for (const auto& r : inviters) identities.PreloadLocal(r.inviter_id, r.name);

  LIVEVIEWER_LOG_INFO("viewer ingestion started",
                      {StringField("session", session_id),
                       IntField("existing_internal", static_cast<int64_t>(internal_rows.size())),
                       IntField("existing_external", static_cast<int64_t>(external_rows.size())),
                       IntField("cached_inviters", static_cast<int64_t>(inviters.size()))});

  SightingQueue internal_queue(options_.queue_capacity, ctx.get());
  SightingQueue external_queue(options_.queue_capacity, ctx.get());

  PaginatedCollector collector(api_, identities, internal_queue, external_queue, *ctx,
                               CollectorOptions{options_.pause_every_pages, options_.page_pause});

  const ReconcilerOptions reconciler_options{options_.batch_size, session.duration_seconds};
  BatchReconciler internal_reconciler(ParticipantKind::kInternal, session_id, repo_, identities, internal_queue,
                                      std::move(internal_rows), *ctx, reconciler_options);
  BatchReconciler external_reconciler(ParticipantKind::kExternal, session_id, repo_, identities, external_queue,
                                      std::move(external_rows), *ctx, reconciler_options);

  bool workers_ok       = true;
  bool collector_failed = false;
  {
    WorkerGroup workers;
    workers.Spawn("collector", [&] { outcome.collection = collector.Collect(session_id); });
    workers.Spawn("internal-reconciler",
                  [&] { RunReconciler(internal_reconciler, internal_queue, outcome.internal); });
    workers.Spawn("external-reconciler",
                  [&] { RunReconciler(external_reconciler, external_queue, outcome.external); });
    workers.JoinAll();

    for (const auto& failure : workers.Failures()) {
      workers_ok = false;
      if (failure.worker == "collector") collector_failed = true;
      RecordError(outcome, failure.worker + ": " + failure.message);
    }
  }

  outcome.partial = outcome.collection.partial;

  if (outcome.collection.fatal) {
    workers_ok = false;
    RecordError(outcome, "statistics collection failed: " + outcome.collection.last_error);
  } else if (outcome.collection.partial) {
    RecordError(outcome, "statistics collection incomplete: " + outcome.collection.last_error);
  }
  for (const auto* r : {&outcome.internal, &outcome.external}) {
    if (r->failed) {
      workers_ok = false;
      RecordError(outcome, std::string(liveviewer::model::ToString(r->kind)) + " reconciler: " + r->error);
    }
  }

  PersistRemoteNames(identities);

  // a failed reconciler only loses its own rows; the other one is still backfilled
  if (!outcome.collection.fatal && !collector_failed) {
    UnresolvedInvitations unresolved;
    for (const auto* r : {&outcome.internal, &outcome.external}) {
      if (!r->failed) Merge(unresolved, r->unresolved);
    }
    outcome.backfilled = InvitationBackfill(repo_, identities, session_id).Backfill(unresolved);
  }

  // statistics from what is stored, not from what streamed through
  std::vector<db::model::ViewerRecord> stored;
  {
    auto tx = repo_->Begin();
    stored  = repo_->ListViewersBySession(*tx, session_id);
    tx->Commit();
  }

  auto& stats         = outcome.stats;
  stats.total_viewers = stored.size();
  for (const auto& row : stored) {
    if (row.kind == ParticipantKind::kInternal) {
      ++stats.internal_viewers;
    } else {
      ++stats.external_viewers;
    }
    stats.total_watch_seconds += row.watch_seconds;
  }

  const auto processed = outcome.internal.processed + outcome.external.processed;
  const auto errors    = outcome.internal.errors + outcome.external.errors;
  stats.success_count  = processed - errors;
  stats.error_count    = errors + outcome.collection.malformed + outcome.collection.dropped;

  outcome.success = workers_ok;
  if (!workers_ok) outcome.message = stats.last_error;
}

void ViewerIngestion::PersistRemoteNames(const IdentityCache& identities) {
  const auto remote = identities.RemoteResolutions();
  if (remote.empty()) return;

  std::vector<db::model::InviterCacheRecord> records;
  records.reserve(remote.size());
  for (const auto& [id, name] : remote) records.push_back({id, name, 0});

  auto tx = repo_->Begin();
  auto r  = repo_->UpsertInviterNames(*tx, records);
  if (!r) {
    tx->Rollback();
    LIVEVIEWER_LOG_WARN("inviter cache write-back failed",
                        {StringField("code", db::ToString(r.code)), StringField("error", r.message)});
    return;
  }
  tx->Commit();
  LIVEVIEWER_LOG_DEBUG("inviter cache updated", {IntField("names", static_cast<int64_t>(records.size()))});
}

void ViewerIngestion::RecordError(IngestionOutcome& outcome, const std::string& error) {
  outcome.stats.last_error         = error;
  outcome.stats.last_error_time_ms = util::NowMillis();
  outcome.message                  = error;
}

SignSyncResult ViewerIngestion::SyncSignInfo(const std::string& session_id) {
  std::lock_guard run_lock(run_mutex_);

  SignSyncResult result;
  try {
    auto tx = repo_->Begin();
    if (!repo_->GetSession(*tx, session_id)) {
      tx->Rollback();
      result.message = "session " + session_id + " not found";
      return result;
    }

    const auto viewers    = repo_->ListViewersBySession(*tx, session_id);
    const auto aggregates = repo_->AggregateSignRecords(*tx, {session_id});

    std::vector<db::model::SignSummaryUpdate> updates;
    for (const auto& v : viewers) {
      db::model::SignSummaryUpdate u;
      u.viewer_id = v.id;
      if (auto it = aggregates.find(v.id); it != aggregates.end() && it->second.count > 0) {
        u.signed_in         = true;
        u.last_sign_time_ms = it->second.last_sign_time_ms;
        u.sign_count        = it->second.count;
      }
      // viewers without records are reset
      if (u.signed_in != v.signed_in || u.last_sign_time_ms != v.last_sign_time_ms || u.sign_count != v.sign_count) {
        updates.push_back(u);
      }
    }

    auto r = repo_->UpdateSignSummaries(*tx, updates);
    if (!r) {
      tx->Rollback();
      result.errors  = updates.size();
      result.message = std::string("sign sync: ") + db::ToString(r.code) + ": " + r.message;
      LIVEVIEWER_LOG_ERROR("sign sync failed", {StringField("session", session_id), StringField("error", result.message)});
      return result;
    }
    tx->Commit();

    result.success = true;
    result.updated = updates.size();
    result.message = "sign info synchronized";
  } catch (const std::exception& e) {
    result.success = false;
    result.message = e.what();
    LIVEVIEWER_LOG_ERROR("sign sync failed", {StringField("session", session_id), StringField("error", e.what())});
    return result;
  }

  LIVEVIEWER_LOG_INFO("sign sync finished",
                      {StringField("session", session_id), IntField("updated", static_cast<int64_t>(result.updated))});
  return result;
}

SessionViewerStatistics ViewerIngestion::GetViewerStatistics(const std::string& session_id) {
  std::vector<db::model::ViewerRecord> rows;
  {
    auto tx = repo_->Begin();
    if (!repo_->GetSession(*tx, session_id)) {
      tx->Rollback();
      throw util::NotFound("session " + session_id + " not found");
    }
    rows = repo_->ListViewersBySession(*tx, session_id);
    tx->Commit();
  }

  SessionViewerStatistics s;
  s.total_viewers = rows.size();

  double percentage_sum = 0.0;
  for (const auto& row : rows) {
    if (row.kind == ParticipantKind::kInternal) {
      ++s.internal_viewers;
    } else {
      ++s.external_viewers;
    }
    s.total_watch_seconds += row.watch_seconds;
    percentage_sum += row.watch_percentage;

    if (row.commented) ++s.comment_count;
    if (row.used_mic) ++s.mic_count;
    s.total_comments += row.comment_count;
    s.total_mic_seconds += row.mic_seconds;
    if (row.signed_in) ++s.signed_in_count;
    if (row.inviter_id) ++s.invited_count;
    if (row.invited_by_host) ++s.invited_by_host_count;
  }

  if (!rows.empty()) {
    const auto n               = static_cast<double>(rows.size());
    s.average_watch_seconds    = static_cast<double>(s.total_watch_seconds) / n;
    s.average_watch_percentage = percentage_sum / n;
    s.sign_rate                = static_cast<double>(s.signed_in_count) / n * 100.0;
  }
  return s;
}

ViewerStats ViewerIngestion::LastStats() const {
  std::lock_guard lock(state_mutex_);
  return last_stats_;
}

void ViewerIngestion::Cancel() {
  std::lock_guard lock(state_mutex_);
  if (current_) current_->Cancel();
}

} // namespace liveviewer::ingest
