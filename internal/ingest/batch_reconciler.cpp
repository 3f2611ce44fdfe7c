#include "batch_reconciler.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace liveviewer::ingest {

using liveviewer::model::ParticipantKind;
using observability::IntField;
using observability::StringField;

BatchReconciler::BatchReconciler(ParticipantKind kind, std::string session_id, std::shared_ptr<db::Repository> repo,
                                 IdentityCache& identities, SightingQueue& queue, ExistingPartition existing,
                                 const RunContext& ctx, ReconcilerOptions options)
    : kind_(kind),
      session_id_(std::move(session_id)),
      repo_(std::move(repo)),
      identities_(identities),
      queue_(queue),
      index_(std::move(existing)),
      ctx_(ctx),
      options_(options) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

ReconcileResult BatchReconciler::Reconcile() {
  ReconcileResult result;
  result.kind = kind_;

  while (auto sighting = queue_.Pop()) {
    ++result.processed;
    try {
      Apply(*sighting, result);
    } catch (const std::exception& e) {
      ++result.errors;
      LIVEVIEWER_LOG_WARN("skipping participant", {StringField("kind", liveviewer::model::ToString(kind_)),
                                                   StringField("participant", sighting->participant_id),
                                                   StringField("error", e.what())});
      continue;
    }

    if (pending_creates_.size() >= options_.batch_size && !FlushCreates(result)) return result;
    if (pending_updates_.size() >= options_.batch_size && !FlushUpdates(result)) return result;
  }

  if (ctx_.Cancelled()) {
    Fail(result, ctx_.Expired() ? "run deadline exceeded" : "run cancelled");
    return result;
  }

  if (!FlushCreates(result)) return result;
  if (!FlushUpdates(result)) return result;

  LIVEVIEWER_LOG_INFO("reconciliation finished",
                      {StringField("session", session_id_), StringField("kind", liveviewer::model::ToString(kind_)),
                       IntField("processed", static_cast<int64_t>(result.processed)),
                       IntField("created", static_cast<int64_t>(result.created)),
                       IntField("updated", static_cast<int64_t>(result.updated)),
                       IntField("errors", static_cast<int64_t>(result.errors)),
                       IntField("unresolved", static_cast<int64_t>(result.unresolved.size()))});
  return result;
}

void BatchReconciler::Apply(const platform::ParticipantSighting& s, ReconcileResult& result) {
  if (s.kind != kind_) {
    throw std::runtime_error("sighting of kind " + std::string(liveviewer::model::ToString(s.kind)) +
                             " on the " + std::string(liveviewer::model::ToString(kind_)) + " queue");
  }

  if (auto it = pending_creates_.find(s.participant_id); it != pending_creates_.end()) {
    MergeInto(it->second, s, result);
    return;
  }

  if (auto it = index_.find(s.participant_id); it != index_.end()) {
    MergeInto(it->second, s, result);
    if (update_marked_.insert(s.participant_id).second) pending_updates_.push_back(s.participant_id);
    return;
  }

  db::model::ViewerRecord row;
  row.session_id     = session_id_;
  row.participant_id = s.participant_id;
  row.kind           = kind_;
  row.display_name   = s.participant_id;
  MergeInto(row, s, result);

  create_order_.push_back(s.participant_id);
  pending_creates_.emplace(s.participant_id, std::move(row));
}

void BatchReconciler::MergeInto(db::model::ViewerRecord& row, const platform::ParticipantSighting& s,
                                ReconcileResult& result) {
  row.watch_seconds    = s.watch_seconds;
  row.watch_percentage = WatchPercentage(s.watch_seconds);
  row.commented        = s.commented;
  row.used_mic         = s.used_mic;
  row.comment_count    = s.comment_count;
  row.mic_seconds      = s.mic_seconds;
  if (!s.display_name.empty()) row.display_name = s.display_name;

  // attendance window only widens
  if (s.first_enter_time_ms && (!row.first_enter_time_ms || *s.first_enter_time_ms < *row.first_enter_time_ms)) {
    row.first_enter_time_ms = s.first_enter_time_ms;
  }
  if (s.last_leave_time_ms && (!row.last_leave_time_ms || *s.last_leave_time_ms > *row.last_leave_time_ms)) {
    row.last_leave_time_ms = s.last_leave_time_ms;
  }

  if (!s.inviter_id) return;

  const auto inviter_kind = s.inviter_kind.value_or(kind_);
  const auto resolution   = identities_.Resolve(*s.inviter_id);

  row.inviter_id      = s.inviter_id;
  row.inviter_kind    = inviter_kind;
  row.inviter_name    = resolution.name;
  row.invited_by_host = identities_.IsHost(*s.inviter_id);

  const auto key = row.Key().ToString();
  if (resolution.found) {
    result.unresolved.erase(key);
  } else {
    result.unresolved[key] = UnresolvedInvitation{row.Key(), *s.inviter_id, inviter_kind};
  }
}

bool BatchReconciler::FlushCreates(ReconcileResult& result) {
  if (pending_creates_.empty()) return true;

  std::vector<db::model::ViewerRecord> batch;
  batch.reserve(create_order_.size());
  for (const auto& id : create_order_) batch.push_back(pending_creates_.at(id));

  try {
    auto tx = repo_->Begin();
    auto r  = repo_->InsertViewers(*tx, batch);
    if (!r) {
      tx->Rollback();
      Fail(result, std::string("insert viewers: ") + db::ToString(r.code) + ": " + r.message);
      return false;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    Fail(result, std::string("insert viewers: ") + e.what());
    return false;
  }

  result.created += batch.size();
  for (auto& row : batch) {
    auto id = row.participant_id;
    index_[id] = std::move(row);
  }
  pending_creates_.clear();
  create_order_.clear();
  return true;
}

bool BatchReconciler::FlushUpdates(ReconcileResult& result) {
  if (pending_updates_.empty()) return true;

  std::vector<db::model::ViewerRecord> batch;
  batch.reserve(pending_updates_.size());
  for (const auto& id : pending_updates_) batch.push_back(index_.at(id));

  try {
    auto tx = repo_->Begin();
    auto r  = repo_->UpdateViewers(*tx, batch);
    if (!r) {
      tx->Rollback();
      Fail(result, std::string("update viewers: ") + db::ToString(r.code) + ": " + r.message);
      return false;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    Fail(result, std::string("update viewers: ") + e.what());
    return false;
  }

  result.updated += batch.size();
  pending_updates_.clear();
  update_marked_.clear();
  return true;
}

void BatchReconciler::Fail(ReconcileResult& result, const std::string& error) {
  result.failed = true;
  result.error  = error;
  queue_.Abandon();
  LIVEVIEWER_LOG_ERROR("reconciler aborted", {StringField("session", session_id_),
                                              StringField("kind", liveviewer::model::ToString(kind_)),
                                              StringField("error", error)});
}

double BatchReconciler::WatchPercentage(int64_t watch_seconds) const {
  if (options_.session_duration <= 0) return 0.0;
  return static_cast<double>(watch_seconds) / static_cast<double>(options_.session_duration) * 100.0;
}

} // namespace liveviewer::ingest
